#include "crec/vector/embedding_store.h"

#include <cmath>
#include <limits>
#include <utility>

namespace crec::vector {

namespace {

using BuildResult = core::Result<EmbeddingStore, std::string>;

// Appends one row to the packed buffer, fixing the dimension on the first row.
// Returns an error message for a ragged or empty row, "" on success.
std::string append_row(const Vector& row, std::size_t row_index, std::size_t& dim,
                       std::vector<float>& packed) {
  if (row.empty()) {
    return "embedding row " + std::to_string(row_index) + " is empty";
  }
  if (dim == 0) {
    dim = row.size();
  } else if (row.size() != dim) {
    return "embedding row " + std::to_string(row_index) + " has dimension " +
           std::to_string(row.size()) + ", expected " + std::to_string(dim);
  }
  packed.insert(packed.end(), row.begin(), row.end());
  return "";
}

// Returns an error message naming the first NaN or infinite component, "" otherwise.
std::string check_finite(const std::vector<float>& packed, std::size_t dim) {
  for (std::size_t i = 0; i < packed.size(); ++i) {
    if (!std::isfinite(packed[i])) {
      return "embedding row " + std::to_string(i / dim) + " column " +
             std::to_string(i % dim) + " is not a finite number";
    }
  }
  return "";
}

}  // namespace

BuildResult EmbeddingStore::build(EmbeddingSource source,
                                  const std::vector<core::ItemId>& catalog_ids) {
  EmbeddingStore store;
  store.layout_ = layout_of(source);

  if (auto* mapping = std::get_if<MappingSource>(&source)) {
    store.ids_.reserve(mapping->entries.size());
    for (std::size_t i = 0; i < mapping->entries.size(); ++i) {
      auto& [id, row] = mapping->entries[i];
      auto error = append_row(row, i, store.dim_, store.vecs_);
      if (!error.empty()) {
        return BuildResult::err(error);
      }
      store.ids_.push_back(id);
    }
  } else if (auto* paired = std::get_if<PairedSource>(&source)) {
    if (paired->ids.size() != paired->rows.size()) {
      return BuildResult::err("paired embeddings have " + std::to_string(paired->ids.size()) +
                              " ids but " + std::to_string(paired->rows.size()) + " rows");
    }
    for (std::size_t i = 0; i < paired->rows.size(); ++i) {
      auto error = append_row(paired->rows[i], i, store.dim_, store.vecs_);
      if (!error.empty()) {
        return BuildResult::err(error);
      }
    }
    store.ids_ = std::move(paired->ids);
  } else {
    auto& bare = std::get<BareMatrixSource>(source);
    if (bare.dim == 0 && bare.row_count > 0) {
      return BuildResult::err("embedding matrix has zero dimension");
    }
    if (bare.dim != 0 && bare.row_count > std::numeric_limits<std::size_t>::max() / bare.dim) {
      return BuildResult::err("embedding matrix shape " + std::to_string(bare.row_count) + "x" +
                              std::to_string(bare.dim) + " is too large");
    }
    if (bare.data.size() != bare.row_count * bare.dim) {
      return BuildResult::err("embedding matrix holds " + std::to_string(bare.data.size()) +
                              " values, expected " + std::to_string(bare.row_count) + "x" +
                              std::to_string(bare.dim));
    }
    if (bare.row_count > catalog_ids.size()) {
      return BuildResult::err("embedding matrix has " + std::to_string(bare.row_count) +
                              " rows but the catalog only has " +
                              std::to_string(catalog_ids.size()) +
                              " ids to assign positionally");
    }
    store.dim_ = bare.dim;
    store.vecs_ = std::move(bare.data);
    store.ids_.assign(catalog_ids.begin(),
                      catalog_ids.begin() + static_cast<std::ptrdiff_t>(bare.row_count));
  }

  if (store.ids_.empty()) {
    return BuildResult::err("embeddings artifact contains no vectors");
  }
  if (auto error = check_finite(store.vecs_, store.dim_); !error.empty()) {
    return BuildResult::err(error);
  }

  store.row_by_id_.reserve(store.ids_.size());
  for (std::size_t row = 0; row < store.ids_.size(); ++row) {
    auto [it, inserted] = store.row_by_id_.emplace(store.ids_[row], row);
    if (!inserted) {
      return BuildResult::err("duplicate embedding id " + core::to_string(store.ids_[row]) +
                              " at rows " + std::to_string(it->second) + " and " +
                              std::to_string(row));
    }
  }

  return BuildResult::ok(std::move(store));
}

core::Result<Vector, core::LookupError> EmbeddingStore::vector_of(
    const core::ItemId& item_id) const {
  auto row = row_of(item_id);
  if (!row.has_value()) {
    return core::Result<Vector, core::LookupError>::err(core::LookupError::kNotFound);
  }
  const float* begin = row_data(row.value());
  return core::Result<Vector, core::LookupError>::ok(Vector(begin, begin + dim_));
}

std::optional<std::size_t> EmbeddingStore::row_of(const core::ItemId& item_id) const {
  auto it = row_by_id_.find(item_id);
  if (it != row_by_id_.end()) {
    return it->second;
  }
  return std::nullopt;
}

}  // namespace crec::vector
