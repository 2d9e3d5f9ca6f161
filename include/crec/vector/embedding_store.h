#pragma once

#include "crec/core/ids.h"
#include "crec/core/result.h"
#include "crec/vector/embedding_source.h"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace crec::vector {

// EmbeddingStore holds one dense vector per item in a packed row-major matrix.
//
// Invariants (established by build(), never violated afterwards):
// - every id appears exactly once; id → row is a bijection onto [0, size())
// - every row has exactly dim() floats, dim() > 0
// - the store is immutable after construction
class EmbeddingStore {
 public:
  // build normalizes any of the three source layouts. catalog_ids supplies the
  // positional ids for a BareMatrixSource and is ignored otherwise.
  // Fails (no partial store) on ragged rows, zero dimension, empty input, duplicate ids,
  // id/row count mismatch, or a bare matrix with more rows than catalog_ids.
  [[nodiscard]] static core::Result<EmbeddingStore, std::string> build(
      EmbeddingSource source, const std::vector<core::ItemId>& catalog_ids);

  // vector_of copies the row for item_id, or kNotFound.
  [[nodiscard]] core::Result<Vector, core::LookupError> vector_of(
      const core::ItemId& item_id) const;

  [[nodiscard]] std::optional<std::size_t> row_of(const core::ItemId& item_id) const;
  [[nodiscard]] const float* row_data(std::size_t row) const { return &vecs_[row * dim_]; }
  [[nodiscard]] const core::ItemId& id_at(std::size_t row) const { return ids_[row]; }
  [[nodiscard]] const std::vector<core::ItemId>& ids() const { return ids_; }

  [[nodiscard]] std::size_t size() const { return ids_.size(); }
  [[nodiscard]] std::size_t dim() const { return dim_; }
  [[nodiscard]] EmbeddingLayout source_layout() const { return layout_; }

 private:
  EmbeddingStore() = default;

  std::size_t dim_ = 0;
  EmbeddingLayout layout_ = EmbeddingLayout::kMapping;
  std::vector<core::ItemId> ids_;
  std::vector<float> vecs_;  // packed: size = size()*dim()
  std::unordered_map<core::ItemId, std::size_t, core::ItemIdHash> row_by_id_;
};

}  // namespace crec::vector
