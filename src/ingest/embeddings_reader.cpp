#include "crec/ingest/embeddings_reader.h"

#include "crec/core/normalization.h"
#include "crec/ingest/csv_table.h"

#include <bit>
#include <cmath>
#include <cstring>
#include <exception>
#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <string_view>

namespace crec::ingest {

using json = nlohmann::ordered_json;

namespace {

// ────────────────────────────────────────────────────────────────
// JSON helpers
// ────────────────────────────────────────────────────────────────

bool is_number_row(const json& j) {
  if (!j.is_array()) {
    return false;
  }
  for (const auto& v : j) {
    if (!v.is_number()) {
      return false;
    }
  }
  return true;
}

bool is_id_list(const json& j) {
  if (!j.is_array()) {
    return false;
  }
  for (const auto& v : j) {
    if (!v.is_number_integer()) {
      return false;
    }
  }
  return true;
}

bool is_matrix(const json& j) {
  if (!j.is_array()) {
    return false;
  }
  for (const auto& row : j) {
    if (!is_number_row(row)) {
      return false;
    }
  }
  return true;
}

// Narrows one component to float. Values outside float range become infinity so the
// store rejects them with the row and column instead of converting out of range.
float narrow_component(double value) {
  if (std::isnan(value)) {
    return std::numeric_limits<float>::quiet_NaN();
  }
  if (std::abs(value) > static_cast<double>(std::numeric_limits<float>::max())) {
    return value < 0 ? -std::numeric_limits<float>::infinity()
                     : std::numeric_limits<float>::infinity();
  }
  return static_cast<float>(value);
}

vector::Vector to_vector(const json& row) {
  vector::Vector v;
  v.reserve(row.size());
  for (const auto& x : row) {
    v.push_back(narrow_component(x.get<double>()));
  }
  return v;
}

std::vector<vector::Vector> to_rows(const json& matrix) {
  std::vector<vector::Vector> rows;
  rows.reserve(matrix.size());
  for (const auto& row : matrix) {
    rows.push_back(to_vector(row));
  }
  return rows;
}

std::vector<core::ItemId> to_ids(const json& ids) {
  std::vector<core::ItemId> out;
  out.reserve(ids.size());
  for (const auto& id : ids) {
    out.push_back(core::ItemId{id.get<std::int64_t>()});
  }
  return out;
}

EmbeddingSourceResult paired_from(const json& ids, const json& matrix) {
  if (!is_id_list(ids)) {
    return EmbeddingSourceResult::err("paired embeddings: id list must contain only integers");
  }
  if (!is_matrix(matrix)) {
    return EmbeddingSourceResult::err(
        "paired embeddings: matrix must be an array of numeric arrays");
  }
  return EmbeddingSourceResult::ok(vector::PairedSource{to_ids(ids), to_rows(matrix)});
}

EmbeddingSourceResult mapping_from(const json& doc) {
  vector::MappingSource mapping;
  mapping.entries.reserve(doc.size());
  for (const auto& [key, row] : doc.items()) {
    const auto id = core::parse_int64(key);
    if (!id.has_value()) {
      return EmbeddingSourceResult::err("mapping embeddings: key '" + key +
                                        "' is not an integer item id");
    }
    if (!is_number_row(row)) {
      return EmbeddingSourceResult::err("mapping embeddings: value for id " + key +
                                        " is not a numeric array");
    }
    mapping.entries.emplace_back(core::ItemId{id.value()}, to_vector(row));
  }
  return EmbeddingSourceResult::ok(std::move(mapping));
}

// ────────────────────────────────────────────────────────────────
// NPY helpers
// ────────────────────────────────────────────────────────────────

struct NpyHeader {
  std::string descr;
  bool fortran_order{false};
  std::vector<std::size_t> shape;
};

// Returns the text following `'key':` in a NumPy header dict, or nullopt.
std::optional<std::string_view> dict_value(std::string_view header, std::string_view key) {
  const std::string quoted = "'" + std::string(key) + "'";
  auto pos = header.find(quoted);
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  pos = header.find(':', pos + quoted.size());
  if (pos == std::string_view::npos) {
    return std::nullopt;
  }
  auto value = header.substr(pos + 1);
  while (!value.empty() && value.front() == ' ') {
    value.remove_prefix(1);
  }
  return value;
}

std::optional<NpyHeader> parse_npy_header(std::string_view header) {
  NpyHeader out;

  auto descr = dict_value(header, "descr");
  if (!descr.has_value() || descr->empty() || descr->front() != '\'') {
    return std::nullopt;
  }
  const auto descr_end = descr->find('\'', 1);
  if (descr_end == std::string_view::npos) {
    return std::nullopt;
  }
  out.descr = std::string(descr->substr(1, descr_end - 1));

  auto fortran = dict_value(header, "fortran_order");
  if (!fortran.has_value()) {
    return std::nullopt;
  }
  out.fortran_order = fortran->substr(0, 4) == "True";

  auto shape = dict_value(header, "shape");
  if (!shape.has_value() || shape->empty() || shape->front() != '(') {
    return std::nullopt;
  }
  const auto close = shape->find(')');
  if (close == std::string_view::npos) {
    return std::nullopt;
  }
  std::string_view dims = shape->substr(1, close - 1);
  while (!dims.empty()) {
    const auto comma = dims.find(',');
    const auto token = core::trim(dims.substr(0, comma));
    if (!token.empty()) {
      const auto n = core::parse_int64(token);
      if (!n.has_value() || n.value() < 0) {
        return std::nullopt;
      }
      out.shape.push_back(static_cast<std::size_t>(n.value()));
    }
    if (comma == std::string_view::npos) {
      break;
    }
    dims.remove_prefix(comma + 1);
  }
  return out;
}

template <typename T>
T read_le(const uint8_t* p) {
  T value;
  std::memcpy(&value, p, sizeof(T));
  return value;
}

}  // namespace

EmbeddingSourceResult embedding_source_from_json(const json& doc) {
  if (doc.is_object()) {
    if (doc.contains("article_ids") && doc.contains("embeddings")) {
      return paired_from(doc.at("article_ids"), doc.at("embeddings"));
    }
    return mapping_from(doc);
  }

  if (doc.is_array()) {
    // A two-element [ids, matrix] pair is distinguishable from a bare matrix because
    // its second element is an array of arrays, never a row of numbers.
    if (doc.size() == 2 && doc[0].is_array() && doc[1].is_array() && !doc[1].empty() &&
        doc[1][0].is_array()) {
      return paired_from(doc[0], doc[1]);
    }
    if (!is_matrix(doc)) {
      return EmbeddingSourceResult::err(
          "unrecognized embeddings array: expected a matrix of numbers or an [ids, matrix] "
          "pair");
    }
    vector::BareMatrixSource bare;
    bare.row_count = doc.size();
    bare.dim = doc.empty() ? 0 : doc[0].size();
    bare.data.reserve(bare.row_count * bare.dim);
    for (std::size_t r = 0; r < doc.size(); ++r) {
      if (doc[r].size() != bare.dim) {
        return EmbeddingSourceResult::err("embedding row " + std::to_string(r) +
                                          " has dimension " + std::to_string(doc[r].size()) +
                                          ", expected " + std::to_string(bare.dim));
      }
      for (const auto& x : doc[r]) {
        bare.data.push_back(narrow_component(x.get<double>()));
      }
    }
    return EmbeddingSourceResult::ok(std::move(bare));
  }

  return EmbeddingSourceResult::err(std::string("unrecognized embeddings document of type ") +
                                    doc.type_name());
}

EmbeddingSourceResult read_embeddings_json(const std::string& path) {
  auto text = read_text_file(path);
  if (!text.has_value()) {
    return EmbeddingSourceResult::err("failed to open: " + path);
  }

  json doc;
  try {
    doc = json::parse(text.value());
  } catch (const json::parse_error& e) {
    return EmbeddingSourceResult::err(path + ": invalid JSON: " + e.what());
  }

  auto source = embedding_source_from_json(doc);
  if (!source.has_value()) {
    return EmbeddingSourceResult::err(path + ": " + source.error());
  }
  return source;
}

EmbeddingSourceResult embedding_source_from_npy(const std::vector<uint8_t>& bytes) {
  static constexpr char kMagic[] = "\x93NUMPY";
  static constexpr std::size_t kMagicLen = 6;

  if constexpr (std::endian::native != std::endian::little) {
    return EmbeddingSourceResult::err("npy decoding requires a little-endian host");
  }

  if (bytes.size() < kMagicLen + 4 || std::memcmp(bytes.data(), kMagic, kMagicLen) != 0) {
    return EmbeddingSourceResult::err("not a NumPy .npy file (bad magic)");
  }

  const uint8_t major = bytes[kMagicLen];
  std::size_t header_len = 0;
  std::size_t header_start = 0;
  if (major == 1) {
    header_len = read_le<uint16_t>(&bytes[kMagicLen + 2]);
    header_start = kMagicLen + 4;
  } else if (major == 2 || major == 3) {
    if (bytes.size() < kMagicLen + 6) {
      return EmbeddingSourceResult::err("truncated .npy header");
    }
    header_len = read_le<uint32_t>(&bytes[kMagicLen + 2]);
    header_start = kMagicLen + 6;
  } else {
    return EmbeddingSourceResult::err("unsupported .npy format version " +
                                      std::to_string(major));
  }
  if (bytes.size() < header_start + header_len) {
    return EmbeddingSourceResult::err("truncated .npy header");
  }

  const std::string_view header_text(reinterpret_cast<const char*>(&bytes[header_start]),
                                     header_len);
  const auto header = parse_npy_header(header_text);
  if (!header.has_value()) {
    return EmbeddingSourceResult::err("malformed .npy header: " + std::string(header_text));
  }
  if (header->fortran_order) {
    return EmbeddingSourceResult::err(".npy arrays in Fortran order are not supported");
  }
  if (header->shape.size() != 2) {
    return EmbeddingSourceResult::err(".npy embeddings must be two-dimensional, got " +
                                      std::to_string(header->shape.size()) + " dimensions");
  }

  std::size_t item_size = 0;
  if (header->descr == "<f4") {
    item_size = 4;
  } else if (header->descr == "<f8") {
    item_size = 8;
  } else {
    return EmbeddingSourceResult::err("unsupported .npy dtype '" + header->descr +
                                      "' (expected <f4 or <f8)");
  }

  vector::BareMatrixSource bare;
  bare.row_count = header->shape[0];
  bare.dim = header->shape[1];
  if (bare.dim != 0 &&
      bare.row_count > std::numeric_limits<std::size_t>::max() / bare.dim / item_size) {
    return EmbeddingSourceResult::err(".npy shape (" + std::to_string(bare.row_count) + ", " +
                                      std::to_string(bare.dim) + ") is too large");
  }
  const std::size_t count = bare.row_count * bare.dim;
  const std::size_t data_start = header_start + header_len;
  if (bytes.size() - data_start < count * item_size) {
    return EmbeddingSourceResult::err(".npy payload is shorter than its declared shape");
  }

  bare.data.resize(count);
  const uint8_t* p = bytes.data() + data_start;
  if (item_size == 4) {
    std::memcpy(bare.data.data(), p, count * sizeof(float));
  } else {
    for (std::size_t i = 0; i < count; ++i) {
      bare.data[i] = narrow_component(read_le<double>(p + i * 8));
    }
  }
  return EmbeddingSourceResult::ok(std::move(bare));
}

EmbeddingSourceResult read_embeddings_npy(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return EmbeddingSourceResult::err("failed to open: " + path);
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                             std::istreambuf_iterator<char>());

  auto source = embedding_source_from_npy(bytes);
  if (!source.has_value()) {
    return EmbeddingSourceResult::err(path + ": " + source.error());
  }
  return source;
}

}  // namespace crec::ingest
