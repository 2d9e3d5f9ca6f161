#pragma once

// EmbeddingSource: the three artifact layouts an embeddings file may arrive in.
//
// The layout is resolved exactly once, at load time, into a std::variant. EmbeddingStore
// consumes the variant and normalizes it into one canonical (ordered ids, packed matrix)
// representation; nothing downstream of the store ever inspects the layout again.

#include "crec/core/ids.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace crec::vector {

using Vector = std::vector<float>;

// EmbeddingLayout enumerates every recognised source layout.
enum class EmbeddingLayout : uint8_t {
  kMapping,     // explicit id → vector mapping
  kPaired,      // (id list, matrix) aligned by position
  kBareMatrix,  // matrix only; ids assigned positionally from catalog order
};

// MappingSource: document order of the mapping is preserved as row order.
struct MappingSource {
  std::vector<std::pair<core::ItemId, Vector>> entries;  // NOLINT(readability-identifier-naming)
};

// PairedSource: ids[i] names rows[i].
struct PairedSource {
  std::vector<core::ItemId> ids;  // NOLINT(readability-identifier-naming)
  std::vector<Vector> rows;       // NOLINT(readability-identifier-naming)
};

// BareMatrixSource: rows carry no ids. Stored packed (row-major) because the binary
// reader produces that shape directly.
struct BareMatrixSource {
  std::size_t row_count{0};  // NOLINT(readability-identifier-naming)
  std::size_t dim{0};        // NOLINT(readability-identifier-naming)
  std::vector<float> data;   // NOLINT(readability-identifier-naming)  size == row_count * dim
};

using EmbeddingSource = std::variant<MappingSource, PairedSource, BareMatrixSource>;

[[nodiscard]] inline EmbeddingLayout layout_of(const EmbeddingSource& source) {
  switch (source.index()) {
    case 0:
      return EmbeddingLayout::kMapping;
    case 1:
      return EmbeddingLayout::kPaired;
    default:
      return EmbeddingLayout::kBareMatrix;
  }
}

// to_string returns the canonical name reported in load diagnostics.
[[nodiscard]] inline std::string_view to_string(EmbeddingLayout layout) {
  switch (layout) {
    case EmbeddingLayout::kMapping:
      return "mapping";
    case EmbeddingLayout::kPaired:
      return "paired";
    case EmbeddingLayout::kBareMatrix:
      return "bare_matrix";
  }
  return "unknown";  // unreachable: all enumerators covered above
}

}  // namespace crec::vector
