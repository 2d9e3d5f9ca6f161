#pragma once

#include "crec/core/ids.h"

#include <cstddef>
#include <vector>

namespace crec::vector {

struct Neighbor {
  core::ItemId item_id;  // NOLINT(readability-identifier-naming)
  double score;          // NOLINT(readability-identifier-naming)
};

// ISimilarityIndex defines item-to-item nearest-neighbour lookup.
// The engine depends on this seam only, so tests can substitute fixed neighbour lists.
class ISimilarityIndex {
 public:
  virtual ~ISimilarityIndex() = default;

  // neighbors_of returns at most k items most similar to item_id, sorted by score
  // (descending) with deterministic tie-breaking. Never contains item_id itself.
  // An unknown item_id yields an empty result rather than an error.
  [[nodiscard]] virtual std::vector<Neighbor> neighbors_of(const core::ItemId& item_id,
                                                           std::size_t k) const = 0;
};

}  // namespace crec::vector
