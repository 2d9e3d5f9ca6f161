#pragma once

#include "crec/vector/embedding_store.h"
#include "crec/vector/similarity_index.h"

#include <vector>

namespace crec::vector {

// ExactCosineIndex scores the query row against every row of an EmbeddingStore.
// O(N·D) per query, no approximation. Ties are broken by store row order.
// The store must outlive the index.
class ExactCosineIndex final : public ISimilarityIndex {
 public:
  explicit ExactCosineIndex(const EmbeddingStore& store);

  [[nodiscard]] std::vector<Neighbor> neighbors_of(const core::ItemId& item_id,
                                                   std::size_t k) const override;

  // Compute cosine similarity between two vectors.
  // Returns 0.0 if either vector has zero magnitude or the sizes differ.
  [[nodiscard]] static double cosine_similarity(const Vector& a, const Vector& b);

 private:
  const EmbeddingStore& store_;
  std::vector<double> norms_;  // per-row L2 norm, computed once
};

}  // namespace crec::vector
