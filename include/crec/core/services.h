#pragma once

#include "crec/catalog/item_catalog.h"
#include "crec/interaction/interaction_log.h"
#include "crec/vector/embedding_store.h"
#include "crec/vector/similarity_index.h"

namespace crec::core {

// Services is a composition root that bundles the loaded, read-only data the
// recommendation engine queries. It holds references (not ownership); whoever loads
// the artifacts owns them and must keep them alive for as long as Services is used.
struct Services {
  const vector::EmbeddingStore& embeddings;       // NOLINT(readability-identifier-naming)
  const catalog::ItemCatalog& catalog;            // NOLINT(readability-identifier-naming)
  const interaction::InteractionLog& interactions;  // NOLINT(readability-identifier-naming)
  const vector::ISimilarityIndex& similarity;     // NOLINT(readability-identifier-naming)

  Services(const vector::EmbeddingStore& embeddings, const catalog::ItemCatalog& catalog,
           const interaction::InteractionLog& interactions,
           const vector::ISimilarityIndex& similarity)
      : embeddings(embeddings),
        catalog(catalog),
        interactions(interactions),
        similarity(similarity) {}

  ~Services() = default;

  // Prevent copying and moving to avoid accidental lifetime issues
  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace crec::core
