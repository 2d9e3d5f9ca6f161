#pragma once

#include "crec/catalog/item_catalog.h"
#include "crec/core/result.h"
#include "crec/interaction/interaction_log.h"
#include "crec/vector/embedding_store.h"

#include <cstddef>
#include <string>
#include <vector>

namespace crec::ingest {

/// Artifact file names inside a data directory.
constexpr const char* kEmbeddingsJsonFile = "articles_embeddings.json";
constexpr const char* kEmbeddingsNpyFile = "articles_embeddings.npy";
constexpr const char* kMetadataFile = "articles_metadata.csv";

/// Options for loading a data directory
struct LoadOptions {
  std::string data_dir;             // Directory holding the artifacts
  std::size_t max_click_files{10};  // Interaction-log files read, in name order
};

/// LoadReport describes what a successful load consumed. Library code never prints;
/// the caller decides how to surface warnings.
struct LoadReport {
  std::string embeddings_path;                                        // NOLINT
  vector::EmbeddingLayout embedding_layout{vector::EmbeddingLayout::kMapping};  // NOLINT
  std::size_t embedding_count{0};                                     // NOLINT
  std::size_t embedding_dim{0};                                       // NOLINT
  std::size_t catalog_size{0};                                        // NOLINT
  std::size_t click_files_loaded{0};                                  // NOLINT
  std::size_t click_files_skipped{0};                                 // NOLINT
  std::size_t click_count{0};                                         // NOLINT
  std::vector<std::string> warnings;                                  // NOLINT
};

/// LoadedArtifacts owns the three immutable data sets produced by one load.
struct LoadedArtifacts {
  vector::EmbeddingStore embeddings;       // NOLINT(readability-identifier-naming)
  catalog::ItemCatalog catalog;            // NOLINT(readability-identifier-naming)
  interaction::InteractionLog interactions;  // NOLINT(readability-identifier-naming)
  LoadReport report;                       // NOLINT(readability-identifier-naming)
};

using LoadResult = core::Result<LoadedArtifacts, std::string>;

/// Load a data directory.
///
/// Fatal (returns error, nothing usable is produced):
/// - metadata missing, unreadable, or without an article_id column
/// - embeddings missing (neither .json nor .npy), unreadable, or malformed
///
/// Soft (recorded in LoadReport::warnings, loading continues):
/// - no interaction-log files found
/// - an individual interaction-log file unreadable or malformed (file skipped)
///
/// The metadata is read first so a bare-matrix embeddings artifact can take its ids
/// from catalog order. When both embeddings files exist, the JSON one is used.
[[nodiscard]] LoadResult load_artifacts(const LoadOptions& options);

}  // namespace crec::ingest
