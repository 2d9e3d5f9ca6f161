#pragma once

#include "crec/core/result.h"
#include "crec/vector/embedding_source.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace crec::ingest {

using EmbeddingSourceResult = core::Result<vector::EmbeddingSource, std::string>;

/// Resolve a parsed JSON document into one of the three embedding layouts.
///
/// Recognised shapes:
///   mapping     {"<id>": [f, ...], ...}                    (document order = row order)
///   paired      {"article_ids": [id, ...], "embeddings": [[f, ...], ...]}
///               or the two-element array [[id, ...], [[f, ...], ...]]
///   bare matrix [[f, ...], [f, ...], ...]
///
/// Anything else fails with a message naming what was found. ordered_json is used so
/// that a mapping keeps the artifact's own order rather than sorted key order.
[[nodiscard]] EmbeddingSourceResult embedding_source_from_json(const nlohmann::ordered_json& doc);

/// Parse a JSON embeddings artifact from disk.
[[nodiscard]] EmbeddingSourceResult read_embeddings_json(const std::string& path);

/// Decode a NumPy .npy buffer (format 1.0-3.0, little-endian float32 or float64,
/// two-dimensional, C order) into a bare matrix.
[[nodiscard]] EmbeddingSourceResult embedding_source_from_npy(const std::vector<uint8_t>& bytes);

/// Read a NumPy .npy embeddings artifact from disk.
[[nodiscard]] EmbeddingSourceResult read_embeddings_npy(const std::string& path);

}  // namespace crec::ingest
