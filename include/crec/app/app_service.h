#pragma once

#include "crec/app/recommender_instance.h"
#include "crec/core/ids.h"
#include "crec/domain/item.h"
#include "crec/domain/recommendation.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <vector>

namespace crec::app {

// ────────────────────────────────────────────────────────────────
// Recommend
// ────────────────────────────────────────────────────────────────

struct RecommendRequest {
  core::UserId user_id;  // NOLINT(readability-identifier-naming)
  int top_n{5};          // NOLINT(readability-identifier-naming)
};

// Produce the ranked list for one user. Never fails once an instance exists.
[[nodiscard]] domain::RecommendationList run_recommend(const RecommendRequest& req,
                                                       const RecommenderInstance& instance);

// ────────────────────────────────────────────────────────────────
// Similar items
// ────────────────────────────────────────────────────────────────

struct SimilarRequest {
  core::ItemId item_id;  // NOLINT(readability-identifier-naming)
  std::size_t k{10};     // NOLINT(readability-identifier-naming)
};

struct SimilarItem {
  domain::ItemInfo item;  // NOLINT(readability-identifier-naming)
  double similarity{0.0};  // NOLINT(readability-identifier-naming)
};

struct SimilarResponse {
  core::ItemId item_id;              // NOLINT(readability-identifier-naming)
  bool known_item{false};            // false when the item has no embedding
  std::vector<SimilarItem> similar;  // NOLINT(readability-identifier-naming)
};

[[nodiscard]] SimilarResponse run_similar(const SimilarRequest& req,
                                          const RecommenderInstance& instance);

[[nodiscard]] nlohmann::json similar_response_to_json(const SimilarResponse& response);

// ────────────────────────────────────────────────────────────────
// History and users
// ────────────────────────────────────────────────────────────────

struct HistoryResponse {
  core::UserId user_id;               // NOLINT(readability-identifier-naming)
  std::vector<domain::ItemInfo> items;  // most recent first
};

[[nodiscard]] HistoryResponse fetch_history(const core::UserId& user_id,
                                            const RecommenderInstance& instance);

[[nodiscard]] nlohmann::json history_response_to_json(const HistoryResponse& response);

struct UsersResponse {
  std::vector<core::UserId> user_ids;  // NOLINT(readability-identifier-naming)
  bool placeholder{false};             // true when ids are synthetic (empty log)
};

[[nodiscard]] UsersResponse list_users(std::size_t limit, const RecommenderInstance& instance);

[[nodiscard]] nlohmann::json users_response_to_json(const UsersResponse& response);

// ────────────────────────────────────────────────────────────────
// Stats and health
// ────────────────────────────────────────────────────────────────

// Summary of the loaded data: sizes, embedding layout, interaction-log coverage.
[[nodiscard]] nlohmann::json stats_to_json(const RecommenderInstance& instance);

// Liveness only; does not touch the engine.
[[nodiscard]] nlohmann::json health_json();

}  // namespace crec::app
