#pragma once

#include "crec/core/ids.h"
#include "crec/domain/item.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace crec::domain {

// RecommendationSource records which policy produced a result list.
enum class RecommendationSource {
  kSimilarity,    // summed cosine similarity over the user's recent history
  kPopularity,    // interaction counts (user has no history)
  kCatalogOrder,  // first catalog items with synthetic scores (no interactions at all)
};

[[nodiscard]] std::string to_string(RecommendationSource source);

// RecommendationEntry is one ranked item: catalog description plus its score.
// Invariant within a list: item ids unique, sorted by score descending.
struct RecommendationEntry {
  ItemInfo item;                       // NOLINT(readability-identifier-naming)
  double recommendation_score{0.0};    // NOLINT(readability-identifier-naming)
};

struct RecommendationList {
  core::UserId user_id;                         // NOLINT(readability-identifier-naming)
  RecommendationSource source{RecommendationSource::kSimilarity};  // NOLINT
  std::vector<RecommendationEntry> entries;     // NOLINT(readability-identifier-naming)
};

// Flat record: {article_id, title, category, words_count, recommendation_score}.
[[nodiscard]] nlohmann::json recommendation_entry_to_json(const RecommendationEntry& entry);

// Response envelope: {user_id, recommendations: [...], count}.
[[nodiscard]] nlohmann::json recommendation_list_to_json(const RecommendationList& list);

}  // namespace crec::domain
