#include "crec/domain/recommendation.h"

namespace crec::domain {

std::string to_string(RecommendationSource source) {
  switch (source) {
    case RecommendationSource::kSimilarity:
      return "similarity";
    case RecommendationSource::kPopularity:
      return "popularity";
    case RecommendationSource::kCatalogOrder:
      return "catalog_order";
  }
  return "unknown";  // unreachable: all enumerators covered above
}

nlohmann::json recommendation_entry_to_json(const RecommendationEntry& entry) {
  nlohmann::json j = item_info_to_json(entry.item);
  j["recommendation_score"] = entry.recommendation_score;
  return j;
}

nlohmann::json recommendation_list_to_json(const RecommendationList& list) {
  nlohmann::json recs = nlohmann::json::array();
  for (const auto& entry : list.entries) {
    recs.push_back(recommendation_entry_to_json(entry));
  }

  nlohmann::json j;
  j["user_id"] = list.user_id.value;
  j["recommendations"] = std::move(recs);
  j["count"] = list.entries.size();
  return j;
}

}  // namespace crec::domain
