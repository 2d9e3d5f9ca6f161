#include "crec/recommend/recommendation_engine.h"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace crec::recommend {

RecommendationEngine::RecommendationEngine(const core::Services& services,
                                           RecommenderConfig config)
    : services_(services), config_(config) {}

domain::RecommendationList RecommendationEngine::recommend(const core::UserId& user_id,
                                                           int top_n) const {
  if (top_n <= 0) {
    return domain::RecommendationList{user_id, domain::RecommendationSource::kSimilarity, {}};
  }
  const auto limit = static_cast<std::size_t>(top_n);

  const auto history = services_.interactions.history_of(user_id);
  if (history.empty()) {
    return fallback(user_id, limit);
  }

  return domain::RecommendationList{user_id, domain::RecommendationSource::kSimilarity,
                                    rank_by_similarity(history, limit)};
}

std::vector<domain::RecommendationEntry> RecommendationEngine::rank_by_similarity(
    const std::vector<core::ItemId>& history, std::size_t top_n) const {
  // Exclusion covers the full history, not just the seeds.
  const std::unordered_set<core::ItemId, core::ItemIdHash> consumed(history.begin(),
                                                                    history.end());

  std::unordered_map<core::ItemId, double, core::ItemIdHash> summed;
  const std::size_t seed_count = std::min(config_.recency_cap, history.size());
  for (std::size_t i = 0; i < seed_count; ++i) {
    for (const auto& neighbor :
         services_.similarity.neighbors_of(history[i], config_.candidate_breadth)) {
      if (consumed.count(neighbor.item_id) != 0) {
        continue;
      }
      summed[neighbor.item_id] += neighbor.score;
    }
  }

  std::vector<std::pair<core::ItemId, double>> ranked(summed.begin(), summed.end());
  const std::size_t take = std::min(top_n, ranked.size());
  std::partial_sort(ranked.begin(), ranked.begin() + static_cast<std::ptrdiff_t>(take),
                    ranked.end(), [](const auto& a, const auto& b) {
                      if (a.second != b.second) {
                        return a.second > b.second;  // Higher summed score first
                      }
                      return a.first < b.first;  // Item id ascending among exact ties
                    });

  std::vector<domain::RecommendationEntry> entries;
  entries.reserve(take);
  for (std::size_t i = 0; i < take; ++i) {
    entries.push_back(domain::RecommendationEntry{services_.catalog.info_of(ranked[i].first),
                                                  ranked[i].second});
  }
  return entries;
}

domain::RecommendationList RecommendationEngine::fallback(const core::UserId& user_id,
                                                          std::size_t top_n) const {
  domain::RecommendationList list{user_id, domain::RecommendationSource::kPopularity, {}};

  if (!services_.interactions.empty()) {
    for (const auto& entry : services_.interactions.popularity_ranking(top_n)) {
      list.entries.push_back(domain::RecommendationEntry{
          services_.catalog.info_of(entry.item_id), static_cast<double>(entry.count)});
    }
    return list;
  }

  // No interactions at all: first catalog items, scored top_n, top_n-1, ... purely to
  // give the placeholder list a total order.
  list.source = domain::RecommendationSource::kCatalogOrder;
  const auto& ids = services_.catalog.ids();
  const std::size_t take = std::min(top_n, ids.size());
  list.entries.reserve(take);
  for (std::size_t i = 0; i < take; ++i) {
    list.entries.push_back(domain::RecommendationEntry{services_.catalog.info_of(ids[i]),
                                                       static_cast<double>(top_n - i)});
  }
  return list;
}

}  // namespace crec::recommend
