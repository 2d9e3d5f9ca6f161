#pragma once

#include "crec/core/ids.h"
#include "crec/core/services.h"
#include "crec/domain/recommendation.h"

#include <cstddef>
#include <vector>

namespace crec::recommend {

// RecommenderConfig controls similarity-path breadth.
struct RecommenderConfig {
  std::size_t recency_cap{5};          // Most recent history items used as seeds
  std::size_t candidate_breadth{20};   // Neighbours fetched per seed item
};

// RecommendationEngine is a class (not struct) per C++ Core Guidelines C.2:
// It encapsulates the ranking policy with private configuration (config_).
// The invariant is that config and the referenced services stay constant after
// construction, so recommend() is deterministic for a given user and top_n.
class RecommendationEngine {
 public:
  explicit RecommendationEngine(const core::Services& services,
                                RecommenderConfig config = RecommenderConfig{});

  // Con.2: recommend() is const - ranking never modifies engine or service state.
  // This enables concurrent recommendations against a single engine instance.
  //
  // Users with history: similarity path (summed cosine over recent seeds, consumed
  //   items excluded, ties by item id ascending).
  // Users without history: popularity fallback, or catalog order when the
  //   interaction log is empty.
  // Returns at most top_n entries; never pads. top_n <= 0 yields an empty list.
  [[nodiscard]] domain::RecommendationList recommend(const core::UserId& user_id,
                                                     int top_n) const;

  [[nodiscard]] const RecommenderConfig& config() const { return config_; }

 private:
  const core::Services& services_;
  RecommenderConfig config_;

  [[nodiscard]] std::vector<domain::RecommendationEntry> rank_by_similarity(
      const std::vector<core::ItemId>& history, std::size_t top_n) const;

  [[nodiscard]] domain::RecommendationList fallback(const core::UserId& user_id,
                                                    std::size_t top_n) const;
};

}  // namespace crec::recommend
