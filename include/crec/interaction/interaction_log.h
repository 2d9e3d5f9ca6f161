#pragma once

#include "crec/core/ids.h"
#include "crec/domain/interaction.h"

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace crec::interaction {

// InteractionLog indexes (user, item) consumption events for read-only queries.
// All derived views are computed once at construction; an empty log is valid and
// every query against it returns an empty (or placeholder) result.
class InteractionLog {
 public:
  InteractionLog() = default;
  explicit InteractionLog(std::vector<domain::InteractionEvent> events);

  // history_of returns the user's distinct items, most recent first.
  // Recency comes from click timestamps when every one of the user's events has one
  // (ties keep source order); otherwise source order is used as-is.
  [[nodiscard]] std::vector<core::ItemId> history_of(const core::UserId& user_id) const;

  // popularity_ranking returns up to top_n items by interaction count, descending.
  // Equal counts are ordered by item id ascending.
  [[nodiscard]] std::vector<domain::PopularityEntry> popularity_ranking(
      std::size_t top_n) const;

  // sample_user_ids returns up to limit distinct users in first-seen order.
  // On an empty log it returns the placeholder range 1..min(limit, kMaxPlaceholderUsers);
  // see has_real_users().
  [[nodiscard]] std::vector<core::UserId> sample_user_ids(std::size_t limit) const;
  static constexpr std::size_t kMaxPlaceholderUsers = 100;

  [[nodiscard]] bool empty() const { return event_count_ == 0; }
  [[nodiscard]] bool has_real_users() const { return !users_.empty(); }
  [[nodiscard]] std::size_t size() const { return event_count_; }
  [[nodiscard]] std::size_t user_count() const { return users_.size(); }

 private:
  std::size_t event_count_ = 0;
  std::vector<core::UserId> users_;  // first-seen order
  std::unordered_map<core::UserId, std::vector<core::ItemId>, core::UserIdHash> histories_;
  std::vector<domain::PopularityEntry> popularity_;  // full ranking, sorted
};

}  // namespace crec::interaction
