#include "crec/interaction/interaction_log.h"

#include <algorithm>
#include <map>
#include <unordered_set>

namespace crec::interaction {

namespace {

// Orders one user's events most-recent-first and keeps the first sighting of each item.
std::vector<core::ItemId> build_history(std::vector<const domain::InteractionEvent*> events) {
  const bool fully_timestamped =
      std::all_of(events.begin(), events.end(), [](const domain::InteractionEvent* e) {
        return e->click_timestamp.has_value();
      });

  if (fully_timestamped) {
    std::stable_sort(events.begin(), events.end(),
                     [](const domain::InteractionEvent* a, const domain::InteractionEvent* b) {
                       return a->click_timestamp.value() > b->click_timestamp.value();
                     });
  }

  std::vector<core::ItemId> history;
  std::unordered_set<core::ItemId, core::ItemIdHash> seen;
  for (const auto* event : events) {
    if (seen.insert(event->item_id).second) {
      history.push_back(event->item_id);
    }
  }
  return history;
}

}  // namespace

InteractionLog::InteractionLog(std::vector<domain::InteractionEvent> events)
    : event_count_(events.size()) {
  std::unordered_map<core::UserId, std::vector<const domain::InteractionEvent*>,
                     core::UserIdHash>
      by_user;
  std::map<core::ItemId, std::size_t> counts;

  for (const auto& event : events) {
    auto& bucket = by_user[event.user_id];
    if (bucket.empty()) {
      users_.push_back(event.user_id);
    }
    bucket.push_back(&event);
    ++counts[event.item_id];
  }

  histories_.reserve(by_user.size());
  for (auto& [user_id, user_events] : by_user) {
    histories_.emplace(user_id, build_history(std::move(user_events)));
  }

  // std::map iterates by item id ascending, so a stable sort by count keeps id order on ties.
  popularity_.reserve(counts.size());
  for (const auto& [item_id, count] : counts) {
    popularity_.push_back(domain::PopularityEntry{item_id, count});
  }
  std::stable_sort(popularity_.begin(), popularity_.end(),
                   [](const domain::PopularityEntry& a, const domain::PopularityEntry& b) {
                     return a.count > b.count;
                   });
}

std::vector<core::ItemId> InteractionLog::history_of(const core::UserId& user_id) const {
  auto it = histories_.find(user_id);
  if (it == histories_.end()) {
    return {};
  }
  return it->second;
}

std::vector<domain::PopularityEntry> InteractionLog::popularity_ranking(
    std::size_t top_n) const {
  const std::size_t take = std::min(top_n, popularity_.size());
  return {popularity_.begin(), popularity_.begin() + static_cast<std::ptrdiff_t>(take)};
}

std::vector<core::UserId> InteractionLog::sample_user_ids(std::size_t limit) const {
  std::vector<core::UserId> result;
  if (users_.empty()) {
    // Placeholder ids keep exploratory tooling usable; they are not real users.
    const std::size_t count = std::min(limit, kMaxPlaceholderUsers);
    result.reserve(count);
    for (std::size_t i = 1; i <= count; ++i) {
      result.push_back(core::UserId{static_cast<std::int64_t>(i)});
    }
    return result;
  }

  const std::size_t take = std::min(limit, users_.size());
  result.assign(users_.begin(), users_.begin() + static_cast<std::ptrdiff_t>(take));
  return result;
}

}  // namespace crec::interaction
