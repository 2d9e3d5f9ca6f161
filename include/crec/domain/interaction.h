#pragma once

#include "crec/core/ids.h"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace crec::domain {

// InteractionEvent records that a user consumed an item.
// click_timestamp is present only when the source log carries one; without it the
// event's position in the source is the only recency signal.
struct InteractionEvent {
  core::UserId user_id;                         // NOLINT(readability-identifier-naming)
  core::ItemId item_id;                         // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> click_timestamp;  // NOLINT(readability-identifier-naming)
};

// PopularityEntry is one row of the aggregate consumption ranking.
struct PopularityEntry {
  core::ItemId item_id;        // NOLINT(readability-identifier-naming)
  std::size_t count{0};        // NOLINT(readability-identifier-naming)
};

}  // namespace crec::domain
