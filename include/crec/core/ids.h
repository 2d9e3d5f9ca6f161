#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace crec::core {

// Strong ID types following C++ Core Guidelines C.11 (Make concrete types regular).
// Items and users are both integer-keyed in the source artifacts; wrapping them keeps
// a user identifier from ever being passed where an item identifier is expected.

struct ItemId {
  std::int64_t value{0};
  auto operator<=>(const ItemId&) const = default;  // C++20: generates ==, !=, <, <=, >, >=
};

struct UserId {
  std::int64_t value{0};
  auto operator<=>(const UserId&) const = default;
};

inline std::string to_string(const ItemId& id) { return std::to_string(id.value); }
inline std::string to_string(const UserId& id) { return std::to_string(id.value); }

struct ItemIdHash {
  std::size_t operator()(const ItemId& id) const noexcept {
    return std::hash<std::int64_t>{}(id.value);
  }
};

struct UserIdHash {
  std::size_t operator()(const UserId& id) const noexcept {
    return std::hash<std::int64_t>{}(id.value);
  }
};

}  // namespace crec::core
