#pragma once

#include "crec/core/ids.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace crec::domain {

// ItemDefaults is the single source of truth for values substituted when a catalog
// record is absent or sparse. Every call site that synthesizes an ItemInfo goes
// through these (field, default) pairs.
struct ItemDefaults {
  // category → "unknown" when absent.
  static constexpr const char* kUnknownCategory = "unknown";
  // word_count → 0 when absent.
  static constexpr std::int64_t kWordCount = 0;

  // title → "Article {id}" when absent or empty.
  [[nodiscard]] static std::string title_for(const core::ItemId& id);
};

// CatalogRecord is one metadata row as read from the source artifact.
// Optional fields are genuinely missing in the source; defaults are applied on lookup.
struct CatalogRecord {
  core::ItemId item_id;                      // NOLINT(readability-identifier-naming)
  std::optional<std::string> title;          // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> category_id;   // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> word_count;    // NOLINT(readability-identifier-naming)
};

// ItemInfo is the fully-resolved description of an item, defaults applied.
// category_id == nullopt is rendered as ItemDefaults::kUnknownCategory.
struct ItemInfo {
  core::ItemId item_id;                     // NOLINT(readability-identifier-naming)
  std::string title;                        // NOLINT(readability-identifier-naming)
  std::optional<std::int64_t> category_id;  // NOLINT(readability-identifier-naming)
  std::int64_t word_count{ItemDefaults::kWordCount};  // NOLINT(readability-identifier-naming)

  bool operator==(const ItemInfo&) const = default;
};

// resolve_item_info applies ItemDefaults to a (possibly absent) catalog record.
[[nodiscard]] ItemInfo resolve_item_info(const core::ItemId& id,
                                         const CatalogRecord* record);

// Serializes as {article_id, title, category, words_count}; category is an integer or
// the "unknown" sentinel string.
[[nodiscard]] nlohmann::json item_info_to_json(const ItemInfo& info);

}  // namespace crec::domain
