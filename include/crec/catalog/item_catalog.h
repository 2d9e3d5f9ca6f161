#pragma once

#include "crec/core/ids.h"
#include "crec/domain/item.h"

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace crec::catalog {

// ItemCatalog holds per-item descriptive attributes in source (catalog) order.
// Lookups never fail: unknown ids and sparse records resolve through ItemDefaults.
// When the source repeats an id, the first record wins and later ones are ignored.
class ItemCatalog {
 public:
  ItemCatalog() = default;
  explicit ItemCatalog(std::vector<domain::CatalogRecord> records);

  [[nodiscard]] domain::ItemInfo info_of(const core::ItemId& item_id) const;
  [[nodiscard]] bool contains(const core::ItemId& item_id) const;

  // ids in catalog order, duplicates removed.
  [[nodiscard]] const std::vector<core::ItemId>& ids() const { return ids_; }
  [[nodiscard]] std::size_t size() const { return ids_.size(); }

 private:
  std::vector<domain::CatalogRecord> records_;
  std::vector<core::ItemId> ids_;
  std::unordered_map<core::ItemId, std::size_t, core::ItemIdHash> index_;
};

}  // namespace crec::catalog
