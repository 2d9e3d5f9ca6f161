#include "crec/catalog/item_catalog.h"

#include <utility>

namespace crec::catalog {

ItemCatalog::ItemCatalog(std::vector<domain::CatalogRecord> records) {
  records_.reserve(records.size());
  ids_.reserve(records.size());
  index_.reserve(records.size());

  for (auto& record : records) {
    if (index_.count(record.item_id) != 0) {
      continue;
    }
    index_.emplace(record.item_id, records_.size());
    ids_.push_back(record.item_id);
    records_.push_back(std::move(record));
  }
}

domain::ItemInfo ItemCatalog::info_of(const core::ItemId& item_id) const {
  auto it = index_.find(item_id);
  if (it == index_.end()) {
    return domain::resolve_item_info(item_id, nullptr);
  }
  return domain::resolve_item_info(item_id, &records_[it->second]);
}

bool ItemCatalog::contains(const core::ItemId& item_id) const {
  return index_.count(item_id) != 0;
}

}  // namespace crec::catalog
