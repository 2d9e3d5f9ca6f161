#include "crec/domain/item.h"

namespace crec::domain {

std::string ItemDefaults::title_for(const core::ItemId& id) {
  return "Article " + core::to_string(id);
}

ItemInfo resolve_item_info(const core::ItemId& id, const CatalogRecord* record) {
  ItemInfo info;
  info.item_id = id;
  info.title = ItemDefaults::title_for(id);
  info.category_id = std::nullopt;
  info.word_count = ItemDefaults::kWordCount;

  if (record == nullptr) {
    return info;
  }

  if (record->title.has_value() && !record->title->empty()) {
    info.title = record->title.value();
  }
  info.category_id = record->category_id;
  if (record->word_count.has_value() && record->word_count.value() >= 0) {
    info.word_count = record->word_count.value();
  }
  return info;
}

nlohmann::json item_info_to_json(const ItemInfo& info) {
  nlohmann::json j;
  j["article_id"] = info.item_id.value;
  j["title"] = info.title;
  if (info.category_id.has_value()) {
    j["category"] = info.category_id.value();
  } else {
    j["category"] = ItemDefaults::kUnknownCategory;
  }
  j["words_count"] = info.word_count;
  return j;
}

}  // namespace crec::domain
