#include "crec/ingest/metadata_reader.h"

#include "crec/core/normalization.h"

namespace crec::ingest {

CatalogRecordsResult catalog_records_from_table(const CsvTable& table) {
  const auto id_col = table.column_index(kItemIdColumn);
  if (!id_col.has_value()) {
    return CatalogRecordsResult::err(std::string("metadata is missing required column '") +
                                     kItemIdColumn + "'");
  }
  const auto title_col = table.column_index(kTitleColumn);
  const auto category_col = table.column_index(kCategoryColumn);
  const auto words_col = table.column_index(kWordCountColumn);

  std::vector<domain::CatalogRecord> records;
  records.reserve(table.rows.size());

  for (std::size_t r = 0; r < table.rows.size(); ++r) {
    const auto& row = table.rows[r];
    const auto id = core::parse_int64_lenient(row[id_col.value()]);
    if (!id.has_value()) {
      return CatalogRecordsResult::err("metadata row " + std::to_string(r + 1) +
                                       " has invalid " + kItemIdColumn + " '" +
                                       row[id_col.value()] + "'");
    }

    domain::CatalogRecord record;
    record.item_id = core::ItemId{id.value()};
    if (title_col.has_value()) {
      auto title = core::trim(row[title_col.value()]);
      if (!title.empty()) {
        record.title = std::move(title);
      }
    }
    if (category_col.has_value()) {
      record.category_id = core::parse_int64_lenient(row[category_col.value()]);
    }
    if (words_col.has_value()) {
      record.word_count = core::parse_int64_lenient(row[words_col.value()]);
    }
    records.push_back(std::move(record));
  }

  return CatalogRecordsResult::ok(std::move(records));
}

CatalogRecordsResult read_catalog_csv(const std::string& path) {
  auto table = read_csv_file(path);
  if (!table.has_value()) {
    return CatalogRecordsResult::err(table.error());
  }
  auto records = catalog_records_from_table(table.value());
  if (!records.has_value()) {
    return CatalogRecordsResult::err(path + ": " + records.error());
  }
  return records;
}

}  // namespace crec::ingest
