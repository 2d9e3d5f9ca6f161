#pragma once

#include "crec/core/result.h"
#include "crec/domain/item.h"
#include "crec/ingest/csv_table.h"

#include <string>
#include <vector>

namespace crec::ingest {

using CatalogRecordsResult = core::Result<std::vector<domain::CatalogRecord>, std::string>;

/// Column names recognised in the metadata artifact. Only kItemIdColumn is required.
constexpr const char* kItemIdColumn = "article_id";
constexpr const char* kTitleColumn = "title";
constexpr const char* kCategoryColumn = "category_id";
constexpr const char* kWordCountColumn = "words_count";

/// Convert a parsed metadata table into catalog records, preserving row order.
/// Fails if the id column is missing or any row has a non-integer id.
/// Optional cells that are empty or non-numeric are recorded as absent.
[[nodiscard]] CatalogRecordsResult catalog_records_from_table(const CsvTable& table);

/// Read the metadata artifact from disk.
[[nodiscard]] CatalogRecordsResult read_catalog_csv(const std::string& path);

}  // namespace crec::ingest
