#pragma once

#include "crec/core/result.h"
#include "crec/domain/interaction.h"
#include "crec/ingest/csv_table.h"

#include <cstddef>
#include <string>
#include <vector>

namespace crec::ingest {

using InteractionEventsResult = core::Result<std::vector<domain::InteractionEvent>, std::string>;

/// Required user column, the accepted item columns (first match wins), and the
/// optional recency column of an interaction-log artifact.
constexpr const char* kUserIdColumn = "user_id";
constexpr const char* kClickItemColumns[] = {"click_article_id", "article_id", "item_id"};
constexpr const char* kClickTimestampColumn = "click_timestamp";

/// Convert one parsed click table into events, preserving row order.
/// Fails if a required column is missing or a user/item cell is not an integer.
/// A non-numeric timestamp cell is recorded as absent.
[[nodiscard]] InteractionEventsResult interaction_events_from_table(const CsvTable& table);

/// Read one interaction-log artifact from disk.
[[nodiscard]] InteractionEventsResult read_clicks_csv(const std::string& path);

/// List interaction-log artifacts under data_dir, sorted by file name, at most
/// max_files: every *.csv under data_dir/clicks, or, when that directory does not
/// exist, files directly under data_dir whose name contains "clicks_hour".
[[nodiscard]] std::vector<std::string> discover_click_files(const std::string& data_dir,
                                                            std::size_t max_files);

}  // namespace crec::ingest
