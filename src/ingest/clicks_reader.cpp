#include "crec/ingest/clicks_reader.h"

#include "crec/core/normalization.h"

#include <algorithm>
#include <filesystem>
#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace crec::ingest {

InteractionEventsResult interaction_events_from_table(const CsvTable& table) {
  const auto user_col = table.column_index(kUserIdColumn);
  if (!user_col.has_value()) {
    return InteractionEventsResult::err(std::string("missing required column '") +
                                        kUserIdColumn + "'");
  }

  std::optional<std::size_t> item_col;
  for (const char* name : kClickItemColumns) {
    item_col = table.column_index(name);
    if (item_col.has_value()) {
      break;
    }
  }
  if (!item_col.has_value()) {
    return InteractionEventsResult::err(
        "missing item column (expected click_article_id, article_id or item_id)");
  }
  const auto ts_col = table.column_index(kClickTimestampColumn);

  std::vector<domain::InteractionEvent> events;
  events.reserve(table.rows.size());
  for (std::size_t r = 0; r < table.rows.size(); ++r) {
    const auto& row = table.rows[r];
    const auto user = core::parse_int64_lenient(row[user_col.value()]);
    const auto item = core::parse_int64_lenient(row[item_col.value()]);
    if (!user.has_value() || !item.has_value()) {
      return InteractionEventsResult::err("row " + std::to_string(r + 1) +
                                          " has a non-integer user or item id");
    }

    domain::InteractionEvent event;
    event.user_id = core::UserId{user.value()};
    event.item_id = core::ItemId{item.value()};
    if (ts_col.has_value()) {
      event.click_timestamp = core::parse_int64_lenient(row[ts_col.value()]);
    }
    events.push_back(event);
  }
  return InteractionEventsResult::ok(std::move(events));
}

InteractionEventsResult read_clicks_csv(const std::string& path) {
  auto table = read_csv_file(path);
  if (!table.has_value()) {
    return InteractionEventsResult::err(table.error());
  }
  auto events = interaction_events_from_table(table.value());
  if (!events.has_value()) {
    return InteractionEventsResult::err(path + ": " + events.error());
  }
  return events;
}

namespace {

// Appends the regular files in dir whose name satisfies keep. Iteration errors end the
// scan early instead of throwing.
template <typename Predicate>
void collect_files(const fs::path& dir, Predicate keep, std::vector<std::string>& files) {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
    std::error_code entry_ec;
    if (it->is_regular_file(entry_ec) && keep(it->path())) {
      files.push_back(it->path().string());
    }
  }
}

}  // namespace

std::vector<std::string> discover_click_files(const std::string& data_dir,
                                              std::size_t max_files) {
  std::vector<std::string> files;
  std::error_code ec;

  const fs::path clicks_dir = fs::path(data_dir) / "clicks";
  if (fs::is_directory(clicks_dir, ec)) {
    collect_files(
        clicks_dir, [](const fs::path& p) { return p.extension() == ".csv"; }, files);
  }
  if (files.empty() && fs::is_directory(data_dir, ec)) {
    collect_files(
        data_dir,
        [](const fs::path& p) {
          return p.filename().string().find("clicks_hour") != std::string::npos;
        },
        files);
  }

  std::sort(files.begin(), files.end());
  if (files.size() > max_files) {
    files.resize(max_files);
  }
  return files;
}

}  // namespace crec::ingest
