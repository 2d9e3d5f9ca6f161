#include "crec/ingest/csv_table.h"

#include "crec/core/normalization.h"

#include <fstream>
#include <sstream>

namespace crec::ingest {

std::optional<std::size_t> CsvTable::column_index(std::string_view name) const {
  for (std::size_t i = 0; i < header.size(); ++i) {
    if (core::trim(header[i]) == name) {
      return i;
    }
  }
  return std::nullopt;
}

namespace {

bool is_blank(const std::vector<std::string>& record) {
  return record.size() == 1 && core::trim(record[0]).empty();
}

}  // namespace

CsvResult parse_csv(std::string_view text) {
  // Strip a UTF-8 byte order mark; spreadsheet exports commonly prepend one.
  if (text.size() >= 3 && text.substr(0, 3) == "\xEF\xBB\xBF") {
    text.remove_prefix(3);
  }

  std::vector<std::vector<std::string>> records;
  std::vector<std::string> record;
  std::string field;
  bool in_quotes = false;
  bool field_was_quoted = false;

  auto end_field = [&]() {
    record.push_back(std::move(field));
    field.clear();
    field_was_quoted = false;
  };
  auto end_record = [&]() {
    end_field();
    if (!is_blank(record)) {
      records.push_back(std::move(record));
    }
    record.clear();
  };

  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (in_quotes) {
      if (ch == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field.push_back(ch);
      }
      continue;
    }

    switch (ch) {
      case '"':
        if (field.empty() && !field_was_quoted) {
          in_quotes = true;
          field_was_quoted = true;
        } else {
          field.push_back(ch);  // stray quote inside an unquoted field is kept literally
        }
        break;
      case ',':
        end_field();
        break;
      case '\r':
        if (i + 1 < text.size() && text[i + 1] == '\n') {
          ++i;
        }
        end_record();
        break;
      case '\n':
        end_record();
        break;
      default:
        field.push_back(ch);
        break;
    }
  }

  if (in_quotes) {
    return CsvResult::err("unterminated quoted field");
  }
  if (!field.empty() || field_was_quoted || !record.empty()) {
    end_record();
  }

  if (records.empty()) {
    return CsvResult::err("no header row");
  }

  CsvTable table;
  table.header = std::move(records.front());
  for (auto& cell : table.header) {
    cell = core::trim(cell);
  }
  table.rows.reserve(records.size() - 1);
  for (std::size_t r = 1; r < records.size(); ++r) {
    if (records[r].size() != table.header.size()) {
      return CsvResult::err("row " + std::to_string(r) + " has " +
                            std::to_string(records[r].size()) + " fields, header has " +
                            std::to_string(table.header.size()));
    }
    table.rows.push_back(std::move(records[r]));
  }
  return CsvResult::ok(std::move(table));
}

std::optional<std::string> read_text_file(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

CsvResult read_csv_file(const std::string& path) {
  auto text = read_text_file(path);
  if (!text.has_value()) {
    return CsvResult::err("failed to open: " + path);
  }
  auto table = parse_csv(text.value());
  if (!table.has_value()) {
    return CsvResult::err(path + ": " + table.error());
  }
  return table;
}

}  // namespace crec::ingest
