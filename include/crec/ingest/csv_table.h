#pragma once

#include "crec/core/result.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace crec::ingest {

/// In-memory tabular artifact: a header row plus data rows of equal width.
struct CsvTable {
  std::vector<std::string> header;             // NOLINT(readability-identifier-naming)
  std::vector<std::vector<std::string>> rows;  // NOLINT(readability-identifier-naming)

  /// Index of the first header cell equal to name (after trimming), if any.
  [[nodiscard]] std::optional<std::size_t> column_index(std::string_view name) const;
};

using CsvResult = core::Result<CsvTable, std::string>;

/// Parse comma-separated text with RFC 4180 quoting ("" escapes, quoted newlines).
/// Blank lines are skipped. Fails on an unterminated quote, an empty input (no header),
/// or a data row whose width differs from the header.
[[nodiscard]] CsvResult parse_csv(std::string_view text);

/// Read and parse a CSV file. Fails if the file cannot be opened.
[[nodiscard]] CsvResult read_csv_file(const std::string& path);

/// Read a whole file into a string, or nullopt if it cannot be opened.
[[nodiscard]] std::optional<std::string> read_text_file(const std::string& path);

}  // namespace crec::ingest
