#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace crec::core {

// Deterministic ASCII-only parsing utilities shared by the artifact readers and the
// serving boundary. These functions are locale-independent and produce byte-stable
// output across all platforms and compilers.

// trim removes leading and trailing whitespace (ASCII space/tab/newline)
inline std::string trim(const std::string_view input) {
  if (input.empty()) {
    return std::string{};
  }

  // Find first non-whitespace
  std::size_t start = 0;
  while (start < input.size() && (input[start] == ' ' || input[start] == '\t' ||
                                  input[start] == '\n' || input[start] == '\r')) {
    ++start;
  }

  // All whitespace
  if (start == input.size()) {
    return std::string{};
  }

  // Find last non-whitespace
  std::size_t end = input.size();
  while (end > start && (input[end - 1] == ' ' || input[end - 1] == '\t' ||
                         input[end - 1] == '\n' || input[end - 1] == '\r')) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

// parse_int64 parses a base-10 integer, allowing surrounding whitespace.
// The whole (trimmed) input must be consumed; "12abc", "", and "1.5" all fail.
[[nodiscard]] inline std::optional<std::int64_t> parse_int64(const std::string_view input) {
  const std::string text = trim(input);
  if (text.empty()) {
    return std::nullopt;
  }

  std::int64_t value = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  if (*first == '+') {
    ++first;
  }
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

// parse_int64_lenient additionally accepts integral decimal spellings such as "42.0",
// which tabular exports produce for integer columns that contained a missing value.
[[nodiscard]] inline std::optional<std::int64_t> parse_int64_lenient(
    const std::string_view input) {
  if (auto exact = parse_int64(input)) {
    return exact;
  }

  const std::string text = trim(input);
  const auto dot = text.find('.');
  if (dot == std::string::npos || dot == 0) {
    return std::nullopt;
  }
  for (std::size_t i = dot + 1; i < text.size(); ++i) {
    if (text[i] != '0') {
      return std::nullopt;
    }
  }
  return parse_int64(std::string_view{text}.substr(0, dot));
}

}  // namespace crec::core
