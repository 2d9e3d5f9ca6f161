#include "crec/core/normalization.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>

using namespace crec::core;

TEST_CASE("trim strips ASCII whitespace at both ends", "[normalization]") {
  CHECK(trim("  abc \r\n") == "abc");
  CHECK(trim("\t\t") == "");
  CHECK(trim("") == "");
  CHECK(trim("a b") == "a b");
}

TEST_CASE("parse_int64 accepts only whole base-10 integers", "[normalization]") {
  CHECK(parse_int64("42") == 42);
  CHECK(parse_int64(" -17 ") == -17);
  CHECK(parse_int64("+5") == 5);
  CHECK(parse_int64("9223372036854775807") == INT64_MAX);

  CHECK_FALSE(parse_int64("").has_value());
  CHECK_FALSE(parse_int64("12abc").has_value());
  CHECK_FALSE(parse_int64("1.5").has_value());
  CHECK_FALSE(parse_int64("42.0").has_value());
  CHECK_FALSE(parse_int64("9223372036854775808").has_value());
}

TEST_CASE("parse_int64_lenient also accepts integral decimal spellings", "[normalization]") {
  CHECK(parse_int64_lenient("42") == 42);
  CHECK(parse_int64_lenient("42.0") == 42);
  CHECK(parse_int64_lenient("42.000") == 42);
  CHECK(parse_int64_lenient("42.") == 42);

  CHECK_FALSE(parse_int64_lenient("42.5").has_value());
  CHECK_FALSE(parse_int64_lenient(".0").has_value());
  CHECK_FALSE(parse_int64_lenient("nan").has_value());
}
