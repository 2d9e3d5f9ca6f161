#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "rec_server/rpc_params.h"
#include <cstdint>

using namespace crec::rpc;
using json = nlohmann::json;

TEST_CASE("integer_param accepts JSON integers and decimal strings", "[rpc][params]") {
  const json params = {{"a", 42}, {"b", "17"}, {"c", " -3 "}, {"d", 9007199254740993LL}};

  CHECK(integer_param(params, "a").value() == 42);
  CHECK(integer_param(params, "b").value() == 17);
  CHECK(integer_param(params, "c").value() == -3);
  CHECK(integer_param(params, "d").value() == 9007199254740993LL);
}

TEST_CASE("integer_param treats absent and null as missing", "[rpc][params]") {
  const json params = {{"n", nullptr}};

  auto absent = integer_param(params, "x");
  REQUIRE(absent.has_value());
  CHECK_FALSE(absent.value().has_value());

  auto null_value = integer_param(params, "n");
  REQUIRE(null_value.has_value());
  CHECK_FALSE(null_value.value().has_value());
}

TEST_CASE("integer_param rejects non-integers", "[rpc][params]") {
  const json params = {{"f", 4.2},        {"whole_float", 4.0}, {"s", "4.2"}, {"w", "abc"},
                       {"b", true},       {"arr", json::array({1})},
                       {"big", 18446744073709551615ULL}};

  for (const char* name : {"f", "whole_float", "s", "w", "b", "arr", "big"}) {
    INFO("param " << name);
    auto result = integer_param(params, name);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().find(name) != std::string::npos);
  }
}
