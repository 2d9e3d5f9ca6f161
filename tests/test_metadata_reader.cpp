#include "crec/ingest/metadata_reader.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace crec::ingest;
using crec::core::ItemId;

TEST_CASE("catalog_records_from_table reads known columns and ignores the rest",
          "[ingest][metadata]") {
  auto table = parse_csv(
      "article_id,category_id,created_at_ts,publisher_id,words_count\n"
      "0,0,1513144419000,0,168\n"
      "1,1,1405341936000,0,189\n");
  REQUIRE(table.has_value());

  auto records = catalog_records_from_table(table.value());
  REQUIRE(records.has_value());
  REQUIRE(records.value().size() == 2);
  CHECK(records.value()[1].item_id == ItemId{1});
  CHECK(records.value()[1].category_id == 1);
  CHECK(records.value()[1].word_count == 189);
  CHECK_FALSE(records.value()[1].title.has_value());
}

TEST_CASE("catalog_records_from_table records unparseable optional cells as absent",
          "[ingest][metadata]") {
  auto table = parse_csv(
      "article_id,title,category_id,words_count\n"
      "5.0,  ,n/a,\n"
      "6,Six,7.0,12\n");
  REQUIRE(table.has_value());

  auto records = catalog_records_from_table(table.value());
  REQUIRE(records.has_value());
  REQUIRE(records.value().size() == 2);

  const auto& sparse = records.value()[0];
  CHECK(sparse.item_id == ItemId{5});
  CHECK_FALSE(sparse.title.has_value());
  CHECK_FALSE(sparse.category_id.has_value());
  CHECK_FALSE(sparse.word_count.has_value());

  const auto& full = records.value()[1];
  CHECK(full.title == std::string("Six"));
  CHECK(full.category_id == 7);
}

TEST_CASE("catalog_records_from_table fails without a usable id column",
          "[ingest][metadata]") {
  SECTION("missing column") {
    auto table = parse_csv("id,title\n1,x\n");
    REQUIRE(table.has_value());
    auto records = catalog_records_from_table(table.value());
    REQUIRE_FALSE(records.has_value());
    CHECK(records.error().find("article_id") != std::string::npos);
  }

  SECTION("non-integer id") {
    auto table = parse_csv("article_id\nabc\n");
    REQUIRE(table.has_value());
    CHECK_FALSE(catalog_records_from_table(table.value()).has_value());
  }
}
