#include "crec/ingest/clicks_reader.h"

#include <catch2/catch_test_macros.hpp>

#include "data_dir_fixture.h"
#include <filesystem>
#include <string>

using namespace crec::ingest;
using crec::core::ItemId;
using crec::core::UserId;
using crec::testing::TempDataDir;

TEST_CASE("interaction_events_from_table reads the click log columns", "[ingest][clicks]") {
  auto table = parse_csv(
      "user_id,session_id,session_start,session_size,click_article_id,click_timestamp\n"
      "0,1506825423271737,1506825423000,2,157541,1506826828020\n"
      "0,1506825423271737,1506825423000,2,68866,1506826858020\n");
  REQUIRE(table.has_value());

  auto events = interaction_events_from_table(table.value());
  REQUIRE(events.has_value());
  REQUIRE(events.value().size() == 2);
  CHECK(events.value()[0].user_id == UserId{0});
  CHECK(events.value()[0].item_id == ItemId{157541});
  CHECK(events.value()[1].click_timestamp == 1506826858020);
}

TEST_CASE("interaction_events_from_table accepts alternate item columns", "[ingest][clicks]") {
  auto table = parse_csv("user_id,article_id\n3,9\n");
  REQUIRE(table.has_value());

  auto events = interaction_events_from_table(table.value());
  REQUIRE(events.has_value());
  REQUIRE(events.value().size() == 1);
  CHECK(events.value()[0].item_id == ItemId{9});
  CHECK_FALSE(events.value()[0].click_timestamp.has_value());
}

TEST_CASE("interaction_events_from_table rejects unusable tables", "[ingest][clicks]") {
  SECTION("no user column") {
    auto table = parse_csv("click_article_id\n1\n");
    REQUIRE(table.has_value());
    CHECK_FALSE(interaction_events_from_table(table.value()).has_value());
  }
  SECTION("no item column") {
    auto table = parse_csv("user_id,session_id\n1,2\n");
    REQUIRE(table.has_value());
    CHECK_FALSE(interaction_events_from_table(table.value()).has_value());
  }
  SECTION("non-integer id") {
    auto table = parse_csv("user_id,click_article_id\nbob,2\n");
    REQUIRE(table.has_value());
    CHECK_FALSE(interaction_events_from_table(table.value()).has_value());
  }
}

TEST_CASE("discover_click_files lists clicks/*.csv by name, capped", "[ingest][clicks]") {
  TempDataDir dir("discover_clicks");
  dir.write("clicks/clicks_hour_002.csv", "user_id,click_article_id\n");
  dir.write("clicks/clicks_hour_000.csv", "user_id,click_article_id\n");
  dir.write("clicks/clicks_hour_001.csv", "user_id,click_article_id\n");
  dir.write("clicks/readme.txt", "not a log");
  dir.write("clicks_hour_999.csv", "user_id,click_article_id\n");

  const auto files = discover_click_files(dir.str(), 2);
  REQUIRE(files.size() == 2);
  CHECK(std::filesystem::path(files[0]).filename().string() == "clicks_hour_000.csv");
  CHECK(std::filesystem::path(files[1]).filename().string() == "clicks_hour_001.csv");

  CHECK(discover_click_files(dir.str(), 10).size() == 3);
  CHECK(discover_click_files(dir.str(), 0).empty());
}

TEST_CASE("discover_click_files falls back to root-level clicks_hour files",
          "[ingest][clicks]") {
  TempDataDir dir("discover_clicks_root");
  dir.write("clicks_hour_001.csv", "user_id,click_article_id\n");
  dir.write("clicks_hour_000.csv", "user_id,click_article_id\n");
  dir.write("articles_metadata.csv", "article_id\n");

  const auto files = discover_click_files(dir.str(), 10);
  REQUIRE(files.size() == 2);
  CHECK(std::filesystem::path(files[0]).filename().string() == "clicks_hour_000.csv");

  CHECK(discover_click_files((dir.path() / "missing").string(), 10).empty());
}

TEST_CASE("discover_click_files falls back when clicks/ holds no csv files",
          "[ingest][clicks]") {
  TempDataDir dir("discover_clicks_no_csv");
  dir.write("clicks/readme.txt", "not a log");
  dir.write("clicks_hour_000.csv", "user_id,click_article_id\n");

  const auto files = discover_click_files(dir.str(), 10);
  REQUIRE(files.size() == 1);
  CHECK(std::filesystem::path(files[0]).filename().string() == "clicks_hour_000.csv");
}
