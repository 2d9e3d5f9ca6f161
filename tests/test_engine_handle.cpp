#include "crec/app/engine_handle.h"

#include <catch2/catch_test_macros.hpp>

#include "data_dir_fixture.h"
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace crec::app;
using crec::testing::TempDataDir;

TEST_CASE("EngineHandle loads once and shares the instance", "[app][handle]") {
  TempDataDir dir("handle_once");
  crec::testing::write_sample_artifacts(dir);

  std::atomic<int> calls{0};
  EngineHandle handle([&]() {
    ++calls;
    return load_recommender(crec::ingest::LoadOptions{dir.str(), 10},
                            crec::recommend::RecommenderConfig{});
  });
  CHECK_FALSE(handle.attempted());

  std::vector<std::thread> threads;
  std::vector<const RecommenderInstance*> seen(8, nullptr);
  for (std::size_t i = 0; i < seen.size(); ++i) {
    threads.emplace_back([&, i]() {
      auto result = handle.get();
      if (result.has_value()) {
        seen[i] = result.value().get();
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  CHECK(calls.load() == 1);
  CHECK(handle.attempted());
  REQUIRE(seen[0] != nullptr);
  for (const auto* instance : seen) {
    CHECK(instance == seen[0]);
  }
}

TEST_CASE("EngineHandle remembers a failed load", "[app][handle]") {
  int calls = 0;
  EngineHandle handle([&]() {
    ++calls;
    return InstanceResult::err("boom");
  });

  auto first = handle.get();
  auto second = handle.get();
  REQUIRE_FALSE(first.has_value());
  REQUIRE_FALSE(second.has_value());
  CHECK(first.error() == "boom");
  CHECK(second.error() == "boom");
  CHECK(calls == 1);
}

TEST_CASE("EngineHandle reports a throwing loader as an error", "[app][handle]") {
  EngineHandle handle([]() -> InstanceResult { throw std::runtime_error("disk on fire"); });

  auto result = handle.get();
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().find("disk on fire") != std::string::npos);
  CHECK(handle.attempted());
}

TEST_CASE("EngineHandle loads a data directory from options", "[app][handle]") {
  TempDataDir dir("handle_options");
  crec::testing::write_sample_artifacts(dir);

  EngineHandle handle(crec::ingest::LoadOptions{dir.str(), 10},
                      crec::recommend::RecommenderConfig{3, 7});
  auto result = handle.get();
  REQUIRE(result.has_value());
  CHECK(result.value()->engine().config().recency_cap == 3);
  CHECK(result.value()->engine().config().candidate_breadth == 7);
  CHECK(result.value()->load_report().catalog_size == 5);
}
