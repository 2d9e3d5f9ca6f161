#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

#include "crec/app/engine_handle.h"

#include "data_dir_fixture.h"
#include "rec_server/rpc_protocol.h"
#include "rec_server/server_context.h"
#include "rec_server/server_loop.h"
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

using namespace crec;
using json = nlohmann::json;
using crec::testing::TempDataDir;

namespace {

// Feeds request lines through the loop and returns one parsed response per output line.
std::vector<json> run_lines(const app::EngineHandle& engine, const std::string& input) {
  rpc::ServerContext ctx{engine};
  std::istringstream in(input);
  std::ostringstream out;
  std::ostringstream log;
  rpc::run_server_loop(ctx, in, out, log);

  std::vector<json> responses;
  std::istringstream lines(out.str());
  std::string line;
  while (std::getline(lines, line)) {
    responses.push_back(json::parse(line));
  }
  return responses;
}

app::EngineHandle::Loader sample_loader(const TempDataDir& dir, int& calls) {
  return [&dir, &calls]() {
    ++calls;
    return app::load_recommender(ingest::LoadOptions{dir.str(), 10},
                                 recommend::RecommenderConfig{});
  };
}

int error_code(const json& response) { return response.at("error").at("code").get<int>(); }

}  // namespace

TEST_CASE("Server answers health without loading the engine", "[rpc][server]") {
  int calls = 0;
  const app::EngineHandle engine([&calls]() {
    ++calls;
    return app::InstanceResult::err("should not load");
  });

  const auto responses = run_lines(engine, R"({"jsonrpc":"2.0","id":1,"method":"health"})"
                                           "\n");
  REQUIRE(responses.size() == 1);
  CHECK(responses[0].at("id").get<int>() == 1);
  CHECK(responses[0].at("result").at("status").get<std::string>() == "healthy");
  CHECK(calls == 0);
  CHECK_FALSE(engine.attempted());
}

TEST_CASE("Server serves recommend and loads the engine once", "[rpc][server]") {
  TempDataDir dir("server_recommend");
  crec::testing::write_sample_artifacts(dir);
  int calls = 0;
  const app::EngineHandle engine(sample_loader(dir, calls));

  const auto responses = run_lines(
      engine,
      R"({"jsonrpc":"2.0","id":1,"method":"recommend","params":{"user_id":42,"top_n":1}})"
      "\n"
      R"({"jsonrpc":"2.0","id":2,"method":"recommend","params":{"user_id":"42","top_n":"1"}})"
      "\n"
      "\n"
      R"({"jsonrpc":"2.0","id":3,"method":"recommend","params":{"user_id":42}})"
      "\n");

  REQUIRE(responses.size() == 3);
  CHECK(calls == 1);

  const auto& first = responses[0].at("result");
  CHECK(first.at("user_id").get<std::int64_t>() == 42);
  CHECK(first.at("count").get<std::size_t>() == 1);
  CHECK(first.at("recommendations")[0].at("article_id").get<std::int64_t>() == 2);
  CHECK(responses[1].at("result").dump() == first.dump());

  // top_n defaults to 5; user 42 has four unseen items.
  CHECK(responses[2].at("result").at("count").get<std::size_t>() == 4);
}

TEST_CASE("Server serves similar, history, users and stats", "[rpc][server]") {
  TempDataDir dir("server_queries");
  crec::testing::write_sample_artifacts(dir);
  int calls = 0;
  const app::EngineHandle engine(sample_loader(dir, calls));

  const auto responses = run_lines(
      engine,
      R"({"id":1,"method":"similar","params":{"item_id":1,"k":2}})"
      "\n"
      R"({"id":2,"method":"history","params":{"user_id":7}})"
      "\n"
      R"({"id":3,"method":"users","params":{"limit":1}})"
      "\n"
      R"({"id":4,"method":"stats"})"
      "\n");

  REQUIRE(responses.size() == 4);
  CHECK(responses[0].at("result").at("similar")[0].at("article_id").get<std::int64_t>() == 2);
  CHECK(responses[1].at("result").at("history")[0].at("article_id").get<std::int64_t>() == 4);
  CHECK(responses[2].at("result").at("user_ids").size() == 1);
  CHECK(responses[3].at("result").at("catalog").at("items").get<std::size_t>() == 5);
  CHECK(calls == 1);
}

TEST_CASE("Server rejects invalid params with -32602", "[rpc][server]") {
  int calls = 0;
  const app::EngineHandle engine([&calls]() {
    ++calls;
    return app::InstanceResult::err("not reached");
  });

  const auto responses = run_lines(
      engine,
      R"({"id":1,"method":"recommend","params":{}})"
      "\n"
      R"({"id":2,"method":"recommend","params":{"user_id":"abc"}})"
      "\n"
      R"({"id":3,"method":"recommend","params":{"user_id":1,"top_n":2.5}})"
      "\n"
      R"({"id":4,"method":"similar","params":{"item_id":1,"k":-1}})"
      "\n"
      R"({"id":5,"method":"history","params":[1]})"
      "\n");

  REQUIRE(responses.size() == 5);
  for (const auto& response : responses) {
    CHECK(error_code(response) == rpc::kInvalidParams);
  }
  CHECK(calls == 0);
}

TEST_CASE("Server reports protocol errors", "[rpc][server]") {
  const app::EngineHandle engine([]() { return app::InstanceResult::err("unused"); });

  const auto responses = run_lines(engine,
                                   "{broken\n"
                                   R"({"id":9,"method":"explode"})"
                                   "\n"
                                   R"({"id":10})"
                                   "\n");

  REQUIRE(responses.size() == 3);
  CHECK(error_code(responses[0]) == rpc::kParseError);
  CHECK(responses[0].at("id").is_null());
  CHECK(error_code(responses[1]) == rpc::kMethodNotFound);
  CHECK(responses[1].at("id").get<int>() == 9);
  CHECK(error_code(responses[2]) == rpc::kInvalidRequest);
  CHECK(responses[2].at("id").get<int>() == 10);
}

TEST_CASE("Server reports an unavailable engine with -32603 on every data request",
          "[rpc][server]") {
  int calls = 0;
  const app::EngineHandle engine([&calls]() {
    ++calls;
    return app::InstanceResult::err("embeddings artifact not found");
  });

  const auto responses = run_lines(engine,
                                   R"({"id":1,"method":"recommend","params":{"user_id":1}})"
                                   "\n"
                                   R"({"id":2,"method":"stats"})"
                                   "\n"
                                   R"({"id":3,"method":"health"})"
                                   "\n");

  REQUIRE(responses.size() == 3);
  CHECK(error_code(responses[0]) == rpc::kInternalError);
  CHECK(responses[0].at("error").at("data").at("detail").get<std::string>() ==
        "embeddings artifact not found");
  CHECK(error_code(responses[1]) == rpc::kInternalError);
  CHECK(responses[2].at("result").at("status").get<std::string>() == "healthy");
  CHECK(calls == 1);
}
