#include "query_handlers.h"

#include "crec/app/app_service.h"
#include "crec/core/ids.h"
#include "crec/domain/recommendation.h"

#include "../rpc_params.h"
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>

namespace crec::rpc::handlers {

using json = nlohmann::json;

namespace {

using Instance = std::shared_ptr<const app::RecommenderInstance>;

MethodResult invalid_params(const std::string& message) {
  return MethodResult::fail(kInvalidParams, message);
}

// Resolves the engine through the single-flight handle. The first data request loads it.
std::optional<MethodResult> acquire_engine(ServerContext& ctx, Instance& out) {
  auto loaded = ctx.engine.get();
  if (!loaded.has_value()) {
    return MethodResult::fail(kInternalError, "Recommendation engine unavailable",
                              {{"detail", loaded.error()}});
  }
  out = loaded.value();
  return std::nullopt;
}

std::optional<MethodResult> require_object_params(const JsonRpcRequest& req) {
  if (!req.params.is_object()) {
    return invalid_params("params must be an object");
  }
  return std::nullopt;
}

// Reads an optional non-negative count, falling back to default_value.
std::optional<MethodResult> read_count(const json& params, const std::string& name,
                                       std::size_t default_value, std::size_t& out) {
  auto param = integer_param(params, name);
  if (!param.has_value()) {
    return invalid_params(param.error());
  }
  if (!param.value().has_value()) {
    out = default_value;
    return std::nullopt;
  }
  if (*param.value() < 0) {
    return invalid_params(name + " must be non-negative");
  }
  out = static_cast<std::size_t>(*param.value());
  return std::nullopt;
}

std::optional<MethodResult> read_required_id(const json& params, const std::string& name,
                                             std::int64_t& out) {
  auto param = integer_param(params, name);
  if (!param.has_value()) {
    return invalid_params(param.error());
  }
  if (!param.value().has_value()) {
    return invalid_params(name + " is required");
  }
  out = *param.value();
  return std::nullopt;
}

}  // namespace

MethodResult handle_health(const JsonRpcRequest& /*req*/, ServerContext& /*ctx*/) {
  return MethodResult::ok(app::health_json());
}

MethodResult handle_recommend(const JsonRpcRequest& req, ServerContext& ctx) {
  if (auto failure = require_object_params(req)) {
    return *failure;
  }

  std::int64_t user_id = 0;
  if (auto failure = read_required_id(req.params, "user_id", user_id)) {
    return *failure;
  }

  auto top_n = integer_param(req.params, "top_n");
  if (!top_n.has_value()) {
    return invalid_params(top_n.error());
  }
  // Out-of-range values saturate; anything <= 0 asks for an empty list.
  const std::int64_t requested = top_n.value().value_or(5);
  const int n = requested > std::numeric_limits<int>::max() ? std::numeric_limits<int>::max()
                : requested < 0                             ? 0
                                                            : static_cast<int>(requested);

  Instance instance;
  if (auto failure = acquire_engine(ctx, instance)) {
    return *failure;
  }

  const auto list = app::run_recommend(app::RecommendRequest{core::UserId{user_id}, n}, *instance);
  return MethodResult::ok(domain::recommendation_list_to_json(list));
}

MethodResult handle_similar(const JsonRpcRequest& req, ServerContext& ctx) {
  if (auto failure = require_object_params(req)) {
    return *failure;
  }

  std::int64_t item_id = 0;
  if (auto failure = read_required_id(req.params, "item_id", item_id)) {
    return *failure;
  }
  std::size_t k = 0;
  if (auto failure = read_count(req.params, "k", 10, k)) {
    return *failure;
  }

  Instance instance;
  if (auto failure = acquire_engine(ctx, instance)) {
    return *failure;
  }

  const auto response =
      app::run_similar(app::SimilarRequest{core::ItemId{item_id}, k}, *instance);
  return MethodResult::ok(app::similar_response_to_json(response));
}

MethodResult handle_history(const JsonRpcRequest& req, ServerContext& ctx) {
  if (auto failure = require_object_params(req)) {
    return *failure;
  }

  std::int64_t user_id = 0;
  if (auto failure = read_required_id(req.params, "user_id", user_id)) {
    return *failure;
  }

  Instance instance;
  if (auto failure = acquire_engine(ctx, instance)) {
    return *failure;
  }

  return MethodResult::ok(
      app::history_response_to_json(app::fetch_history(core::UserId{user_id}, *instance)));
}

MethodResult handle_users(const JsonRpcRequest& req, ServerContext& ctx) {
  if (auto failure = require_object_params(req)) {
    return *failure;
  }

  std::size_t limit = 0;
  if (auto failure = read_count(req.params, "limit", 100, limit)) {
    return *failure;
  }

  Instance instance;
  if (auto failure = acquire_engine(ctx, instance)) {
    return *failure;
  }

  return MethodResult::ok(app::users_response_to_json(app::list_users(limit, *instance)));
}

MethodResult handle_stats(const JsonRpcRequest& /*req*/, ServerContext& ctx) {
  Instance instance;
  if (auto failure = acquire_engine(ctx, instance)) {
    return *failure;
  }
  return MethodResult::ok(app::stats_to_json(*instance));
}

}  // namespace crec::rpc::handlers
