#pragma once

#include "../method_handlers.h"

namespace crec::rpc::handlers {

// health: {} -> {"status": "healthy"}. Never loads the engine.
MethodResult handle_health(const JsonRpcRequest& req, ServerContext& ctx);

// recommend: {user_id, top_n = 5} -> {user_id, recommendations, count}.
// top_n <= 0 is valid and yields an empty list.
MethodResult handle_recommend(const JsonRpcRequest& req, ServerContext& ctx);

// similar: {item_id, k = 10} -> {article_id, known_item, similar, count}.
MethodResult handle_similar(const JsonRpcRequest& req, ServerContext& ctx);

// history: {user_id} -> {user_id, history, count}.
MethodResult handle_history(const JsonRpcRequest& req, ServerContext& ctx);

// users: {limit = 100} -> {user_ids, count, placeholder}.
MethodResult handle_users(const JsonRpcRequest& req, ServerContext& ctx);

// stats: {} -> loaded data summary.
MethodResult handle_stats(const JsonRpcRequest& req, ServerContext& ctx);

}  // namespace crec::rpc::handlers
