#include "crec/app/app_service.h"

#include "crec/core/version.h"

namespace crec::app {

using json = nlohmann::json;

domain::RecommendationList run_recommend(const RecommendRequest& req,
                                         const RecommenderInstance& instance) {
  return instance.engine().recommend(req.user_id, req.top_n);
}

SimilarResponse run_similar(const SimilarRequest& req, const RecommenderInstance& instance) {
  const auto& services = instance.services();

  SimilarResponse response;
  response.item_id = req.item_id;
  response.known_item = services.embeddings.row_of(req.item_id).has_value();

  for (const auto& neighbor : services.similarity.neighbors_of(req.item_id, req.k)) {
    response.similar.push_back(
        SimilarItem{services.catalog.info_of(neighbor.item_id), neighbor.score});
  }
  return response;
}

json similar_response_to_json(const SimilarResponse& response) {
  json items = json::array();
  for (const auto& s : response.similar) {
    json entry = domain::item_info_to_json(s.item);
    entry["similarity"] = s.similarity;
    items.push_back(std::move(entry));
  }

  json j;
  j["article_id"] = response.item_id.value;
  j["known_item"] = response.known_item;
  j["similar"] = std::move(items);
  j["count"] = response.similar.size();
  return j;
}

HistoryResponse fetch_history(const core::UserId& user_id, const RecommenderInstance& instance) {
  const auto& services = instance.services();

  HistoryResponse response;
  response.user_id = user_id;
  for (const auto& item_id : services.interactions.history_of(user_id)) {
    response.items.push_back(services.catalog.info_of(item_id));
  }
  return response;
}

json history_response_to_json(const HistoryResponse& response) {
  json items = json::array();
  for (const auto& info : response.items) {
    items.push_back(domain::item_info_to_json(info));
  }

  json j;
  j["user_id"] = response.user_id.value;
  j["history"] = std::move(items);
  j["count"] = response.items.size();
  return j;
}

UsersResponse list_users(std::size_t limit, const RecommenderInstance& instance) {
  const auto& interactions = instance.services().interactions;
  return UsersResponse{interactions.sample_user_ids(limit), !interactions.has_real_users()};
}

json users_response_to_json(const UsersResponse& response) {
  json ids = json::array();
  for (const auto& id : response.user_ids) {
    ids.push_back(id.value);
  }

  json j;
  j["user_ids"] = std::move(ids);
  j["count"] = response.user_ids.size();
  j["placeholder"] = response.placeholder;
  return j;
}

json stats_to_json(const RecommenderInstance& instance) {
  const auto& report = instance.load_report();
  const auto& services = instance.services();
  const auto& config = instance.engine().config();

  json j;
  j["version"] = core::kBuildVersion;
  j["embeddings"] = {
      {"path", report.embeddings_path},
      {"layout", std::string(vector::to_string(report.embedding_layout))},
      {"items", services.embeddings.size()},
      {"dimension", services.embeddings.dim()},
  };
  j["catalog"] = {{"items", services.catalog.size()}};
  j["interactions"] = {
      {"events", services.interactions.size()},
      {"users", services.interactions.user_count()},
      {"files_loaded", report.click_files_loaded},
      {"files_skipped", report.click_files_skipped},
  };
  j["config"] = {
      {"recency_cap", config.recency_cap},
      {"candidate_breadth", config.candidate_breadth},
  };
  j["warnings"] = report.warnings;
  return j;
}

json health_json() { return json{{"status", "healthy"}}; }

}  // namespace crec::app
