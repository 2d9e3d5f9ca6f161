#pragma once

#include "crec/core/result.h"
#include "crec/core/services.h"
#include "crec/ingest/data_loader.h"
#include "crec/recommend/recommendation_engine.h"
#include "crec/vector/exact_cosine_index.h"

#include <memory>
#include <string>

namespace crec::app {

// RecommenderInstance owns everything one load produced: the artifacts, the similarity
// index over them, the Services view, and the engine. It is immutable after
// construction and is shared by reference with every request handler.
//
// Members reference each other (index → embeddings, services → artifacts,
// engine → services), so the instance is pinned: no copy, no move.
class RecommenderInstance {
 public:
  RecommenderInstance(ingest::LoadedArtifacts artifacts, recommend::RecommenderConfig config);

  RecommenderInstance(const RecommenderInstance&) = delete;
  RecommenderInstance& operator=(const RecommenderInstance&) = delete;
  RecommenderInstance(RecommenderInstance&&) = delete;
  RecommenderInstance& operator=(RecommenderInstance&&) = delete;
  ~RecommenderInstance() = default;

  [[nodiscard]] const core::Services& services() const { return services_; }
  [[nodiscard]] const recommend::RecommendationEngine& engine() const { return engine_; }
  [[nodiscard]] const ingest::LoadReport& load_report() const { return artifacts_.report; }

 private:
  ingest::LoadedArtifacts artifacts_;
  vector::ExactCosineIndex index_;
  core::Services services_;
  recommend::RecommendationEngine engine_;
};

using InstanceResult = core::Result<std::shared_ptr<const RecommenderInstance>, std::string>;

// load_recommender loads a data directory and builds an instance over it.
[[nodiscard]] InstanceResult load_recommender(const ingest::LoadOptions& options,
                                              recommend::RecommenderConfig config);

}  // namespace crec::app
