#include "crec/app/recommender_instance.h"

#include <utility>

namespace crec::app {

RecommenderInstance::RecommenderInstance(ingest::LoadedArtifacts artifacts,
                                         recommend::RecommenderConfig config)
    : artifacts_(std::move(artifacts)),
      index_(artifacts_.embeddings),
      services_(artifacts_.embeddings, artifacts_.catalog, artifacts_.interactions, index_),
      engine_(services_, config) {}

InstanceResult load_recommender(const ingest::LoadOptions& options,
                                recommend::RecommenderConfig config) {
  auto loaded = ingest::load_artifacts(options);
  if (!loaded.has_value()) {
    return InstanceResult::err(loaded.error());
  }
  std::shared_ptr<const RecommenderInstance> instance =
      std::make_shared<RecommenderInstance>(std::move(loaded.value()), config);
  return InstanceResult::ok(std::move(instance));
}

}  // namespace crec::app
