#include "crec/app/engine_handle.h"

#include <exception>
#include <utility>

namespace crec::app {

EngineHandle::EngineHandle(Loader loader) : loader_(std::move(loader)) {}

EngineHandle::EngineHandle(ingest::LoadOptions options, recommend::RecommenderConfig config)
    : loader_([options = std::move(options), config]() {
        return load_recommender(options, config);
      }) {}

InstanceResult EngineHandle::get() const {
  std::call_once(once_, [this]() {
    std::shared_ptr<const RecommenderInstance> instance;
    std::string error;
    try {
      auto result = loader_();
      if (result.has_value()) {
        instance = result.value();
      } else {
        error = result.error();
      }
    } catch (const std::exception& e) {
      // std::bad_alloc on an oversized artifact surfaces as an ordinary load error.
      error = std::string("load failed: ") + e.what();
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    instance_ = std::move(instance);
    error_ = std::move(error);
    attempted_ = true;
  });

  std::lock_guard<std::mutex> lock(state_mutex_);
  if (instance_) {
    return InstanceResult::ok(instance_);
  }
  return InstanceResult::err(error_);
}

bool EngineHandle::attempted() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return attempted_;
}

}  // namespace crec::app
