#pragma once

#include "crec/app/recommender_instance.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace crec::app {

// EngineHandle provides single-flight, load-once access to a RecommenderInstance.
//
// The first get() runs the loader; concurrent first callers block until that one load
// finishes and then observe its outcome. A failed load is remembered and returned to
// every later caller: there is no retry and no mid-lifetime reload. A fresh handle is
// the only reset.
class EngineHandle {
 public:
  using Loader = std::function<InstanceResult()>;

  explicit EngineHandle(Loader loader);

  // Convenience: a handle that loads options.data_dir with config.
  EngineHandle(ingest::LoadOptions options, recommend::RecommenderConfig config);

  EngineHandle(const EngineHandle&) = delete;
  EngineHandle& operator=(const EngineHandle&) = delete;
  EngineHandle(EngineHandle&&) = delete;
  EngineHandle& operator=(EngineHandle&&) = delete;
  ~EngineHandle() = default;

  [[nodiscard]] InstanceResult get() const;

  // True once a load has been attempted, successfully or not.
  [[nodiscard]] bool attempted() const;

 private:
  Loader loader_;
  mutable std::once_flag once_;
  mutable std::mutex state_mutex_;
  mutable std::shared_ptr<const RecommenderInstance> instance_;
  mutable std::string error_;
  mutable bool attempted_ = false;
};

}  // namespace crec::app
