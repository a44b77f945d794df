// Repository: MediaForge
// Component: Pipeline event bus
// Purpose: Explicit observer registration for pipeline events. Owned by
//          whoever builds the coordinator; no global state.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_PIPELINE_PIPELINE_EVENT_BUS_HPP_
#define MEDIAFORGE_PIPELINE_PIPELINE_EVENT_BUS_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

#include "mediaforge/pipeline/PipelineEvents.hpp"

namespace mediaforge::pipeline {

class PipelineEventBus {
 public:
  using SubscriberId = uint64_t;
  using Callback = std::function<void(const PipelineEvent&)>;

  SubscriberId Subscribe(Callback callback);
  // False if the id is unknown.
  bool Unsubscribe(SubscriberId id);

  // Calls every subscriber on the publishing thread, outside the bus lock.
  // A subscriber that throws is logged and skipped.
  void Publish(const PipelineEvent& event);

  std::size_t SubscriberCount() const;

 private:
  mutable std::mutex mutex_;
  SubscriberId next_id_ = 1;
  std::map<SubscriberId, Callback> subscribers_;
};

}  // namespace mediaforge::pipeline

#endif  // MEDIAFORGE_PIPELINE_PIPELINE_EVENT_BUS_HPP_
