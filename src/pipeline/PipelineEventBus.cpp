// Repository: MediaForge
// Component: Pipeline event bus
// Copyright (c) 2026 MediaForge

#include "mediaforge/pipeline/PipelineEventBus.hpp"

#include <vector>

#include "mediaforge/util/Logger.hpp"

namespace mediaforge::pipeline {

PipelineEventBus::SubscriberId PipelineEventBus::Subscribe(Callback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  const SubscriberId id = next_id_++;
  subscribers_.emplace(id, std::move(callback));
  return id;
}

bool PipelineEventBus::Unsubscribe(SubscriberId id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.erase(id) != 0;
}

void PipelineEventBus::Publish(const PipelineEvent& event) {
  std::vector<Callback> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets.reserve(subscribers_.size());
    for (const auto& [id, callback] : subscribers_) targets.push_back(callback);
  }
  for (const auto& callback : targets) {
    try {
      callback(event);
    } catch (const std::exception& e) {
      util::Logger::Error(std::string("[PipelineEventBus] Subscriber threw on ") +
                          ToString(event.type) + ": " + e.what());
    }
  }
}

std::size_t PipelineEventBus::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

}  // namespace mediaforge::pipeline
