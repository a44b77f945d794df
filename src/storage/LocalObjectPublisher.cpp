// Repository: MediaForge
// Component: Directory-backed CDN origin implementation
// Copyright (c) 2026 MediaForge

#include "mediaforge/storage/LocalObjectPublisher.hpp"

#include <stdexcept>

#include "mediaforge/util/FileUtil.hpp"

namespace mediaforge::storage {

LocalObjectPublisher::LocalObjectPublisher(std::string publish_root,
                                           std::string public_base_url)
    : publish_root_(std::move(publish_root)),
      public_base_url_(std::move(public_base_url)) {
  while (!public_base_url_.empty() && public_base_url_.back() == '/') {
    public_base_url_.pop_back();
  }
}

std::string LocalObjectPublisher::Upload(const std::string& local_file,
                                         const std::string& destination_key) {
  if (destination_key.empty() || destination_key.find("..") != std::string::npos) {
    throw std::runtime_error("invalid destination key: " + destination_key);
  }
  util::CopyFile(local_file, PathFor(destination_key));
  return util::JoinPath(public_base_url_, destination_key);
}

std::string LocalObjectPublisher::PathFor(const std::string& destination_key) const {
  return util::JoinPath(publish_root_, destination_key);
}

}  // namespace mediaforge::storage
