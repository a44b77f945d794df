// Repository: MediaForge
// Component: Directory-backed CDN origin
// Purpose: Copies published files under publish_root; URLs are
//          public_base_url + "/" + destination_key.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_STORAGE_LOCAL_OBJECT_PUBLISHER_HPP_
#define MEDIAFORGE_STORAGE_LOCAL_OBJECT_PUBLISHER_HPP_

#include <string>

#include "mediaforge/storage/IObjectPublisher.hpp"

namespace mediaforge::storage {

class LocalObjectPublisher : public IObjectPublisher {
 public:
  LocalObjectPublisher(std::string publish_root, std::string public_base_url);

  std::string Upload(const std::string& local_file,
                     const std::string& destination_key) override;

  // Filesystem path a key is published to.
  std::string PathFor(const std::string& destination_key) const;

 private:
  std::string publish_root_;
  std::string public_base_url_;
};

}  // namespace mediaforge::storage

#endif  // MEDIAFORGE_STORAGE_LOCAL_OBJECT_PUBLISHER_HPP_
