// Repository: MediaForge
// Component: CDN publish interface
// Purpose: Moves a finished local file to its public origin and returns the URL.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_STORAGE_I_OBJECT_PUBLISHER_HPP_
#define MEDIAFORGE_STORAGE_I_OBJECT_PUBLISHER_HPP_

#include <string>

namespace mediaforge::storage {

class IObjectPublisher {
 public:
  virtual ~IObjectPublisher() = default;

  // Throws std::runtime_error if the file cannot be published.
  virtual std::string Upload(const std::string& local_file,
                             const std::string& destination_key) = 0;
};

}  // namespace mediaforge::storage

#endif  // MEDIAFORGE_STORAGE_I_OBJECT_PUBLISHER_HPP_
