// Repository: MediaForge
// Component: Quality preset catalog
// Copyright (c) 2026 MediaForge

#include "mediaforge/transcode/QualityPresets.hpp"

namespace mediaforge::transcode {

const std::vector<QualityPreset>& AllQualityPresets() {
  //                                 key      label            w     h    vkbps  akbps  max    buf    fps
  static const std::vector<QualityPreset> kPresets = {
      {"4k", "4K UHD", 3840, 2160, 20000, 320, 25000, 50000, 60},
      {"1080p", "1080p Full HD", 1920, 1080, 8000, 192, 10000, 20000, 60},
      {"720p", "720p HD", 1280, 720, 5000, 128, 6000, 12000, 30},
      {"480p", "480p SD", 854, 480, 2500, 128, 3000, 6000, 30},
      {"360p", "360p", 640, 360, 1000, 96, 1500, 3000, 30},
      {"240p", "240p", 426, 240, 500, 64, 750, 1500, 30},
  };
  return kPresets;
}

std::optional<QualityPreset> FindQualityPreset(const std::string& key) {
  for (const auto& preset : AllQualityPresets()) {
    if (preset.key == key) return preset;
  }
  return std::nullopt;
}

}  // namespace mediaforge::transcode
