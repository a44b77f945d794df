// Repository: MediaForge
// Component: Quality preset catalog
// Purpose: Named encode targets (4k .. 240p) and default preset selection.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_TRANSCODE_QUALITY_PRESETS_HPP_
#define MEDIAFORGE_TRANSCODE_QUALITY_PRESETS_HPP_

#include <optional>
#include <string>
#include <vector>

#include "mediaforge/core/Types.hpp"

namespace mediaforge::transcode {

// Highest resolution first.
const std::vector<QualityPreset>& AllQualityPresets();

std::optional<QualityPreset> FindQualityPreset(const std::string& key);

}  // namespace mediaforge::transcode

#endif  // MEDIAFORGE_TRANSCODE_QUALITY_PRESETS_HPP_
