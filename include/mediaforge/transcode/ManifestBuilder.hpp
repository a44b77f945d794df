// Repository: MediaForge
// Component: Adaptive-streaming manifests
// Purpose: HLS master playlist and static DASH MPD over finished variants.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_TRANSCODE_MANIFEST_BUILDER_HPP_
#define MEDIAFORGE_TRANSCODE_MANIFEST_BUILDER_HPP_

#include <string>
#include <vector>

#include "mediaforge/core/Types.hpp"

namespace mediaforge::transcode {

std::string BuildHlsMasterPlaylist(const std::vector<QualityVariant>& variants);
std::string BuildDashManifest(const std::vector<QualityVariant>& variants);

// "master.m3u8" / "manifest.mpd"; empty for kMp4.
std::string ManifestFileName(OutputMode mode);

}  // namespace mediaforge::transcode

#endif  // MEDIAFORGE_TRANSCODE_MANIFEST_BUILDER_HPP_
