// Repository: MediaForge
// Component: Adaptive-streaming manifests
// Copyright (c) 2026 MediaForge

#include "mediaforge/transcode/ManifestBuilder.hpp"

#include <sstream>

namespace mediaforge::transcode {

namespace {

std::string XmlEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': out += "&quot;"; break;
      default: out += c;
    }
  }
  return out;
}

}  // namespace

std::string BuildHlsMasterPlaylist(const std::vector<QualityVariant>& variants) {
  std::ostringstream o;
  o << "#EXTM3U\n#EXT-X-VERSION:3\n";
  for (const auto& v : variants) {
    o << "#EXT-X-STREAM-INF:BANDWIDTH=" << static_cast<int64_t>(v.bitrate_kbps) * 1000
      << ",RESOLUTION=" << v.width << "x" << v.height << "\n"
      << v.url << "\n";
  }
  return o.str();
}

std::string BuildDashManifest(const std::vector<QualityVariant>& variants) {
  std::ostringstream o;
  o << "<?xml version=\"1.0\"?>\n"
    << "<MPD xmlns=\"urn:mpeg:dash:schema:mpd:2011\" type=\"static\">\n"
    << "  <Period>\n";
  for (const auto& v : variants) {
    o << "    <AdaptationSet mimeType=\"video/mp4\">\n"
      << "      <Representation id=\"" << XmlEscape(v.quality) << "\" bandwidth=\""
      << static_cast<int64_t>(v.bitrate_kbps) * 1000 << "\" width=\"" << v.width
      << "\" height=\"" << v.height << "\">\n"
      << "        <BaseURL>" << XmlEscape(v.url) << "</BaseURL>\n"
      << "      </Representation>\n"
      << "    </AdaptationSet>\n";
  }
  o << "  </Period>\n</MPD>\n";
  return o.str();
}

std::string ManifestFileName(OutputMode mode) {
  switch (mode) {
    case OutputMode::kHls: return "master.m3u8";
    case OutputMode::kDash: return "manifest.mpd";
    case OutputMode::kMp4: return "";
  }
  return "";
}

}  // namespace mediaforge::transcode
