// Repository: MediaForge
// Component: Media probe implementation
// Copyright (c) 2026 MediaForge

#include "mediaforge/transcode/MediaProbe.hpp"

#include "mediaforge/util/Logger.hpp"

#ifdef MEDIAFORGE_FFMPEG_AVAILABLE
extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
}
#endif

namespace mediaforge::transcode {

bool FfmpegMediaProbe::Available() {
#ifdef MEDIAFORGE_FFMPEG_AVAILABLE
  return true;
#else
  return false;
#endif
}

std::optional<ProbeResult> FfmpegMediaProbe::Probe(const std::string& uri) const {
#ifdef MEDIAFORGE_FFMPEG_AVAILABLE
  AVFormatContext* fmt_ctx = nullptr;
  if (avformat_open_input(&fmt_ctx, uri.c_str(), nullptr, nullptr) < 0) {
    util::Logger::Warn("[MediaProbe] Failed to open: " + uri);
    return std::nullopt;
  }
  if (avformat_find_stream_info(fmt_ctx, nullptr) < 0) {
    avformat_close_input(&fmt_ctx);
    util::Logger::Warn("[MediaProbe] Failed to find stream info: " + uri);
    return std::nullopt;
  }

  ProbeResult result;
  if (fmt_ctx->duration != AV_NOPTS_VALUE && fmt_ctx->duration > 0) {
    result.duration_ms = fmt_ctx->duration / 1000;  // AV_TIME_BASE is microseconds
  }
  for (unsigned i = 0; i < fmt_ctx->nb_streams; ++i) {
    const AVCodecParameters* par = fmt_ctx->streams[i]->codecpar;
    if (par->codec_type == AVMEDIA_TYPE_VIDEO) {
      result.width = par->width;
      result.height = par->height;
      break;
    }
  }
  const AVDictionaryEntry* entry = nullptr;
  while ((entry = av_dict_get(fmt_ctx->metadata, "", entry, AV_DICT_IGNORE_SUFFIX)) != nullptr) {
    result.tags[entry->key] = entry->value;
  }

  avformat_close_input(&fmt_ctx);
  util::Logger::Debug("[MediaProbe] Probed: " + uri + " (" +
                      std::to_string(result.duration_ms) + "ms)");
  return result;
#else
  (void)uri;
  util::Logger::Debug("[MediaProbe] FFmpeg not available");
  return std::nullopt;
#endif
}

}  // namespace mediaforge::transcode
