// Repository: MediaForge
// Component: Pipeline Configuration
// Purpose: Tunables for upload, transcode and distribution plus the
//          environment / command-line layering that fills them in.
// Copyright (c) 2026 MediaForge

#ifndef MEDIAFORGE_CONFIG_PIPELINE_CONFIG_HPP_
#define MEDIAFORGE_CONFIG_PIPELINE_CONFIG_HPP_

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "mediaforge/core/Types.hpp"

namespace mediaforge::config {

// POD struct - copied into each component at construction.
// Largest accepted chunk. One chunk plus framing must fit a gRPC message,
// whose size limit is an int.
constexpr int64_t kMaxChunkSizeBytes = 512LL * 1024 * 1024;

struct PipelineConfig {
  int64_t chunk_size_bytes = 5 * 1024 * 1024;         // Fixed chunk size (5 MiB)
  int chunk_parallelism = 4;                          // UploadChunksBatch window
  int transcode_parallelism = 3;                      // Jobs per batch; 0 = hardware threads
  int64_t stale_session_threshold_ms = 24LL * 60 * 60 * 1000;
  int64_t sweep_interval_ms = 60LL * 60 * 1000;
  int64_t pipeline_retention_ms = 24LL * 60 * 60 * 1000;  // Finished pipelines kept in memory
  int delivery_attempts = 1;                          // Per platform, per fan-out

  std::string storage_root = "/var/lib/mediaforge/objects";  // Multipart object store
  std::string publish_root = "/var/lib/mediaforge/cdn";      // CDN origin directory
  std::string public_base_url = "https://cdn.mediaforge.local";
  std::string work_dir = "/tmp/mediaforge";                  // Encoder scratch space
  std::string journal_path;                                  // Empty = in-memory repository

  std::string ffmpeg_path = "ffmpeg";
  bool gpu_acceleration = false;
  std::string listen_address = "0.0.0.0:50061";

  std::vector<std::string> default_presets = {"1080p", "720p", "480p", "360p", "240p"};
  std::string premium_preset = "4k";
  OutputMode output_mode = OutputMode::kHls;
  std::string signature_prefix = "MF";

  // platform id → "host:port" of its PlatformIngest endpoint.
  std::map<std::string, std::string> platform_endpoint_overrides;

  // transcode_parallelism with 0 resolved to the hardware thread count (min 1).
  int ResolvedTranscodeParallelism() const;
};

using EnvLookup = std::function<const char*(const char*)>;

// Applies MEDIAFORGE_* environment overrides on top of `config`.
// Throws std::invalid_argument naming the variable on malformed values.
void ApplyEnvironment(PipelineConfig& config);
void ApplyEnvironment(PipelineConfig& config, const EnvLookup& lookup);

// Throws std::invalid_argument if any value is out of range.
void Validate(const PipelineConfig& config);

struct CliArgs {
  PipelineConfig config;
  bool help = false;
  bool valid = false;
  std::string error;
};

// Command-line flags override `base`. Never throws; errors land in CliArgs.
CliArgs ParseArgs(int argc, char* argv[], PipelineConfig base);

void PrintUsage(const char* program_name);

// "a,b , c" → {"a","b","c"}; empty items dropped.
std::vector<std::string> SplitList(const std::string& value);

}  // namespace mediaforge::config

#endif  // MEDIAFORGE_CONFIG_PIPELINE_CONFIG_HPP_
