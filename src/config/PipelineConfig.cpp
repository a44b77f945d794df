// Repository: MediaForge
// Component: Pipeline Configuration
// Copyright (c) 2026 MediaForge

#include "mediaforge/config/PipelineConfig.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace mediaforge::config {

namespace {

std::string Trim(const std::string& s) {
  size_t b = 0;
  size_t e = s.size();
  while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
  while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) --e;
  return s.substr(b, e - b);
}

int64_t ParseInt64(const std::string& name, const std::string& value) {
  size_t consumed = 0;
  int64_t parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw std::invalid_argument(name + ": not an integer: '" + value + "'");
  }
  if (consumed != value.size()) {
    throw std::invalid_argument(name + ": trailing characters in '" + value + "'");
  }
  return parsed;
}

int ParseInt(const std::string& name, const std::string& value) {
  const int64_t v = ParseInt64(name, value);
  if (v < INT32_MIN || v > INT32_MAX) {
    throw std::invalid_argument(name + ": out of range: '" + value + "'");
  }
  return static_cast<int>(v);
}

bool ParseBool(const std::string& name, const std::string& value) {
  if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
  if (value == "0" || value == "false" || value == "no" || value == "off") return false;
  throw std::invalid_argument(name + ": not a boolean: '" + value + "'");
}

OutputMode ParseMode(const std::string& name, const std::string& value) {
  auto mode = ParseOutputMode(value);
  if (!mode) {
    throw std::invalid_argument(name + ": expected mp4|hls|dash, got '" + value + "'");
  }
  return *mode;
}

// "id=host:port,id2=host:port"
std::map<std::string, std::string> ParseEndpoints(const std::string& name,
                                                  const std::string& value) {
  std::map<std::string, std::string> out;
  for (const auto& item : SplitList(value)) {
    const size_t eq = item.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == item.size()) {
      throw std::invalid_argument(name + ": expected id=host:port, got '" + item + "'");
    }
    out[Trim(item.substr(0, eq))] = Trim(item.substr(eq + 1));
  }
  return out;
}

}  // namespace

int PipelineConfig::ResolvedTranscodeParallelism() const {
  if (transcode_parallelism > 0) return transcode_parallelism;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw == 0 ? 1 : static_cast<int>(hw);
}

std::vector<std::string> SplitList(const std::string& value) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= value.size()) {
    size_t comma = value.find(',', start);
    if (comma == std::string::npos) comma = value.size();
    std::string item = Trim(value.substr(start, comma - start));
    if (!item.empty()) out.push_back(std::move(item));
    start = comma + 1;
  }
  return out;
}

void ApplyEnvironment(PipelineConfig& config) {
  ApplyEnvironment(config, [](const char* key) { return std::getenv(key); });
}

void ApplyEnvironment(PipelineConfig& config, const EnvLookup& lookup) {
  auto get = [&lookup](const char* key) -> const char* {
    const char* v = lookup(key);
    return (v != nullptr && *v != '\0') ? v : nullptr;
  };

  if (const char* v = get("MEDIAFORGE_LISTEN")) config.listen_address = v;
  if (const char* v = get("MEDIAFORGE_STORAGE_ROOT")) config.storage_root = v;
  if (const char* v = get("MEDIAFORGE_PUBLISH_ROOT")) config.publish_root = v;
  if (const char* v = get("MEDIAFORGE_PUBLIC_URL")) config.public_base_url = v;
  if (const char* v = get("MEDIAFORGE_WORK_DIR")) config.work_dir = v;
  if (const char* v = get("MEDIAFORGE_JOURNAL")) config.journal_path = v;
  if (const char* v = get("MEDIAFORGE_FFMPEG")) config.ffmpeg_path = v;
  if (const char* v = get("MEDIAFORGE_SIGNATURE_PREFIX")) config.signature_prefix = v;
  if (const char* v = get("MEDIAFORGE_GPU")) {
    config.gpu_acceleration = ParseBool("MEDIAFORGE_GPU", v);
  }
  if (const char* v = get("MEDIAFORGE_CHUNK_SIZE")) {
    config.chunk_size_bytes = ParseInt64("MEDIAFORGE_CHUNK_SIZE", v);
  }
  if (const char* v = get("MEDIAFORGE_CHUNK_PARALLELISM")) {
    config.chunk_parallelism = ParseInt("MEDIAFORGE_CHUNK_PARALLELISM", v);
  }
  if (const char* v = get("MEDIAFORGE_TRANSCODE_PARALLELISM")) {
    config.transcode_parallelism = ParseInt("MEDIAFORGE_TRANSCODE_PARALLELISM", v);
  }
  if (const char* v = get("MEDIAFORGE_STALE_THRESHOLD_MS")) {
    config.stale_session_threshold_ms = ParseInt64("MEDIAFORGE_STALE_THRESHOLD_MS", v);
  }
  if (const char* v = get("MEDIAFORGE_SWEEP_INTERVAL_MS")) {
    config.sweep_interval_ms = ParseInt64("MEDIAFORGE_SWEEP_INTERVAL_MS", v);
  }
  if (const char* v = get("MEDIAFORGE_PIPELINE_RETENTION_MS")) {
    config.pipeline_retention_ms = ParseInt64("MEDIAFORGE_PIPELINE_RETENTION_MS", v);
  }
  if (const char* v = get("MEDIAFORGE_DELIVERY_ATTEMPTS")) {
    config.delivery_attempts = ParseInt("MEDIAFORGE_DELIVERY_ATTEMPTS", v);
  }
  if (const char* v = get("MEDIAFORGE_PRESETS")) {
    config.default_presets = SplitList(v);
  }
  if (const char* v = get("MEDIAFORGE_OUTPUT_MODE")) {
    config.output_mode = ParseMode("MEDIAFORGE_OUTPUT_MODE", v);
  }
  if (const char* v = get("MEDIAFORGE_PLATFORM_ENDPOINTS")) {
    config.platform_endpoint_overrides = ParseEndpoints("MEDIAFORGE_PLATFORM_ENDPOINTS", v);
  }
}

void Validate(const PipelineConfig& config) {
  if (config.chunk_size_bytes <= 0) {
    throw std::invalid_argument("chunk_size_bytes must be positive");
  }
  if (config.chunk_size_bytes > kMaxChunkSizeBytes) {
    throw std::invalid_argument("chunk_size_bytes " + std::to_string(config.chunk_size_bytes) +
                                " exceeds the " + std::to_string(kMaxChunkSizeBytes) +
                                " byte ceiling");
  }
  if (config.chunk_parallelism < 1) {
    throw std::invalid_argument("chunk_parallelism must be at least 1");
  }
  if (config.transcode_parallelism < 0) {
    throw std::invalid_argument("transcode_parallelism must be >= 0");
  }
  if (config.delivery_attempts < 1) {
    throw std::invalid_argument("delivery_attempts must be at least 1");
  }
  if (config.stale_session_threshold_ms <= 0 || config.sweep_interval_ms <= 0) {
    throw std::invalid_argument("staleness threshold and sweep interval must be positive");
  }
  if (config.pipeline_retention_ms <= 0) {
    throw std::invalid_argument("pipeline_retention_ms must be positive");
  }
  if (config.default_presets.empty()) {
    throw std::invalid_argument("default_presets must not be empty");
  }
}

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "MediaForge upload / transcode / distribution pipeline server.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --listen ADDR                gRPC listen address (default 0.0.0.0:50061)\n"
            << "  --storage-root DIR           Multipart object store root\n"
            << "  --publish-root DIR           CDN origin directory\n"
            << "  --public-url URL             Public base URL for published objects\n"
            << "  --work-dir DIR               Encoder scratch directory\n"
            << "  --journal PATH               Persist pipeline state to a JSONL journal\n"
            << "  --chunk-parallelism N        Concurrent chunk writes per batch (default 4)\n"
            << "  --transcode-parallelism N    Transcode jobs per batch, 0 = cores (default 3)\n"
            << "  --ffmpeg PATH                Encoder binary (default ffmpeg)\n"
            << "  --gpu                        Use CUDA decode + NVENC encode\n"
            << "  --help                       Show this help message\n"
            << "\n"
            << "Every option can also be set with a MEDIAFORGE_* environment variable;\n"
            << "flags win over the environment.\n";
}

CliArgs ParseArgs(int argc, char* argv[], PipelineConfig base) {
  CliArgs args;
  args.config = std::move(base);

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--listen" && i + 1 < argc) {
        args.config.listen_address = argv[++i];
      } else if (arg == "--storage-root" && i + 1 < argc) {
        args.config.storage_root = argv[++i];
      } else if (arg == "--publish-root" && i + 1 < argc) {
        args.config.publish_root = argv[++i];
      } else if (arg == "--public-url" && i + 1 < argc) {
        args.config.public_base_url = argv[++i];
      } else if (arg == "--work-dir" && i + 1 < argc) {
        args.config.work_dir = argv[++i];
      } else if (arg == "--journal" && i + 1 < argc) {
        args.config.journal_path = argv[++i];
      } else if (arg == "--chunk-parallelism" && i + 1 < argc) {
        args.config.chunk_parallelism = ParseInt("--chunk-parallelism", argv[++i]);
      } else if (arg == "--transcode-parallelism" && i + 1 < argc) {
        args.config.transcode_parallelism = ParseInt("--transcode-parallelism", argv[++i]);
      } else if (arg == "--ffmpeg" && i + 1 < argc) {
        args.config.ffmpeg_path = argv[++i];
      } else if (arg == "--gpu") {
        args.config.gpu_acceleration = true;
      } else {
        args.error = "Unknown argument: " + arg;
        return args;
      }
    }
    Validate(args.config);
  } catch (const std::invalid_argument& e) {
    args.error = e.what();
    return args;
  }

  args.valid = true;
  return args;
}

}  // namespace mediaforge::config
