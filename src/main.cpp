// Repository: MediaForge
// Component: MediaForge server entry point
// Purpose: Builds the pipeline from configuration, recovers in-flight work
//          and serves the MediaPipeline gRPC interface until SIGINT/SIGTERM.
// Copyright (c) 2026 MediaForge

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "mediaforge/config/PipelineConfig.hpp"
#include "mediaforge/distribution/DistributionFanout.hpp"
#include "mediaforge/distribution/GrpcPlatformDeliveryClient.hpp"
#include "mediaforge/distribution/TierPolicy.hpp"
#include "mediaforge/forensic/FfmpegForensicService.hpp"
#include "mediaforge/pipeline/IAuditSink.hpp"
#include "mediaforge/pipeline/PipelineCoordinator.hpp"
#include "mediaforge/pipeline/PipelineEventBus.hpp"
#include "mediaforge/storage/InMemoryPipelineRepository.hpp"
#include "mediaforge/storage/JournalPipelineRepository.hpp"
#include "mediaforge/storage/LocalMultipartStore.hpp"
#include "mediaforge/storage/LocalObjectPublisher.hpp"
#include "mediaforge/time/SystemTimeSource.hpp"
#include "mediaforge/transcode/MediaProbe.hpp"
#include "mediaforge/transcode/SubprocessTranscodeRunner.hpp"
#include "mediaforge/transcode/TranscodingOrchestrator.hpp"
#include "mediaforge/upload/StaleSessionSweeper.hpp"
#include "mediaforge/upload/UploadSessionManager.hpp"
#include "mediaforge/util/Logger.hpp"
#include "pipeline_service.h"

namespace {

using namespace mediaforge;

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

int RunServer(const config::PipelineConfig& config) {
  auto time_source = std::make_shared<time::SystemTimeSource>();

  std::shared_ptr<storage::IPipelineRepository> repository;
  std::shared_ptr<storage::JournalPipelineRepository> journal;
  if (config.journal_path.empty()) {
    util::Logger::Warn("[Main] No journal configured; pipeline state is lost on restart");
    repository = std::make_shared<storage::InMemoryPipelineRepository>();
  } else {
    journal = std::make_shared<storage::JournalPipelineRepository>(config.journal_path);
    repository = journal;
  }

  auto store = std::make_shared<storage::LocalMultipartStore>(config.storage_root);
  auto publisher =
      std::make_shared<storage::LocalObjectPublisher>(config.publish_root, config.public_base_url);
  auto runner = std::make_shared<transcode::SubprocessTranscodeRunner>();
  auto probe = std::make_shared<transcode::FfmpegMediaProbe>();
  if (!transcode::FfmpegMediaProbe::Available()) {
    util::Logger::Warn("[Main] Built without libavformat; progress relies on encoder output "
                       "and signatures cannot be read back");
  }
  const transcode::EncoderOptions encoder{config.ffmpeg_path, config.gpu_acceleration};
  auto forensics = std::make_shared<forensic::FfmpegForensicService>(config.signature_prefix,
                                                                     encoder, runner, probe);

  auto uploads = std::make_shared<upload::UploadSessionManager>(config, store, repository,
                                                                forensics, time_source);
  auto transcoder = std::make_shared<transcode::TranscodingOrchestrator>(
      config, repository, runner, forensics, publisher, probe, time_source);
  auto tiers = std::make_shared<const distribution::TierPolicy>();
  auto delivery =
      std::make_shared<distribution::GrpcPlatformDeliveryClient>(config.platform_endpoint_overrides);
  auto fanout = std::make_shared<distribution::DistributionFanout>(config, repository, tiers,
                                                                   delivery, time_source);
  auto events = std::make_shared<pipeline::PipelineEventBus>();
  auto audit = std::make_shared<pipeline::LoggerAuditSink>();
  auto coordinator = std::make_shared<pipeline::PipelineCoordinator>(
      config, repository, uploads, transcoder, fanout, tiers, events, audit, time_source);

  coordinator->RecoverInFlight();
  transcoder->Start();
  upload::StaleSessionSweeper sweeper(*uploads, config.sweep_interval_ms);
  sweeper.SetTickCallback([&coordinator]() { coordinator->EvictTerminalPipelines(); });
  sweeper.Start();

  service::MediaPipelineImpl service(coordinator, uploads, transcoder, tiers, events);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials());
  // Validate caps chunk_size_bytes at kMaxChunkSizeBytes, so this fits an int.
  builder.SetMaxReceiveMessageSize(static_cast<int>(config.chunk_size_bytes + (1 << 20)));
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    util::Logger::Error("[Main] Failed to listen on " + config.listen_address);
    sweeper.Stop();
    transcoder->Stop();
    coordinator->Shutdown();
    return 1;
  }
  util::Logger::Info("[Main] MediaForge listening on " + config.listen_address);

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  util::Logger::Info("[Main] Shutting down");
  service.Shutdown();
  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
  sweeper.Stop();
  transcoder->Stop();
  coordinator->Shutdown();
  if (journal) journal->Flush();
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  mediaforge::config::PipelineConfig base;
  try {
    mediaforge::config::ApplyEnvironment(base);
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  mediaforge::config::CliArgs args = mediaforge::config::ParseArgs(argc, argv, base);
  if (args.help) {
    mediaforge::config::PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    mediaforge::config::PrintUsage(argv[0]);
    return 1;
  }
  try {
    mediaforge::config::Validate(args.config);
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  try {
    return RunServer(args.config);
  } catch (const std::exception& e) {
    mediaforge::util::Logger::Error(std::string("[Main] Fatal: ") + e.what());
    return 1;
  }
}
