// Repository: Ferry
// Component: ferryd
// Purpose: Daemon entry point; serves StreamControl over gRPC.
// Copyright (c) 2025 Ferry

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "ferry/config/FerryConfig.hpp"
#include "ferry/fetch/FFmpegHttpTransport.hpp"
#include "ferry/provider/ProviderRegistry.hpp"
#include "ferry/session/MediaProbeValidator.hpp"
#include "ferry/session/StreamSessionFactory.hpp"
#include "ferry/time/SystemTimeSource.hpp"
#include "ferry/time/WallClockTimeSource.hpp"
#include "ferry/util/Logger.hpp"
#include "store/FileProviderScoreStore.hpp"
#include "store/FileValidatedContentStore.hpp"
#include "stream_service.h"

namespace {

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  std::string config_path;
  std::string listen_address;
  std::string score_store_dir;
  bool debug = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Adaptive multi-source delivery daemon.\n"
            << "\n"
            << "  --config PATH        key=value config file (default: built-in)\n"
            << "  --listen ADDR        gRPC listen address (default: 0.0.0.0:50071)\n"
            << "  --score-store DIR    Persist provider scores and validated content under DIR\n"
            << "  --debug              Enable debug logging\n"
            << "  --help               Show this help message\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--listen" && i + 1 < argc) {
      args.listen_address = argv[++i];
    } else if (arg == "--score-store" && i + 1 < argc) {
      args.score_store_dir = argv[++i];
    } else if (arg == "--debug") {
      args.debug = true;
    } else {
      args.error = "Unknown or incomplete argument: " + arg;
      return args;
    }
  }
  args.valid = true;
  return args;
}

int Run(const CliArgs& args) {
  using ferry::util::Logger;

  ferry::config::FerryConfig config = args.config_path.empty()
                                          ? ferry::config::DefaultConfig()
                                          : ferry::config::LoadConfigFile(args.config_path);
  if (!args.listen_address.empty()) config.listen_address = args.listen_address;
  if (!args.score_store_dir.empty()) config.score_store_dir = args.score_store_dir;
  ferry::config::ValidateConfig(config);

  auto clock = std::make_shared<ferry::time::SystemTimeSource>();
  std::shared_ptr<ferry::store::FileProviderScoreStore> store;
  std::shared_ptr<ferry::store::FileValidatedContentStore> validated_store;
  if (!config.score_store_dir.empty()) {
    store = std::make_shared<ferry::store::FileProviderScoreStore>(config.score_store_dir);
    Logger::Info("[ferryd] score store path=" + store->Path());
    validated_store =
        std::make_shared<ferry::store::FileValidatedContentStore>(config.score_store_dir);
    Logger::Info("[ferryd] validated content path=" + validated_store->Path());
  }
  auto registry = std::make_shared<ferry::provider::ProviderRegistry>(
      config.providers, config.registry, clock, store);
  auto transport = std::make_shared<ferry::fetch::FFmpegHttpTransport>(config.user_agent);
  auto validator = std::make_shared<ferry::session::MediaProbeValidator>(
      config.probe, std::make_shared<ferry::time::WallClockTimeSource>(), validated_store);
  auto factory = std::make_shared<ferry::session::StreamSessionFactory>(
      registry, transport, validator, config.tiers, config.session, clock);

  ferry::v1::StreamControlImpl service(factory);

  grpc::ServerBuilder builder;
  int bound_port = 0;
  builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials(),
                           &bound_port);
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server || bound_port == 0) {
    Logger::Error("[ferryd] failed to listen on " + config.listen_address);
    return 1;
  }
  Logger::Info("[ferryd] listening on " + config.listen_address +
               " providers=" + std::to_string(registry->size()) +
               " tiers=" + std::to_string(config.tiers.size()));

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  Logger::Info("[ferryd] shutting down");
  service.Shutdown();
  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
  if (store) store->Flush();
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }
  if (args.debug) ferry::util::Logger::SetDebugEnabled(true);

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  try {
    return Run(args);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
