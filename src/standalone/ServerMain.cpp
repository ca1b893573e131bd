// Repository: Pulsecast
// Component: pulsecast_server
// Purpose: Process entry point wiring the scenario store, router, both client
//          transports and the gRPC control service.
// Copyright (c) 2026 Pulsecast

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#ifdef PULSECAST_WITH_GRPC
#include <grpcpp/grpcpp.h>

#include "control/control_service.h"
#endif

#include "pulsecast/bridge/SchedulerBridge.hpp"
#include "pulsecast/broadcast/BroadcastRouter.hpp"
#include "pulsecast/config/ServerConfig.hpp"
#include "pulsecast/scenario/FileScenarioStore.hpp"
#include "pulsecast/timing/SystemTimeSource.hpp"
#include "pulsecast/transport/MessageServer.hpp"
#include "pulsecast/transport/StreamServer.hpp"
#include "pulsecast/util/Logger.hpp"

namespace {

using pulsecast::util::Logger;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace pulsecast;

  auto args = config::ParseServerArgs(argc, argv, config::ProcessEnv());
  if (args.help) {
    config::PrintServerUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    config::PrintServerUsage(argv[0]);
    return 1;
  }
  const config::ServerConfig& cfg = args.config;

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  // Destroyed last: the message transport's sessions live on this loop.
  bridge::SchedulerBridge bridge;

  auto store = std::make_shared<scenario::FileScenarioStore>(cfg.scenario_dir);
  auto router = std::make_shared<broadcast::BroadcastRouter>(
      store, timing::SystemTimeSource::Shared(), cfg.router);

  Logger::Info("[Main] Scenario directory: " + cfg.scenario_dir + " (" +
               std::to_string(store->List().size()) + " scenarios)");

  bridge.Start();

  std::string error;
  transport::StreamServer stream_server(cfg.stream, router);
  if (!stream_server.Start(&error)) {
    Logger::Error("[Main] Stream listener failed: " + error);
    return 1;
  }
  transport::MessageServer message_server(cfg.message, bridge, router);
  if (!message_server.Start(&error)) {
    Logger::Error("[Main] Message listener failed: " + error);
    return 1;
  }

#ifdef PULSECAST_WITH_GRPC
  std::unique_ptr<control::PulseControlImpl> control_service;
  std::unique_ptr<grpc::Server> control_server;
  if (cfg.control_enabled) {
    control_service = std::make_unique<control::PulseControlImpl>(router);
    grpc::ServerBuilder builder;
    builder.AddListeningPort(cfg.control_address, grpc::InsecureServerCredentials());
    builder.RegisterService(control_service.get());
    control_server = builder.BuildAndStart();
    if (!control_server) {
      Logger::Error("[Main] Control service failed to bind " + cfg.control_address);
      return 1;
    }
    Logger::Info("[Main] Control service listening on " + cfg.control_address);
  }
#else
  if (cfg.control_enabled) {
    Logger::Warn("[Main] Built without gRPC; control service unavailable");
  }
#endif

  Logger::Info("[Main] Ready (stream=" + std::to_string(stream_server.BoundPort()) +
               ", message=" + std::to_string(message_server.BoundPort()) + ")");

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  Logger::Info("[Main] Termination requested, shutting down");

#ifdef PULSECAST_WITH_GRPC
  if (control_server) {
    control_server->Shutdown();
  }
#endif
  stream_server.Stop();
  message_server.Stop();
  router->Shutdown();
  bridge.Stop();
  return 0;
}
