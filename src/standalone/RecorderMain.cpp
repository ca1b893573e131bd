// Repository: Pulsecast
// Component: pulsecast_recorder
// Purpose: Records biometric events from the stream listener into a batched
//          JSON buffer file.
// Copyright (c) 2026 Pulsecast

#include <atomic>
#include <csignal>
#include <stdexcept>
#include <iostream>
#include <memory>
#include <string>

#include "pulsecast/config/ServerConfig.hpp"
#include "pulsecast/persist/BatchedPersister.hpp"
#include "pulsecast/persist/StreamRecorder.hpp"
#include "pulsecast/util/Logger.hpp"

namespace {

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace pulsecast;
  using pulsecast::util::Logger;

  auto args = config::ParseRecorderArgs(argc, argv);
  if (args.help) {
    config::PrintRecorderUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    config::PrintRecorderUsage(argv[0]);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  std::shared_ptr<persist::BatchedPersister> persister;
  try {
    persister = std::make_shared<persist::BatchedPersister>(args.config.persister);
  } catch (const std::invalid_argument& e) {
    Logger::Error(std::string("[Recorder] ") + e.what());
    return 1;
  }

  persist::StreamRecorder recorder(args.config.recorder, persister);
  std::string error;
  if (!recorder.Connect(&error)) {
    Logger::Error("[Recorder] " + error);
    return 1;
  }
  const bool ok = recorder.Run(g_termination_requested);
  Logger::Info("[Recorder] Recorded " + std::to_string(recorder.records_accepted()) +
               " events to " + persister->path());
  return ok ? 0 : 1;
}
