// Repository: Pulsecast
// Component: Server Configuration
// Purpose: Defaults, environment overrides and command-line parsing for the
//          pulsecast_server and pulsecast_recorder binaries.
// Copyright (c) 2026 Pulsecast

#ifndef PULSECAST_CONFIG_SERVER_CONFIG_HPP_
#define PULSECAST_CONFIG_SERVER_CONFIG_HPP_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "pulsecast/broadcast/BroadcastRouter.hpp"
#include "pulsecast/persist/BatchedPersister.hpp"
#include "pulsecast/persist/StreamRecorder.hpp"
#include "pulsecast/scenario/FileScenarioStore.hpp"
#include "pulsecast/transport/MessageServer.hpp"
#include "pulsecast/transport/StreamServer.hpp"

namespace pulsecast::config {

struct ServerConfig {
  transport::StreamServerConfig stream;
  transport::MessageServerConfig message;
  broadcast::RouterConfig router;
  std::string scenario_dir = scenario::kDefaultScenarioDir;
  std::string control_address = "127.0.0.1:50061";
  bool control_enabled = true;
};

struct RecorderOptions {
  persist::RecorderConfig recorder;
  persist::PersisterConfig persister;
};

// Result of argument parsing in the style of the harness CliArgs: help and
// errors are reported, never thrown.
template <typename T>
struct ParsedArgs {
  T config;
  bool help = false;
  bool valid = false;
  std::string error;
};

// Environment lookup, injectable for tests. Returns nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;
EnvLookup ProcessEnv();

// Applies PULSECAST_SCENARIO_DIR, PULSECAST_STREAM_PORT, PULSECAST_MESSAGE_PORT
// and PULSECAST_CONTROL_ADDRESS. Returns false with *error for an
// unparseable port.
bool ApplyEnvironment(const EnvLookup& env, ServerConfig* config, std::string* error);

// Defaults, then environment, then flags (flags win).
ParsedArgs<ServerConfig> ParseServerArgs(int argc, const char* const argv[],
                                         const EnvLookup& env);
ParsedArgs<RecorderOptions> ParseRecorderArgs(int argc, const char* const argv[]);

void PrintServerUsage(const char* program_name);
void PrintRecorderUsage(const char* program_name);

// Strict port parse: decimal, 0..65535, nothing trailing.
bool ParsePort(const std::string& text, uint16_t* out);

}  // namespace pulsecast::config

#endif  // PULSECAST_CONFIG_SERVER_CONFIG_HPP_
