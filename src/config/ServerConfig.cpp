// Repository: Pulsecast
// Component: Server Configuration
// Purpose: Defaults, environment overrides and command-line parsing.
// Copyright (c) 2026 Pulsecast

#include "pulsecast/config/ServerConfig.hpp"

#include <cstdlib>
#include <iostream>

namespace pulsecast::config {

bool ParsePort(const std::string& text, uint16_t* out) {
  if (text.empty() || text.size() > 5) return false;
  unsigned long value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
    value = value * 10 + static_cast<unsigned long>(c - '0');
  }
  if (value > 65535) return false;
  *out = static_cast<uint16_t>(value);
  return true;
}

namespace {

bool ParseSize(const std::string& text, size_t* out) {
  if (text.empty()) return false;
  size_t value = 0;
  for (char c : text) {
    if (c < '0' || c > '9') return false;
    value = value * 10 + static_cast<size_t>(c - '0');
    if (value > (1u << 30)) return false;
  }
  *out = value;
  return true;
}

}  // namespace

EnvLookup ProcessEnv() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) return std::nullopt;
    return std::string(value);
  };
}

bool ApplyEnvironment(const EnvLookup& env, ServerConfig* config, std::string* error) {
  if (auto dir = env("PULSECAST_SCENARIO_DIR"); dir && !dir->empty()) {
    config->scenario_dir = *dir;
  }
  if (auto port = env("PULSECAST_STREAM_PORT")) {
    if (!ParsePort(*port, &config->stream.port)) {
      if (error) *error = "PULSECAST_STREAM_PORT is not a valid port: " + *port;
      return false;
    }
  }
  if (auto port = env("PULSECAST_MESSAGE_PORT")) {
    if (!ParsePort(*port, &config->message.port)) {
      if (error) *error = "PULSECAST_MESSAGE_PORT is not a valid port: " + *port;
      return false;
    }
  }
  if (auto addr = env("PULSECAST_CONTROL_ADDRESS"); addr && !addr->empty()) {
    config->control_address = *addr;
  }
  return true;
}

void PrintServerUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Replays biometric scenarios in real time to stream and WebSocket clients.\n"
            << "\n"
            << "LISTENERS:\n"
            << "  --host ADDR            Bind address for both listeners (default: 0.0.0.0)\n"
            << "  --stream-port PORT     Newline-delimited JSON over TCP (default: 5000)\n"
            << "  --message-port PORT    JSON frames over WebSocket (default: 8092)\n"
            << "\n"
            << "PLAYBACK:\n"
            << "  --scenario-dir DIR     Directory of <name>.json scenario files\n"
            << "                         (default: biometric/pulse/demo_stream_source)\n"
            << "  --same-scenario MODE   restart | ignore, for a start of the running\n"
            << "                         scenario (default: restart)\n"
            << "  --keep-orphaned        Keep playing after the last client disconnects\n"
            << "\n"
            << "CONTROL:\n"
            << "  --control-address A    gRPC control endpoint (default: 127.0.0.1:50061)\n"
            << "  --no-control           Do not start the gRPC control service\n"
            << "  --help                 Show this help message\n"
            << "\n"
            << "ENVIRONMENT:\n"
            << "  PULSECAST_SCENARIO_DIR, PULSECAST_STREAM_PORT, PULSECAST_MESSAGE_PORT,\n"
            << "  PULSECAST_CONTROL_ADDRESS   defaults overridden by flags\n"
            << "  PULSECAST_DEBUG             enable debug logging\n"
            << "\n";
}

void PrintRecorderUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Connects to the stream listener and records biometric events to a\n"
            << "JSON array buffer file in batches.\n"
            << "\n"
            << "  --host ADDR            Server address (default: 127.0.0.1)\n"
            << "  --port PORT            Stream listener port (default: 5000)\n"
            << "  --buffer-file PATH     Buffer file (default: biometric/buffer/pulse_temp.json)\n"
            << "  --batch-size N         Records per write (default: 10)\n"
            << "  --start SCENARIO       Send start_scenario after connecting\n"
            << "  --help                 Show this help message\n"
            << "\n";
}

ParsedArgs<ServerConfig> ParseServerArgs(int argc, const char* const argv[],
                                         const EnvLookup& env) {
  ParsedArgs<ServerConfig> args;
  if (!ApplyEnvironment(env, &args.config, &args.error)) {
    return args;
  }

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&](std::string* value) {
      if (i + 1 >= argc) {
        args.error = arg + " requires a value";
        return false;
      }
      *value = argv[++i];
      return true;
    };
    std::string value;

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--host") {
      if (!next(&value)) return args;
      args.config.stream.host = value;
      args.config.message.host = value;
    } else if (arg == "--stream-port") {
      if (!next(&value)) return args;
      if (!ParsePort(value, &args.config.stream.port)) {
        args.error = "invalid --stream-port: " + value;
        return args;
      }
    } else if (arg == "--message-port") {
      if (!next(&value)) return args;
      if (!ParsePort(value, &args.config.message.port)) {
        args.error = "invalid --message-port: " + value;
        return args;
      }
    } else if (arg == "--scenario-dir") {
      if (!next(&value)) return args;
      args.config.scenario_dir = value;
    } else if (arg == "--same-scenario") {
      if (!next(&value)) return args;
      auto policy = scenario::ParseSameScenarioPolicy(value);
      if (!policy) {
        args.error = "invalid --same-scenario: " + value + " (expected restart|ignore)";
        return args;
      }
      args.config.router.same_scenario_policy = *policy;
    } else if (arg == "--keep-orphaned") {
      args.config.router.stop_when_idle = false;
    } else if (arg == "--control-address") {
      if (!next(&value)) return args;
      args.config.control_address = value;
    } else if (arg == "--no-control") {
      args.config.control_enabled = false;
    } else {
      args.error = "unknown option: " + arg;
      return args;
    }
  }

  if (args.config.scenario_dir.empty()) {
    args.error = "--scenario-dir must not be empty";
    return args;
  }
  args.valid = true;
  return args;
}

ParsedArgs<RecorderOptions> ParseRecorderArgs(int argc, const char* const argv[]) {
  ParsedArgs<RecorderOptions> args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    auto next = [&](std::string* value) {
      if (i + 1 >= argc) {
        args.error = arg + " requires a value";
        return false;
      }
      *value = argv[++i];
      return true;
    };
    std::string value;

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--host") {
      if (!next(&value)) return args;
      args.config.recorder.host = value;
    } else if (arg == "--port") {
      if (!next(&value)) return args;
      if (!ParsePort(value, &args.config.recorder.port)) {
        args.error = "invalid --port: " + value;
        return args;
      }
    } else if (arg == "--buffer-file") {
      if (!next(&value)) return args;
      args.config.persister.buffer_path = value;
    } else if (arg == "--batch-size") {
      if (!next(&value)) return args;
      if (!ParseSize(value, &args.config.persister.batch_size) ||
          args.config.persister.batch_size == 0) {
        args.error = "invalid --batch-size: " + value;
        return args;
      }
    } else if (arg == "--start") {
      if (!next(&value)) return args;
      args.config.recorder.start_scenario = value;
    } else {
      args.error = "unknown option: " + arg;
      return args;
    }
  }

  if (args.config.persister.buffer_path.empty()) {
    args.error = "--buffer-file must not be empty";
    return args;
  }
  args.valid = true;
  return args;
}

}  // namespace pulsecast::config
