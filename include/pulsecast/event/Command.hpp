// Repository: Pulsecast
// Component: Client Command
// Purpose: Parsing of start/stop/liveness messages arriving on either transport.
// Copyright (c) 2026 Pulsecast

#ifndef PULSECAST_EVENT_COMMAND_HPP_
#define PULSECAST_EVENT_COMMAND_HPP_

#include <optional>
#include <string>

namespace pulsecast::event {

enum class CommandType {
  kStartScenario,
  kStopScenario,
  kClientHeartbeat,
};

const char* CommandTypeName(CommandType type);

struct Command {
  CommandType type = CommandType::kStopScenario;
  // Set only for kStartScenario.
  std::string scenario;

  static Command Start(const std::string& scenario) {
    return Command{CommandType::kStartScenario, scenario};
  }
  static Command Stop() { return Command{CommandType::kStopScenario, ""}; }
};

struct CommandParseResult {
  std::optional<Command> command;
  std::string error;  // empty when command is set
};

// Accepted shapes:
//   {"command":"start_scenario","scenario":"<name>"}
//   {"command":"stop_scenario"}
//   {"type":"client_heartbeat", ...}
// Anything else (bad JSON, unknown command, start without a non-empty
// scenario) is malformed and returns an error description.
CommandParseResult ParseCommand(const std::string& text);

}  // namespace pulsecast::event

#endif  // PULSECAST_EVENT_COMMAND_HPP_
