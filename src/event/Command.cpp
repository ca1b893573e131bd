// Repository: Pulsecast
// Component: Client Command
// Purpose: Parsing of start/stop/liveness messages arriving on either transport.
// Copyright (c) 2026 Pulsecast

#include "pulsecast/event/Command.hpp"

#include "pulsecast/util/Json.hpp"

namespace pulsecast::event {

const char* CommandTypeName(CommandType type) {
  switch (type) {
    case CommandType::kStartScenario: return "start_scenario";
    case CommandType::kStopScenario: return "stop_scenario";
    case CommandType::kClientHeartbeat: return "client_heartbeat";
  }
  return "unknown";
}

CommandParseResult ParseCommand(const std::string& text) {
  CommandParseResult result;
  std::string parse_error;
  auto doc = util::ParseJson(text, &parse_error);
  if (!doc) {
    result.error = "invalid JSON: " + parse_error;
    return result;
  }
  if (!doc->IsObject()) {
    result.error = "command must be a JSON object";
    return result;
  }

  std::string type;
  if (util::GetString(*doc, "type", &type) && type == "client_heartbeat") {
    result.command = Command{CommandType::kClientHeartbeat, ""};
    return result;
  }

  std::string name;
  if (!util::GetString(*doc, "command", &name)) {
    result.error = "missing \"command\" field";
    return result;
  }

  if (name == "start_scenario") {
    std::string scenario;
    if (!util::GetString(*doc, "scenario", &scenario) || scenario.empty()) {
      result.error = "start_scenario requires a non-empty \"scenario\"";
      return result;
    }
    result.command = Command::Start(scenario);
    return result;
  }
  if (name == "stop_scenario") {
    result.command = Command::Stop();
    return result;
  }

  result.error = "unknown command \"" + name + "\"";
  return result;
}

}  // namespace pulsecast::event
