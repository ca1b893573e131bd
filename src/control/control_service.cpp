// Repository: Pulsecast
// Component: PulseControl gRPC Service Implementation
// Purpose: Implements the PulseControl service interface for scenario control.
// Copyright (c) 2026 Pulsecast

#include "control_service.h"

#include <string>

#include "pulsecast/event/Command.hpp"
#include "pulsecast/util/Logger.hpp"

namespace pulsecast {
namespace control {

using pulsecast::util::Logger;

namespace {
// API version constant
constexpr char kApiVersion[] = "1.0.0";
}  // namespace

grpc::StatusCode StatusCodeFor(scenario::PlayerStatusCode code) {
  switch (code) {
    case scenario::PlayerStatusCode::kOk: return grpc::StatusCode::OK;
    case scenario::PlayerStatusCode::kNotFound: return grpc::StatusCode::NOT_FOUND;
    case scenario::PlayerStatusCode::kInvalidRequest: return grpc::StatusCode::INVALID_ARGUMENT;
    case scenario::PlayerStatusCode::kMalformedData: return grpc::StatusCode::INVALID_ARGUMENT;
    case scenario::PlayerStatusCode::kNotRunning: return grpc::StatusCode::FAILED_PRECONDITION;
  }
  return grpc::StatusCode::INTERNAL;
}

PulseControlImpl::PulseControlImpl(std::shared_ptr<broadcast::BroadcastRouter> router)
    : router_(std::move(router)) {
  Logger::Info("[PulseControlImpl] Service initialized (API version: " +
               std::string(kApiVersion) + ")");
}

PulseControlImpl::~PulseControlImpl() {
  Logger::Info("[PulseControlImpl] Service shutting down");
}

grpc::Status PulseControlImpl::StartScenario(grpc::ServerContext* /*context*/,
                                             const v1::StartScenarioRequest* request,
                                             v1::StartScenarioResponse* response) {
  const std::string& name = request->scenario();
  Logger::Info("[StartScenario] Request received: scenario=" + name);

  if (name.empty()) {
    response->set_success(false);
    response->set_message("scenario name required");
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "scenario name required");
  }

  broadcast::CommandResult result = router_->Execute(event::Command::Start(name));
  response->set_success(result.success);
  response->set_message(result.message);

  if (!result.success) {
    return grpc::Status(StatusCodeFor(result.code), result.message);
  }
  Logger::Info("[StartScenario] Scenario " + name + " started");
  return grpc::Status::OK;
}

grpc::Status PulseControlImpl::StopScenario(grpc::ServerContext* /*context*/,
                                            const v1::StopScenarioRequest* /*request*/,
                                            v1::StopScenarioResponse* response) {
  Logger::Info("[StopScenario] Request received");

  broadcast::CommandResult result = router_->Execute(event::Command::Stop());
  response->set_success(result.success);
  response->set_message(result.message);

  if (!result.success) {
    return grpc::Status(StatusCodeFor(result.code), result.message);
  }
  return grpc::Status::OK;
}

grpc::Status PulseControlImpl::GetStatus(grpc::ServerContext* /*context*/,
                                         const v1::StatusRequest* /*request*/,
                                         v1::StatusResponse* response) {
  broadcast::RouterStatus status = router_->Status();
  response->set_running(status.playback.running);
  response->set_current_scenario(status.playback.current_scenario.value_or(""));
  response->set_events_emitted(status.playback.events_emitted);
  response->set_stream_clients(static_cast<uint32_t>(status.stream_clients));
  response->set_message_clients(static_cast<uint32_t>(status.message_clients));
  response->set_events_published(status.events_published);
  response->set_commands_accepted(status.commands_accepted);
  response->set_commands_malformed(status.commands_malformed);
  response->set_evictions(status.evictions);
  return grpc::Status::OK;
}

grpc::Status PulseControlImpl::ListScenarios(grpc::ServerContext* /*context*/,
                                             const v1::ListScenariosRequest* /*request*/,
                                             v1::ListScenariosResponse* response) {
  for (const auto& name : router_->ListScenarios()) {
    response->add_scenarios(name);
  }
  Logger::Info("[ListScenarios] Returning " + std::to_string(response->scenarios_size()) +
               " scenarios");
  return grpc::Status::OK;
}

grpc::Status PulseControlImpl::GetVersion(grpc::ServerContext* /*context*/,
                                          const v1::ApiVersionRequest* /*request*/,
                                          v1::ApiVersion* response) {
  Logger::Info("[GetVersion] Request received");
  response->set_version(kApiVersion);
  return grpc::Status::OK;
}

}  // namespace control
}  // namespace pulsecast
