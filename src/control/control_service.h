// Repository: Pulsecast
// Component: PulseControl gRPC Service Implementation
// Purpose: Implements the PulseControl service interface for scenario control.
// Copyright (c) 2026 Pulsecast

#ifndef PULSECAST_CONTROL_SERVICE_H_
#define PULSECAST_CONTROL_SERVICE_H_

#include <memory>

#include <grpcpp/grpcpp.h>

#include "pulse_control.grpc.pb.h"
#include "pulse_control.pb.h"
#include "pulsecast/broadcast/BroadcastRouter.hpp"

namespace pulsecast {
namespace control {

// PulseControlImpl is a thin adapter over the BroadcastRouter. Start/stop go
// through the router's command dispatcher, so they are ordered with commands
// arriving on the client transports and produce the same broadcasts.
class PulseControlImpl final : public v1::PulseControl::Service {
 public:
  explicit PulseControlImpl(std::shared_ptr<broadcast::BroadcastRouter> router);
  ~PulseControlImpl() override;

  PulseControlImpl(const PulseControlImpl&) = delete;
  PulseControlImpl& operator=(const PulseControlImpl&) = delete;

  grpc::Status StartScenario(grpc::ServerContext* context,
                             const v1::StartScenarioRequest* request,
                             v1::StartScenarioResponse* response) override;

  grpc::Status StopScenario(grpc::ServerContext* context,
                            const v1::StopScenarioRequest* request,
                            v1::StopScenarioResponse* response) override;

  grpc::Status GetStatus(grpc::ServerContext* context,
                         const v1::StatusRequest* request,
                         v1::StatusResponse* response) override;

  grpc::Status ListScenarios(grpc::ServerContext* context,
                             const v1::ListScenariosRequest* request,
                             v1::ListScenariosResponse* response) override;

  grpc::Status GetVersion(grpc::ServerContext* context,
                          const v1::ApiVersionRequest* request,
                          v1::ApiVersion* response) override;

 private:
  std::shared_ptr<broadcast::BroadcastRouter> router_;
};

// Maps a command failure to the gRPC status code a client should see.
grpc::StatusCode StatusCodeFor(scenario::PlayerStatusCode code);

}  // namespace control
}  // namespace pulsecast

#endif  // PULSECAST_CONTROL_SERVICE_H_
