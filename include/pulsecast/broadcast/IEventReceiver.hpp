// Repository: Pulsecast
// Component: Event Receiver Interface
// Purpose: One connected client as seen by the broadcast fan-out.
// Copyright (c) 2026 Pulsecast

#ifndef PULSECAST_BROADCAST_IEVENT_RECEIVER_HPP_
#define PULSECAST_BROADCAST_IEVENT_RECEIVER_HPP_

#include <string>

namespace pulsecast::broadcast {

// The two independent receiver populations.
enum class ClientKind {
  kStream,   // newline-delimited socket client (transport A)
  kMessage,  // frame-based WebSocket client (transport B)
};

const char* ClientKindName(ClientKind kind);

// Implementations hand the serialized payload to their own delivery channel
// and must not block on the network: transport A enqueues into a SocketSink,
// transport B pushes into a bridge subscription.
class IEventReceiver {
 public:
  virtual ~IEventReceiver() = default;

  // Returns false once the connection can no longer accept payloads. The
  // router evicts the receiver on the first false.
  virtual bool Deliver(const std::string& payload) = 0;

  virtual std::string GetName() const = 0;
};

}  // namespace pulsecast::broadcast

#endif  // PULSECAST_BROADCAST_IEVENT_RECEIVER_HPP_
