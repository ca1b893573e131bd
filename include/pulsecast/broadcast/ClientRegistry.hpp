// Repository: Pulsecast
// Component: Client Registry
// Purpose: Thread-safe membership for the stream and message populations.
// Copyright (c) 2026 Pulsecast

#ifndef PULSECAST_BROADCAST_CLIENT_REGISTRY_HPP_
#define PULSECAST_BROADCAST_CLIENT_REGISTRY_HPP_

#include <memory>
#include <mutex>
#include <vector>

#include "pulsecast/broadcast/IEventReceiver.hpp"

namespace pulsecast::broadcast {

using ReceiverPtr = std::shared_ptr<IEventReceiver>;

// Membership only. Snapshot() copies the member list so fan-out iterates
// without the lock; the lock is never held across a send.
class ClientRegistry {
 public:
  // Returns false if the receiver is already registered under that kind.
  bool Register(const ReceiverPtr& receiver, ClientKind kind);

  // Returns false if the receiver was not registered under that kind.
  bool Unregister(const ReceiverPtr& receiver, ClientKind kind);

  bool Contains(const ReceiverPtr& receiver, ClientKind kind) const;

  std::vector<ReceiverPtr> Snapshot(ClientKind kind) const;
  size_t Count(ClientKind kind) const;
  size_t TotalCount() const;

 private:
  std::vector<ReceiverPtr>& MembersFor(ClientKind kind);
  const std::vector<ReceiverPtr>& MembersFor(ClientKind kind) const;

  mutable std::mutex mutex_;
  std::vector<ReceiverPtr> stream_members_;
  std::vector<ReceiverPtr> message_members_;
};

}  // namespace pulsecast::broadcast

#endif  // PULSECAST_BROADCAST_CLIENT_REGISTRY_HPP_
