// Repository: Pulsecast
// Component: Client Registry
// Purpose: Thread-safe membership for the stream and message populations.
// Copyright (c) 2026 Pulsecast

#include "pulsecast/broadcast/ClientRegistry.hpp"

#include <algorithm>

namespace pulsecast::broadcast {

const char* ClientKindName(ClientKind kind) {
  switch (kind) {
    case ClientKind::kStream: return "stream";
    case ClientKind::kMessage: return "message";
  }
  return "unknown";
}

std::vector<ReceiverPtr>& ClientRegistry::MembersFor(ClientKind kind) {
  return kind == ClientKind::kStream ? stream_members_ : message_members_;
}

const std::vector<ReceiverPtr>& ClientRegistry::MembersFor(ClientKind kind) const {
  return kind == ClientKind::kStream ? stream_members_ : message_members_;
}

bool ClientRegistry::Register(const ReceiverPtr& receiver, ClientKind kind) {
  if (!receiver) return false;
  std::lock_guard<std::mutex> lock(mutex_);
  auto& members = MembersFor(kind);
  if (std::find(members.begin(), members.end(), receiver) != members.end()) {
    return false;
  }
  members.push_back(receiver);
  return true;
}

bool ClientRegistry::Unregister(const ReceiverPtr& receiver, ClientKind kind) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& members = MembersFor(kind);
  auto it = std::find(members.begin(), members.end(), receiver);
  if (it == members.end()) return false;
  members.erase(it);
  return true;
}

bool ClientRegistry::Contains(const ReceiverPtr& receiver, ClientKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto& members = MembersFor(kind);
  return std::find(members.begin(), members.end(), receiver) != members.end();
}

std::vector<ReceiverPtr> ClientRegistry::Snapshot(ClientKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return MembersFor(kind);
}

size_t ClientRegistry::Count(ClientKind kind) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return MembersFor(kind).size();
}

size_t ClientRegistry::TotalCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stream_members_.size() + message_members_.size();
}

}  // namespace pulsecast::broadcast
