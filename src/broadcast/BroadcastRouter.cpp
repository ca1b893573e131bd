// Repository: Pulsecast
// Component: BroadcastRouter Implementation
// Purpose: Fan-out, command intake and lifecycle broadcasts.
// Copyright (c) 2026 Pulsecast

#include "pulsecast/broadcast/BroadcastRouter.hpp"

#include <utility>

#include "pulsecast/util/Logger.hpp"

namespace pulsecast::broadcast {

using pulsecast::util::Logger;

BroadcastRouter::BroadcastRouter(std::shared_ptr<const scenario::IScenarioStore> store,
                                 std::shared_ptr<const timing::ITimeSource> clock,
                                 RouterConfig config)
    : store_(std::move(store)), clock_(std::move(clock)), config_(config) {
  scenario::PlaybackCallbacks callbacks;
  callbacks.on_started = [this](const std::string& name) {
    Publish(event::BiometricEvent::ScenarioStarted(Now(), name));
  };
  callbacks.on_event = [this](const event::BiometricEvent& ev) { Publish(ev); };
  callbacks.on_completed = [this](const std::string& name, int64_t total_events,
                                  int64_t total_duration_ms) {
    Publish(event::BiometricEvent::ScenarioComplete(Now(), name, total_events,
                                                    total_duration_ms));
  };
  callbacks.on_stopped = [this](const std::string& name) {
    Publish(event::BiometricEvent::ScenarioStopped(Now(), name));
  };
  player_ = std::make_unique<scenario::ScenarioPlayer>(store_, std::move(callbacks), clock_,
                                                       config_.same_scenario_policy);
  dispatcher_ = std::thread(&BroadcastRouter::DispatcherLoop, this);
}

BroadcastRouter::~BroadcastRouter() {
  Shutdown();
}

void BroadcastRouter::Shutdown() {
  std::deque<PendingCommand> abandoned;
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (shutting_down_) return;
    shutting_down_ = true;
    abandoned.swap(queue_);
  }
  queue_cv_.notify_all();
  if (dispatcher_.joinable()) {
    dispatcher_.join();
  }
  for (auto& pending : abandoned) {
    pending.promise.set_value({false, "router shutting down",
                               scenario::PlayerStatusCode::kNotRunning});
  }
  if (player_) {
    player_->Stop();
  }
  Logger::Info("[BroadcastRouter] Shut down");
}

size_t BroadcastRouter::Publish(const event::BiometricEvent& ev) {
  const std::string payload = ev.Serialize();
  size_t delivered = 0;
  bool evicted_any = false;
  {
    std::lock_guard<std::mutex> lock(publish_mutex_);
    for (ClientKind kind : {ClientKind::kStream, ClientKind::kMessage}) {
      for (const auto& receiver : registry_.Snapshot(kind)) {
        if (receiver->Deliver(payload)) {
          ++delivered;
          continue;
        }
        if (registry_.Unregister(receiver, kind)) {
          evictions_.fetch_add(1, std::memory_order_relaxed);
          evicted_any = true;
          Logger::Warn("[BroadcastRouter] Evicted " + std::string(ClientKindName(kind)) +
                       " client " + receiver->GetName() + " after failed send");
        }
      }
    }
  }
  events_published_.fetch_add(1, std::memory_order_relaxed);
  Logger::Debug("[BroadcastRouter] " + std::string(event::EventTypeName(ev.type())) +
                " -> " + std::to_string(delivered) + " clients");
  if (evicted_any) {
    RequestIdleStopIfEmpty();
  }
  return delivered;
}

bool BroadcastRouter::ReceiveCommand(const std::string& text, const std::string& origin) {
  event::CommandParseResult parsed = event::ParseCommand(text);
  if (!parsed.command) {
    commands_malformed_.fetch_add(1, std::memory_order_relaxed);
    Logger::Warn("[BroadcastRouter] Discarding malformed command from " + origin + ": " +
                 parsed.error);
    return false;
  }
  if (parsed.command->type == event::CommandType::kClientHeartbeat) {
    Logger::Debug("[BroadcastRouter] Client heartbeat from " + origin);
    return true;
  }

  commands_accepted_.fetch_add(1, std::memory_order_relaxed);
  Logger::Info("[BroadcastRouter] " + std::string(event::CommandTypeName(parsed.command->type)) +
               (parsed.command->scenario.empty() ? "" : " '" + parsed.command->scenario + "'") +
               " from " + origin);
  // Result is logged by the dispatcher; the transport does not wait for it.
  Submit(*parsed.command);
  return true;
}

void BroadcastRouter::Enqueue(PendingCommand pending, std::future<CommandResult>* future_out) {
  *future_out = pending.promise.get_future();
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (!shutting_down_) {
      queue_.push_back(std::move(pending));
      queue_cv_.notify_one();
      return;
    }
  }
  pending.promise.set_value({false, "router shutting down",
                             scenario::PlayerStatusCode::kNotRunning});
}

std::future<CommandResult> BroadcastRouter::Submit(const event::Command& command) {
  PendingCommand pending;
  pending.command = command;
  std::future<CommandResult> future;
  Enqueue(std::move(pending), &future);
  return future;
}

CommandResult BroadcastRouter::Execute(const event::Command& command) {
  return Submit(command).get();
}

void BroadcastRouter::RequestIdleStopIfEmpty() {
  if (!config_.stop_when_idle) return;
  if (registry_.TotalCount() != 0 || !player_->IsRunning()) return;
  PendingCommand pending;
  pending.command = event::Command::Stop();
  pending.only_if_idle = true;
  std::future<CommandResult> ignored;
  Enqueue(std::move(pending), &ignored);
}

void BroadcastRouter::DispatcherLoop() {
  while (true) {
    PendingCommand pending;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return shutting_down_ || !queue_.empty(); });
      if (shutting_down_) return;
      pending = std::move(queue_.front());
      queue_.pop_front();
    }
    CommandResult result = Dispatch(pending);
    pending.promise.set_value(result);
  }
}

CommandResult BroadcastRouter::Dispatch(const PendingCommand& pending) {
  const event::Command& cmd = pending.command;

  if (pending.only_if_idle) {
    // A client may have connected since the stop was requested.
    if (registry_.TotalCount() != 0 || !player_->IsRunning()) {
      return {false, "idle stop skipped", scenario::PlayerStatusCode::kOk};
    }
    Logger::Info("[BroadcastRouter] No clients left; stopping scenario");
  }

  scenario::PlayerResult r;
  switch (cmd.type) {
    case event::CommandType::kStartScenario:
      r = player_->Start(cmd.scenario);
      break;
    case event::CommandType::kStopScenario:
      r = player_->Stop();
      break;
    case event::CommandType::kClientHeartbeat:
      return {true, "heartbeat noted", scenario::PlayerStatusCode::kOk};
  }
  if (!r.success) {
    Logger::Warn("[BroadcastRouter] " + std::string(event::CommandTypeName(cmd.type)) +
                 " failed: " + r.message);
  }
  return {r.success, r.message, r.code};
}

bool BroadcastRouter::Attach(const ReceiverPtr& receiver, ClientKind kind) {
  if (!receiver) return false;
  const std::string welcome = event::BiometricEvent::Welcome(Now()).Serialize();
  {
    std::lock_guard<std::mutex> lock(publish_mutex_);
    if (!receiver->Deliver(welcome)) {
      Logger::Warn("[BroadcastRouter] Welcome to " + receiver->GetName() + " failed");
      return false;
    }
    registry_.Register(receiver, kind);
  }
  Logger::Info("[BroadcastRouter] " + std::string(ClientKindName(kind)) + " client " +
               receiver->GetName() + " attached (stream=" +
               std::to_string(registry_.Count(ClientKind::kStream)) + ", message=" +
               std::to_string(registry_.Count(ClientKind::kMessage)) + ")");
  return true;
}

void BroadcastRouter::Detach(const ReceiverPtr& receiver, ClientKind kind) {
  if (!registry_.Unregister(receiver, kind)) return;
  Logger::Info("[BroadcastRouter] " + std::string(ClientKindName(kind)) + " client " +
               receiver->GetName() + " detached");
  RequestIdleStopIfEmpty();
}

RouterStatus BroadcastRouter::Status() const {
  RouterStatus status;
  status.playback = player_->Status();
  status.stream_clients = registry_.Count(ClientKind::kStream);
  status.message_clients = registry_.Count(ClientKind::kMessage);
  status.events_published = events_published_.load(std::memory_order_relaxed);
  status.commands_accepted = commands_accepted_.load(std::memory_order_relaxed);
  status.commands_malformed = commands_malformed_.load(std::memory_order_relaxed);
  status.evictions = evictions_.load(std::memory_order_relaxed);
  return status;
}

std::vector<std::string> BroadcastRouter::ListScenarios() const {
  return store_->List();
}

}  // namespace pulsecast::broadcast
