// Repository: Pulsecast
// Component: BroadcastRouter
// Purpose: Fans each event out to both receiver populations, accepts commands
//          from any transport, and turns player lifecycle into broadcasts.
// Copyright (c) 2026 Pulsecast

#ifndef PULSECAST_BROADCAST_BROADCAST_ROUTER_HPP_
#define PULSECAST_BROADCAST_BROADCAST_ROUTER_HPP_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "pulsecast/broadcast/ClientRegistry.hpp"
#include "pulsecast/event/BiometricEvent.hpp"
#include "pulsecast/event/Command.hpp"
#include "pulsecast/scenario/IScenarioStore.hpp"
#include "pulsecast/scenario/ScenarioPlayer.hpp"
#include "pulsecast/timing/ITimeSource.hpp"

namespace pulsecast::broadcast {

struct RouterConfig {
  // Stop the running scenario once the last client of either kind is gone.
  bool stop_when_idle = true;
  scenario::SameScenarioPolicy same_scenario_policy = scenario::SameScenarioPolicy::kRestart;
};

struct CommandResult {
  bool success = false;
  std::string message;
  scenario::PlayerStatusCode code = scenario::PlayerStatusCode::kOk;
};

struct RouterStatus {
  scenario::PlaybackStatus playback;
  size_t stream_clients = 0;
  size_t message_clients = 0;
  uint64_t events_published = 0;
  uint64_t commands_accepted = 0;
  uint64_t commands_malformed = 0;
  uint64_t evictions = 0;
};

// BroadcastRouter owns the ScenarioPlayer and the ClientRegistry.
//
// Ordering:
//   - Publish() is serialized, so every receiver sees events in emission
//     order. Each payload is serialized once and handed to every member.
//   - Attach() delivers the welcome and registers under the same lock, so a
//     new receiver sees welcome first and then every later event exactly once.
//   - Commands run one at a time on the dispatcher thread, in arrival order,
//     regardless of which transport delivered them. Transport threads never
//     block on a player handoff.
//
// A receiver whose Deliver() returns false is unregistered on the spot; the
// rest of the fan-out continues.
class BroadcastRouter {
 public:
  BroadcastRouter(std::shared_ptr<const scenario::IScenarioStore> store,
                  std::shared_ptr<const timing::ITimeSource> clock,
                  RouterConfig config = RouterConfig());
  ~BroadcastRouter();

  BroadcastRouter(const BroadcastRouter&) = delete;
  BroadcastRouter& operator=(const BroadcastRouter&) = delete;

  // Returns the number of receivers the payload was handed to.
  size_t Publish(const event::BiometricEvent& ev);

  // Raw command text from a transport. Malformed input is logged and
  // discarded (returns false); the connection is left alone.
  bool ReceiveCommand(const std::string& text, const std::string& origin);

  // Queues a command for the dispatcher. After Shutdown() the future is
  // already satisfied with a failure.
  std::future<CommandResult> Submit(const event::Command& command);

  // Submit() and wait. Must not be called from a player callback.
  CommandResult Execute(const event::Command& command);

  // Sends the welcome event, then registers. Returns false (and does not
  // register) if the welcome could not be delivered.
  bool Attach(const ReceiverPtr& receiver, ClientKind kind);

  // Unregisters. May trigger the idle stop.
  void Detach(const ReceiverPtr& receiver, ClientKind kind);

  RouterStatus Status() const;
  std::vector<std::string> ListScenarios() const;
  const ClientRegistry& registry() const { return registry_; }

  // Stops the dispatcher (pending commands fail), then stops the player so a
  // running scenario is announced as stopped. Idempotent.
  void Shutdown();

 private:
  struct PendingCommand {
    event::Command command;
    bool only_if_idle = false;
    std::promise<CommandResult> promise;
  };

  void DispatcherLoop();
  CommandResult Dispatch(const PendingCommand& pending);
  void Enqueue(PendingCommand pending, std::future<CommandResult>* future_out);
  void RequestIdleStopIfEmpty();
  int64_t Now() const { return clock_->NowUtcMs(); }

  std::shared_ptr<const scenario::IScenarioStore> store_;
  std::shared_ptr<const timing::ITimeSource> clock_;
  RouterConfig config_;
  ClientRegistry registry_;

  // Serializes fan-out and welcome-then-register.
  std::mutex publish_mutex_;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<PendingCommand> queue_;
  bool shutting_down_ = false;
  std::thread dispatcher_;

  std::atomic<uint64_t> events_published_{0};
  std::atomic<uint64_t> commands_accepted_{0};
  std::atomic<uint64_t> commands_malformed_{0};
  std::atomic<uint64_t> evictions_{0};

  // Declared last: destroyed first, while the members its callbacks touch
  // are still alive.
  std::unique_ptr<scenario::ScenarioPlayer> player_;
};

}  // namespace pulsecast::broadcast

#endif  // PULSECAST_BROADCAST_BROADCAST_ROUTER_HPP_
