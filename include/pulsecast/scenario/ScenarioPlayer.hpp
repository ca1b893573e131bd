// Repository: Pulsecast
// Component: ScenarioPlayer
// Purpose: Replays one named timing sequence on a dedicated worker thread with
//          real-time pacing. Preemptible: a start while running stops the
//          current session and joins its worker before the new one begins.
// Copyright (c) 2026 Pulsecast

#ifndef PULSECAST_SCENARIO_SCENARIO_PLAYER_HPP_
#define PULSECAST_SCENARIO_SCENARIO_PLAYER_HPP_

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "pulsecast/event/BiometricEvent.hpp"
#include "pulsecast/scenario/IScenarioStore.hpp"
#include "pulsecast/timing/ITimeSource.hpp"

namespace pulsecast::scenario {

// Lifecycle and event callbacks. Invoked without any player lock held:
//   on_started   - on the thread calling Start(), before the worker spawns
//   on_event     - on the worker thread, once per emitted event
//   on_completed - on the worker thread, only after natural exhaustion
//   on_stopped   - on the thread calling Start()/Stop(), after the stopped
//                  session's worker has been joined
// Callbacks must not call Start() or Stop() on the same player.
struct PlaybackCallbacks {
  std::function<void(const std::string& scenario)> on_started;
  std::function<void(const event::BiometricEvent& ev)> on_event;
  std::function<void(const std::string& scenario, int64_t total_events,
                     int64_t total_duration_ms)> on_completed;
  std::function<void(const std::string& scenario)> on_stopped;
};

enum class PlayerStatusCode {
  kOk,
  kNotFound,        // scenario name unknown to the store
  kInvalidRequest,  // scenario name rejected
  kMalformedData,   // scenario data unparseable or invalid
  kNotRunning,      // stop with nothing running
};

struct PlayerResult {
  bool success = false;
  std::string message;
  PlayerStatusCode code = PlayerStatusCode::kOk;
};

struct PlaybackStatus {
  std::optional<std::string> current_scenario;  // set only while running
  bool running = false;
  int64_t events_emitted = 0;                   // in the current or last session
};

// What Start() does when asked for the scenario that is already running.
enum class SameScenarioPolicy {
  kRestart,  // stop, then replay from offset 0
  kIgnore,   // keep the running session, report success
};

const char* SameScenarioPolicyName(SameScenarioPolicy policy);
std::optional<SameScenarioPolicy> ParseSameScenarioPolicy(const std::string& name);

class ScenarioPlayer {
 public:
  ScenarioPlayer(std::shared_ptr<const IScenarioStore> store,
                 PlaybackCallbacks callbacks,
                 std::shared_ptr<const timing::ITimeSource> clock,
                 SameScenarioPolicy same_scenario_policy = SameScenarioPolicy::kRestart);

  // Cancels and joins any running worker. No callbacks fire from here.
  ~ScenarioPlayer();

  ScenarioPlayer(const ScenarioPlayer&) = delete;
  ScenarioPlayer& operator=(const ScenarioPlayer&) = delete;

  // Loads the definition first. A load failure returns an error and leaves
  // any running session untouched. Otherwise the running session (if any) is
  // stopped and joined, on_started fires, and the new worker begins.
  PlayerResult Start(const std::string& name);

  // Requests cancellation and joins the worker. The worker wakes from its
  // interval wait immediately; no completion is reported for a stopped run.
  PlayerResult Stop();

  PlaybackStatus Status() const;
  bool IsRunning() const;

 private:
  void RunSession(std::shared_ptr<const ScenarioDefinition> def);

  // Caller holds control_mutex_. Returns the stopped scenario's name when a
  // session was still running.
  std::optional<std::string> CancelAndJoinLocked();

  std::shared_ptr<const IScenarioStore> store_;
  PlaybackCallbacks callbacks_;
  std::shared_ptr<const timing::ITimeSource> clock_;
  SameScenarioPolicy same_scenario_policy_;

  // Serializes Start/Stop and owns worker_.
  std::mutex control_mutex_;
  std::thread worker_;

  // Session state shared with the worker.
  mutable std::mutex state_mutex_;
  std::condition_variable cancel_cv_;
  std::optional<std::string> current_scenario_;
  bool running_ = false;
  bool cancel_requested_ = false;
  int64_t events_emitted_ = 0;
};

}  // namespace pulsecast::scenario

#endif  // PULSECAST_SCENARIO_SCENARIO_PLAYER_HPP_
