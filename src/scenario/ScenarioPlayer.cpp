// Repository: Pulsecast
// Component: ScenarioPlayer Implementation
// Purpose: Paced replay worker with cooperative cancellation.
// Copyright (c) 2026 Pulsecast

#include "pulsecast/scenario/ScenarioPlayer.hpp"

#include <utility>

#include "pulsecast/util/Logger.hpp"

namespace pulsecast::scenario {

using pulsecast::util::Logger;

const char* SameScenarioPolicyName(SameScenarioPolicy policy) {
  switch (policy) {
    case SameScenarioPolicy::kRestart: return "restart";
    case SameScenarioPolicy::kIgnore: return "ignore";
  }
  return "unknown";
}

std::optional<SameScenarioPolicy> ParseSameScenarioPolicy(const std::string& name) {
  if (name == "restart") return SameScenarioPolicy::kRestart;
  if (name == "ignore") return SameScenarioPolicy::kIgnore;
  return std::nullopt;
}

namespace {

PlayerStatusCode CodeFor(LoadStatus status) {
  switch (status) {
    case LoadStatus::kNotFound: return PlayerStatusCode::kNotFound;
    case LoadStatus::kInvalidName: return PlayerStatusCode::kInvalidRequest;
    case LoadStatus::kMalformed: return PlayerStatusCode::kMalformedData;
    case LoadStatus::kOk: break;
  }
  return PlayerStatusCode::kMalformedData;
}

}  // namespace

ScenarioPlayer::ScenarioPlayer(std::shared_ptr<const IScenarioStore> store,
                               PlaybackCallbacks callbacks,
                               std::shared_ptr<const timing::ITimeSource> clock,
                               SameScenarioPolicy same_scenario_policy)
    : store_(std::move(store)),
      callbacks_(std::move(callbacks)),
      clock_(std::move(clock)),
      same_scenario_policy_(same_scenario_policy) {}

ScenarioPlayer::~ScenarioPlayer() {
  std::lock_guard<std::mutex> control(control_mutex_);
  CancelAndJoinLocked();
}

std::optional<std::string> ScenarioPlayer::CancelAndJoinLocked() {
  std::optional<std::string> stopped;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    cancel_requested_ = true;
    if (running_) {
      stopped = current_scenario_;
      running_ = false;
      current_scenario_.reset();
    }
  }
  cancel_cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
  return stopped;
}

PlayerResult ScenarioPlayer::Start(const std::string& name) {
  std::lock_guard<std::mutex> control(control_mutex_);

  if (same_scenario_policy_ == SameScenarioPolicy::kIgnore) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (running_ && current_scenario_ == name) {
      Logger::Info("[ScenarioPlayer] '" + name + "' already running; start ignored");
      return {true, "Scenario " + name + " already running", PlayerStatusCode::kOk};
    }
  }

  LoadResult load = store_->Load(name);
  if (!load.ok()) {
    Logger::Error("[ScenarioPlayer] Start refused: " + load.message);
    return {false, load.message, CodeFor(load.status)};
  }
  auto def = std::make_shared<const ScenarioDefinition>(std::move(*load.definition));

  if (auto stopped = CancelAndJoinLocked()) {
    Logger::Info("[ScenarioPlayer] Preempted '" + *stopped + "' for '" + name + "'");
    if (callbacks_.on_stopped) callbacks_.on_stopped(*stopped);
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    current_scenario_ = name;
    running_ = true;
    cancel_requested_ = false;
    events_emitted_ = 0;
  }

  Logger::Info("[ScenarioPlayer] Started '" + name + "' (" +
               std::to_string(def->event_count()) + " events, " +
               std::to_string(def->total_duration_ms()) + " ms)");
  if (callbacks_.on_started) callbacks_.on_started(name);

  worker_ = std::thread(&ScenarioPlayer::RunSession, this, def);
  return {true, "Started " + name + " scenario", PlayerStatusCode::kOk};
}

PlayerResult ScenarioPlayer::Stop() {
  std::lock_guard<std::mutex> control(control_mutex_);
  auto stopped = CancelAndJoinLocked();
  if (!stopped) {
    return {false, "no scenario running", PlayerStatusCode::kNotRunning};
  }
  Logger::Info("[ScenarioPlayer] Stopped '" + *stopped + "'");
  if (callbacks_.on_stopped) callbacks_.on_stopped(*stopped);
  return {true, "Scenario stopped", PlayerStatusCode::kOk};
}

PlaybackStatus ScenarioPlayer::Status() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  PlaybackStatus status;
  status.current_scenario = current_scenario_;
  status.running = running_;
  status.events_emitted = events_emitted_;
  return status;
}

bool ScenarioPlayer::IsRunning() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return running_;
}

void ScenarioPlayer::RunSession(std::shared_ptr<const ScenarioDefinition> def) {
  using Clock = std::chrono::steady_clock;
  const Clock::time_point anchor = Clock::now();
  const size_t count = def->event_count();

  for (size_t k = 0; k < count; ++k) {
    // Absolute deadlines from the anchor: late wakeups do not accumulate.
    const Clock::time_point deadline = anchor + std::chrono::milliseconds(def->RelativeOffsetMs(k));
    {
      std::unique_lock<std::mutex> lock(state_mutex_);
      if (cancel_cv_.wait_until(lock, deadline, [this] { return cancel_requested_; })) {
        Logger::Debug("[ScenarioPlayer] '" + def->name() + "' cancelled after " +
                      std::to_string(k) + " events");
        return;
      }
      ++events_emitted_;
    }

    const int64_t elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - anchor).count();
    event::BiometricEvent ev = def->MakeEvent(k, clock_->NowUtcMs(), elapsed_ms);
    if (callbacks_.on_event) callbacks_.on_event(ev);
  }

  // Completion is decided under the lock so a racing Stop() either sees the
  // session still running (and reports it stopped) or sees it finished.
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (cancel_requested_) return;
    running_ = false;
    current_scenario_.reset();
  }
  Logger::Info("[ScenarioPlayer] Completed '" + def->name() + "' (" + std::to_string(count) +
               " events)");
  if (callbacks_.on_completed) {
    callbacks_.on_completed(def->name(), static_cast<int64_t>(count), def->total_duration_ms());
  }
}

}  // namespace pulsecast::scenario
