// Repository: Pulsecast
// Component: ScenarioPlayer Contract Tests
// Purpose: Pacing, completion, preemption, stop latency and load-failure
//          behaviour of the replay worker.
// Copyright (c) 2026 Pulsecast

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include "fixtures/InMemoryScenarioStore.h"
#include "pulsecast/scenario/ScenarioPlayer.hpp"
#include "pulsecast/util/Logger.hpp"
#include "support/FixedTimeSource.hpp"

namespace pulsecast::tests::contracts {

using scenario::PlayerStatusCode;
using scenario::SameScenarioPolicy;
using scenario::ScenarioPlayer;
using Clock = std::chrono::steady_clock;

namespace {

// Collects every callback as a tagged line ("started:A", "event:A:0", ...) in
// the order the player fired them.
class CallbackLog {
 public:
  scenario::PlaybackCallbacks Callbacks() {
    scenario::PlaybackCallbacks cb;
    cb.on_started = [this](const std::string& name) { Add("started:" + name); };
    cb.on_event = [this](const event::BiometricEvent& ev) {
      const auto& hb = std::get<event::HeartbeatPayload>(ev.payload());
      {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(ev.ToJson());
        event_times_.push_back(Clock::now());
      }
      Add("event:" + ev.scenario().value_or("") + ":" + std::to_string(hb.event_number));
    };
    cb.on_completed = [this](const std::string& name, int64_t total, int64_t duration) {
      {
        std::lock_guard<std::mutex> lock(mutex_);
        last_total_ = total;
        last_duration_ = duration;
      }
      Add("completed:" + name);
    };
    cb.on_stopped = [this](const std::string& name) { Add("stopped:" + name); };
    return cb;
  }

  bool WaitFor(const std::string& entry, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] {
      return std::find(entries_.begin(), entries_.end(), entry) != entries_.end();
    });
  }

  std::vector<std::string> Entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
  }

  size_t CountPrefix(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
        [&](const std::string& e) { return e.rfind(prefix, 0) == 0; }));
  }

  std::vector<util::JsonValue> Events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

  std::vector<Clock::time_point> EventTimes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return event_times_;
  }

  int64_t last_total() const { std::lock_guard<std::mutex> lock(mutex_); return last_total_; }
  int64_t last_duration() const { std::lock_guard<std::mutex> lock(mutex_); return last_duration_; }

 private:
  void Add(const std::string& entry) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      entries_.push_back(entry);
    }
    cv_.notify_all();
  }

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> entries_;
  std::vector<util::JsonValue> events_;
  std::vector<Clock::time_point> event_times_;
  int64_t last_total_ = -1;
  int64_t last_duration_ = -1;
};

size_t IndexOf(const std::vector<std::string>& entries, const std::string& entry) {
  return static_cast<size_t>(std::find(entries.begin(), entries.end(), entry) - entries.begin());
}

}  // namespace

class ScenarioPlayerContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    util::Logger::SetErrorSink([](const std::string&) {});
    store_ = std::make_shared<fixtures::InMemoryScenarioStore>();
    clock_ = std::make_shared<FixedTimeSource>();
    store_->PutOffsets("quick", {0, 50, 100, 150});
    store_->PutOffsets("long", {0, 40, 80, 120, 160, 200, 240, 280, 320, 360, 400,
                                5000, 10000});
    store_->PutOffsets("slow", {0, 5000, 10000});
    store_->PutOffsets("stalls", {0, 20, 40, 60, 5060});
    store_->PutOffsets("endless", {0, std::numeric_limits<int64_t>::max() / 2});
    store_->PutText("bad", "[0]");
  }

  void TearDown() override { util::Logger::SetErrorSink(nullptr); }

  std::unique_ptr<ScenarioPlayer> MakePlayer(
      SameScenarioPolicy policy = SameScenarioPolicy::kRestart) {
    return std::make_unique<ScenarioPlayer>(store_, log_.Callbacks(), clock_, policy);
  }

  std::shared_ptr<fixtures::InMemoryScenarioStore> store_;
  std::shared_ptr<FixedTimeSource> clock_;
  CallbackLog log_;
};

TEST_F(ScenarioPlayerContractTest, EmitsOneEventPerIntervalWithRealTimePacing)
{
  auto player = MakePlayer();
  const auto t0 = Clock::now();
  auto result = player->Start("quick");
  ASSERT_TRUE(result.success) << result.message;
  EXPECT_EQ(result.message, "Started quick scenario");

  ASSERT_TRUE(log_.WaitFor("completed:quick", std::chrono::seconds(3)));

  auto events = log_.Events();
  ASSERT_EQ(events.size(), 3u);
  const std::vector<int64_t> expected_intervals{50, 50, 50};
  const std::vector<int64_t> offsets{50, 100, 150};
  auto times = log_.EventTimes();
  for (size_t k = 0; k < events.size(); ++k) {
    int64_t interval = 0;
    int64_t number = -1;
    int64_t elapsed = -1;
    ASSERT_TRUE(util::GetInt(events[k], "interval_ms", &interval));
    ASSERT_TRUE(util::GetInt(events[k], "event_number", &number));
    ASSERT_TRUE(util::GetInt(events[k], "elapsed_ms", &elapsed));
    EXPECT_EQ(interval, expected_intervals[k]);
    EXPECT_EQ(number, static_cast<int64_t>(k));
    // Never early relative to the session anchor.
    EXPECT_GE(elapsed, offsets[k]);
    auto since_start =
        std::chrono::duration_cast<std::chrono::milliseconds>(times[k] - t0).count();
    EXPECT_GE(since_start, offsets[k]);
  }

  // Total span tracks the sum of intervals.
  auto span = std::chrono::duration_cast<std::chrono::milliseconds>(times.back() - t0).count();
  EXPECT_LT(span, 150 + 500);

  EXPECT_EQ(log_.last_total(), 3);
  EXPECT_EQ(log_.last_duration(), 150);

  auto status = player->Status();
  EXPECT_FALSE(status.running);
  EXPECT_FALSE(status.current_scenario.has_value());
  EXPECT_EQ(status.events_emitted, 3);
}

TEST_F(ScenarioPlayerContractTest, EventsCarryTimeSourceTimestampAndScenario)
{
  clock_->SetMs(1'234'567'000'000);
  auto player = MakePlayer();
  ASSERT_TRUE(player->Start("quick").success);
  ASSERT_TRUE(log_.WaitFor("completed:quick", std::chrono::seconds(3)));

  for (const auto& ev : log_.Events()) {
    int64_t ts = 0;
    std::string scenario;
    ASSERT_TRUE(util::GetInt(ev, "timestamp", &ts));
    ASSERT_TRUE(util::GetString(ev, "scenario", &scenario));
    EXPECT_EQ(ts, 1'234'567'000'000);
    EXPECT_EQ(scenario, "quick");
  }
}

TEST_F(ScenarioPlayerContractTest, StatusReportsRunningSession)
{
  auto player = MakePlayer();
  ASSERT_TRUE(player->Start("slow").success);
  auto status = player->Status();
  EXPECT_TRUE(status.running);
  ASSERT_TRUE(status.current_scenario.has_value());
  EXPECT_EQ(*status.current_scenario, "slow");
  EXPECT_TRUE(player->IsRunning());
  EXPECT_TRUE(player->Stop().success);
}

TEST_F(ScenarioPlayerContractTest, StopEndsEmissionPromptlyAndSuppressesCompletion)
{
  auto player = MakePlayer();
  ASSERT_TRUE(player->Start("slow").success);

  const auto t0 = Clock::now();
  auto result = player->Stop();
  const auto stop_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0).count();

  EXPECT_TRUE(result.success);
  EXPECT_EQ(result.message, "Scenario stopped");
  // The worker was waiting on a 5 s interval; it must not sleep it out.
  EXPECT_LT(stop_ms, 1000);
  EXPECT_FALSE(player->IsRunning());

  EXPECT_EQ(log_.CountPrefix("completed:"), 0u);
  EXPECT_EQ(log_.CountPrefix("event:"), 0u);
  EXPECT_EQ(log_.CountPrefix("stopped:slow"), 1u);
}

TEST_F(ScenarioPlayerContractTest, StopAfterSomeEventsEndsWithinOneInterval)
{
  auto player = MakePlayer();
  ASSERT_TRUE(player->Start("stalls").success);
  ASSERT_TRUE(log_.WaitFor("event:stalls:2", std::chrono::seconds(3)));

  // The fourth event is 5 s away; Stop must cut the wait short.
  const auto t0 = Clock::now();
  auto result = player->Stop();
  const auto stop_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0).count();

  EXPECT_TRUE(result.success);
  EXPECT_LT(stop_ms, 1000);
  EXPECT_EQ(log_.CountPrefix("event:stalls:"), 3u);
  EXPECT_EQ(log_.CountPrefix("completed:"), 0u);
  EXPECT_EQ(log_.CountPrefix("stopped:stalls"), 1u);

  // Nothing trickles out after Stop has returned.
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_EQ(log_.CountPrefix("event:"), 3u);
  EXPECT_EQ(player->Status().events_emitted, 3);
}

TEST_F(ScenarioPlayerContractTest, OversizedSpanIsRejectedBeforePlayback)
{
  auto player = MakePlayer();
  auto result = player->Start("endless");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.code, PlayerStatusCode::kMalformedData);
  EXPECT_FALSE(player->IsRunning());
  EXPECT_EQ(log_.CountPrefix("started:"), 0u);
  EXPECT_EQ(log_.CountPrefix("event:"), 0u);
}

TEST_F(ScenarioPlayerContractTest, StopWithNothingRunningReportsNotRunning)
{
  auto player = MakePlayer();
  auto result = player->Stop();
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.code, PlayerStatusCode::kNotRunning);
  EXPECT_EQ(log_.CountPrefix("stopped:"), 0u);
}

TEST_F(ScenarioPlayerContractTest, PreemptionJoinsPreviousSessionBeforeNewStart)
{
  auto player = MakePlayer();
  ASSERT_TRUE(player->Start("long").success);
  ASSERT_TRUE(log_.WaitFor("event:long:2", std::chrono::seconds(3)));

  ASSERT_TRUE(player->Start("quick").success);
  ASSERT_TRUE(log_.WaitFor("completed:quick", std::chrono::seconds(3)));

  auto entries = log_.Entries();
  const size_t stopped_a = IndexOf(entries, "stopped:long");
  const size_t started_b = IndexOf(entries, "started:quick");
  ASSERT_LT(stopped_a, entries.size());
  ASSERT_LT(started_b, entries.size());
  EXPECT_LT(stopped_a, started_b);

  // Nothing from the preempted session after the new one began.
  for (size_t i = started_b; i < entries.size(); ++i) {
    EXPECT_NE(entries[i].rfind("event:long:", 0), 0u) << entries[i];
  }
  EXPECT_EQ(std::count(entries.begin(), entries.end(), "completed:long"), 0);
}

TEST_F(ScenarioPlayerContractTest, FailedStartLeavesRunningSessionUntouched)
{
  auto player = MakePlayer();
  ASSERT_TRUE(player->Start("slow").success);

  auto missing = player->Start("missing");
  EXPECT_FALSE(missing.success);
  EXPECT_EQ(missing.code, PlayerStatusCode::kNotFound);
  EXPECT_NE(missing.message.find("not found"), std::string::npos);

  auto bad = player->Start("bad");
  EXPECT_FALSE(bad.success);
  EXPECT_EQ(bad.code, PlayerStatusCode::kMalformedData);

  auto status = player->Status();
  EXPECT_TRUE(status.running);
  EXPECT_EQ(status.current_scenario.value_or(""), "slow");
  EXPECT_EQ(log_.CountPrefix("stopped:"), 0u);
  EXPECT_EQ(log_.CountPrefix("started:"), 1u);

  player->Stop();
}

TEST_F(ScenarioPlayerContractTest, DefinitionIsLoadedOnEveryStart)
{
  auto player = MakePlayer();
  ASSERT_TRUE(player->Start("quick").success);
  ASSERT_TRUE(log_.WaitFor("completed:quick", std::chrono::seconds(3)));
  store_->PutOffsets("quick", {0, 10});
  const int loads_before = store_->LoadCount();

  ASSERT_TRUE(player->Start("quick").success);
  EXPECT_EQ(store_->LoadCount(), loads_before + 1);
  ASSERT_TRUE(log_.WaitFor("completed:quick", std::chrono::seconds(3)));
  EXPECT_EQ(log_.last_total(), 1);
  EXPECT_EQ(log_.last_duration(), 10);
}

TEST_F(ScenarioPlayerContractTest, SameScenarioRestartsByDefault)
{
  auto player = MakePlayer(SameScenarioPolicy::kRestart);
  ASSERT_TRUE(player->Start("slow").success);
  ASSERT_TRUE(player->Start("slow").success);

  auto entries = log_.Entries();
  ASSERT_EQ(entries.size(), 3u);
  EXPECT_EQ(entries[0], "started:slow");
  EXPECT_EQ(entries[1], "stopped:slow");
  EXPECT_EQ(entries[2], "started:slow");
  player->Stop();
}

TEST_F(ScenarioPlayerContractTest, SameScenarioIgnoredWhenConfigured)
{
  auto player = MakePlayer(SameScenarioPolicy::kIgnore);
  ASSERT_TRUE(player->Start("slow").success);
  auto again = player->Start("slow");
  EXPECT_TRUE(again.success);
  EXPECT_EQ(again.message, "Scenario slow already running");
  EXPECT_EQ(log_.CountPrefix("started:"), 1u);
  EXPECT_EQ(log_.CountPrefix("stopped:"), 0u);
  player->Stop();
}

TEST_F(ScenarioPlayerContractTest, DestructionCancelsWithoutCallbacks)
{
  {
    auto player = MakePlayer();
    ASSERT_TRUE(player->Start("slow").success);
  }
  EXPECT_EQ(log_.CountPrefix("stopped:"), 0u);
  EXPECT_EQ(log_.CountPrefix("completed:"), 0u);
}

TEST(SameScenarioPolicyTest, NamesRoundTrip)
{
  EXPECT_EQ(scenario::ParseSameScenarioPolicy("restart"), SameScenarioPolicy::kRestart);
  EXPECT_EQ(scenario::ParseSameScenarioPolicy("ignore"), SameScenarioPolicy::kIgnore);
  EXPECT_FALSE(scenario::ParseSameScenarioPolicy("queue").has_value());
  EXPECT_STREQ(scenario::SameScenarioPolicyName(SameScenarioPolicy::kIgnore), "ignore");
}

}  // namespace pulsecast::tests::contracts
