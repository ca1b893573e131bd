// Repository: Pulsecast
// Component: SchedulerBridge Contract Tests
// Purpose: Cross-thread hand-off into the cooperative loop.
// Copyright (c) 2026 Pulsecast

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "pulsecast/bridge/SchedulerBridge.hpp"
#include "pulsecast/util/Logger.hpp"

namespace pulsecast::tests::contracts {

using bridge::SchedulerBridge;

namespace {

constexpr auto kWait = std::chrono::seconds(3);

// Collects consumer invocations and whether they ran on the loop.
class Collector {
 public:
  void Add(const std::string& payload, bool on_loop) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      payloads_.push_back(payload);
      if (!on_loop) off_loop_++;
    }
    cv_.notify_all();
  }

  bool WaitFor(size_t n) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, kWait, [&] { return payloads_.size() >= n; });
  }

  std::vector<std::string> Payloads() {
    std::lock_guard<std::mutex> lock(mutex_);
    return payloads_;
  }

  int OffLoop() {
    std::lock_guard<std::mutex> lock(mutex_);
    return off_loop_;
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::string> payloads_;
  int off_loop_ = 0;
};

// Returns once every handler posted before it has run.
bool Quiesce(SchedulerBridge& bridge) {
  auto done = std::make_shared<std::promise<void>>();
  auto fut = done->get_future();
  if (!bridge.Post([done] { done->set_value(); })) return false;
  return fut.wait_for(kWait) == std::future_status::ready;
}

}  // namespace

TEST(SchedulerBridgeContractTest, PostRunsOnLoopThread)
{
  SchedulerBridge bridge;
  bridge.Start();
  EXPECT_TRUE(bridge.IsRunning());
  EXPECT_FALSE(bridge.IsLoopThread());

  auto on_loop = std::make_shared<std::promise<bool>>();
  auto fut = on_loop->get_future();
  ASSERT_TRUE(bridge.Post([&bridge, on_loop] { on_loop->set_value(bridge.IsLoopThread()); }));
  ASSERT_EQ(fut.wait_for(kWait), std::future_status::ready);
  EXPECT_TRUE(fut.get());
}

TEST(SchedulerBridgeContractTest, PostFailsWhenNotRunning)
{
  SchedulerBridge bridge;
  EXPECT_FALSE(bridge.Post([] {}));

  bridge.Start();
  EXPECT_TRUE(bridge.Post([] {}));
  bridge.Stop();
  EXPECT_FALSE(bridge.IsRunning());
  EXPECT_FALSE(bridge.Post([] {}));
}

TEST(SchedulerBridgeContractTest, StartAndStopAreIdempotent)
{
  SchedulerBridge bridge;
  bridge.Start();
  bridge.Start();
  EXPECT_TRUE(Quiesce(bridge));
  bridge.Stop();
  bridge.Stop();
  EXPECT_FALSE(bridge.IsRunning());
}

TEST(SchedulerBridgeContractTest, SubscriptionDeliversFifoOnLoop)
{
  SchedulerBridge bridge;
  bridge.Start();

  Collector collector;
  auto sub = bridge.Subscribe([&](const std::string& payload) {
    collector.Add(payload, bridge.IsLoopThread());
  });

  // A single producer thread, like the router's fan-out.
  constexpr int kCount = 500;
  std::thread producer([&] {
    for (int i = 0; i < kCount; ++i) {
      EXPECT_TRUE(sub->Push(std::to_string(i)));
    }
  });
  producer.join();

  ASSERT_TRUE(collector.WaitFor(kCount));
  auto payloads = collector.Payloads();
  ASSERT_EQ(payloads.size(), static_cast<size_t>(kCount));
  for (int i = 0; i < kCount; ++i) {
    EXPECT_EQ(payloads[i], std::to_string(i));
  }
  EXPECT_EQ(collector.OffLoop(), 0);
  EXPECT_EQ(sub->Pending(), 0u);
  sub->Close();
}

TEST(SchedulerBridgeContractTest, PushNeverWaitsOnConsumer)
{
  SchedulerBridge bridge;
  bridge.Start();

  std::promise<void> release;
  auto gate = release.get_future().share();
  std::atomic<int> consumed{0};
  auto sub = bridge.Subscribe([gate, &consumed](const std::string&) {
    gate.wait();
    consumed++;
  });

  const auto begin = std::chrono::steady_clock::now();
  for (int i = 0; i < 20; ++i) {
    EXPECT_TRUE(sub->Push("x"));
  }
  EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(500));
  EXPECT_EQ(consumed.load(), 0);

  release.set_value();
  EXPECT_TRUE(Quiesce(bridge));
  EXPECT_TRUE(Quiesce(bridge));
  EXPECT_EQ(consumed.load(), 20);
  sub->Close();
}

TEST(SchedulerBridgeContractTest, PushBeforeStartIsDeliveredOnceRunning)
{
  SchedulerBridge bridge;
  Collector collector;
  auto sub = bridge.Subscribe([&](const std::string& payload) {
    collector.Add(payload, bridge.IsLoopThread());
  });
  EXPECT_TRUE(sub->Push("early"));

  bridge.Start();
  ASSERT_TRUE(collector.WaitFor(1));
  EXPECT_EQ(collector.Payloads()[0], "early");
  sub->Close();
}

TEST(SchedulerBridgeContractTest, CloseAffectsOnlyThatSubscription)
{
  SchedulerBridge bridge;
  bridge.Start();

  Collector a;
  Collector b;
  auto sub_a = bridge.Subscribe([&](const std::string& p) { a.Add(p, true); });
  auto sub_b = bridge.Subscribe([&](const std::string& p) { b.Add(p, true); });
  EXPECT_NE(sub_a->id(), sub_b->id());

  sub_a->Close();
  sub_a->Close();
  EXPECT_TRUE(sub_a->IsClosed());
  EXPECT_FALSE(sub_a->Push("dropped"));
  EXPECT_TRUE(sub_b->Push("kept"));

  ASSERT_TRUE(b.WaitFor(1));
  EXPECT_TRUE(Quiesce(bridge));
  EXPECT_TRUE(a.Payloads().empty());
  EXPECT_EQ(b.Payloads(), std::vector<std::string>{"kept"});
  sub_b->Close();
}

TEST(SchedulerBridgeContractTest, CloseDropsQueuedPayloads)
{
  SchedulerBridge bridge;
  bridge.Start();

  std::promise<void> release;
  auto gate = release.get_future().share();
  std::atomic<bool> entered{false};
  ASSERT_TRUE(bridge.Post([gate, &entered] {
    entered = true;
    gate.wait();
  }));

  Collector collector;
  auto sub = bridge.Subscribe([&](const std::string& p) { collector.Add(p, true); });
  sub->Push("one");
  sub->Push("two");
  EXPECT_EQ(sub->Pending(), 2u);
  sub->Close();
  EXPECT_EQ(sub->Pending(), 0u);

  release.set_value();
  EXPECT_TRUE(Quiesce(bridge));
  EXPECT_TRUE(entered.load());
  EXPECT_TRUE(collector.Payloads().empty());
}

TEST(SchedulerBridgeContractTest, ThrowingHandlerDoesNotStopLoop)
{
  util::Logger::SetErrorSink([](const std::string&) {});
  SchedulerBridge bridge;
  bridge.Start();

  ASSERT_TRUE(bridge.Post([] { throw std::runtime_error("boom"); }));
  EXPECT_TRUE(Quiesce(bridge));
  EXPECT_TRUE(bridge.IsRunning());

  bridge.Stop();
  util::Logger::SetErrorSink(nullptr);
}

}  // namespace pulsecast::tests::contracts
