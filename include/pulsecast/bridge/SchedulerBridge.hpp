// Repository: Pulsecast
// Component: SchedulerBridge
// Purpose: Owns the cooperative event loop that hosts message-transport
//          connections and is the only way worker threads hand work to it.
// Copyright (c) 2026 Pulsecast

#ifndef PULSECAST_BRIDGE_SCHEDULER_BRIDGE_HPP_
#define PULSECAST_BRIDGE_SCHEDULER_BRIDGE_HPP_

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace pulsecast::bridge {

// One logical subscription per message connection.
//
// Push() may be called from any thread and never waits on the consumer: the
// payload is queued and, if no drain is pending, one drain is posted to the
// loop. The drain invokes the consumer on the loop thread in FIFO order.
// Close() drops anything still queued and affects only this subscription.
//
// The consumer must not own the subscription (capture a weak_ptr to the
// session instead); the subscription keeps the consumer for its lifetime.
class Subscription : public std::enable_shared_from_this<Subscription> {
 public:
  using Consumer = std::function<void(const std::string& payload)>;

  // Returns false once closed.
  bool Push(std::string payload);

  // Idempotent.
  void Close();

  bool IsClosed() const;
  size_t Pending() const;
  uint64_t id() const { return id_; }

 private:
  friend class SchedulerBridge;

  Subscription(boost::asio::io_context& io, Consumer consumer, uint64_t id);

  // Loop thread only.
  void Drain();

  boost::asio::io_context& io_;
  Consumer consumer_;
  const uint64_t id_;

  mutable std::mutex mutex_;
  std::deque<std::string> queue_;
  bool drain_scheduled_ = false;
  bool closed_ = false;
};

class SchedulerBridge {
 public:
  SchedulerBridge();
  ~SchedulerBridge();

  SchedulerBridge(const SchedulerBridge&) = delete;
  SchedulerBridge& operator=(const SchedulerBridge&) = delete;

  // Spawns the loop thread. Idempotent.
  void Start();

  // Stops the loop and joins its thread. Handlers not yet run are dropped.
  // Must not be called from the loop thread.
  void Stop();

  // Thread-safe: wakes the loop and returns without waiting for the task.
  // Returns false when the loop is not running.
  bool Post(std::function<void()> task);

  std::shared_ptr<Subscription> Subscribe(Subscription::Consumer consumer);

  boost::asio::io_context& context() { return io_; }
  bool IsRunning() const { return running_.load(std::memory_order_acquire); }
  bool IsLoopThread() const;

 private:
  void Run();

  boost::asio::io_context io_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
  std::thread loop_thread_;
  std::atomic<bool> running_{false};
  std::atomic<uint64_t> next_subscription_id_{1};
};

}  // namespace pulsecast::bridge

#endif  // PULSECAST_BRIDGE_SCHEDULER_BRIDGE_HPP_
