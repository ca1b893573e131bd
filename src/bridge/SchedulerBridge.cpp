// Repository: Pulsecast
// Component: SchedulerBridge Implementation
// Purpose: Cooperative loop ownership and per-connection hand-off queues.
// Copyright (c) 2026 Pulsecast

#include "pulsecast/bridge/SchedulerBridge.hpp"

#include <exception>
#include <utility>

#include <boost/asio/post.hpp>

#include "pulsecast/util/Logger.hpp"

namespace pulsecast::bridge {

using pulsecast::util::Logger;

// =============================================================================
// Subscription
// =============================================================================

Subscription::Subscription(boost::asio::io_context& io, Consumer consumer, uint64_t id)
    : io_(io), consumer_(std::move(consumer)), id_(id) {}

bool Subscription::Push(std::string payload) {
  bool schedule = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) return false;
    queue_.push_back(std::move(payload));
    if (!drain_scheduled_) {
      drain_scheduled_ = true;
      schedule = true;
    }
  }
  if (schedule) {
    boost::asio::post(io_, [self = shared_from_this()] { self->Drain(); });
  }
  return true;
}

void Subscription::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  queue_.clear();
}

bool Subscription::IsClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t Subscription::Pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void Subscription::Drain() {
  std::deque<std::string> batch;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      drain_scheduled_ = false;
      return;
    }
    batch.swap(queue_);
  }

  for (const auto& payload : batch) {
    if (IsClosed()) break;
    if (consumer_) consumer_(payload);
  }

  // One batch per turn so other connections on the loop are not starved.
  bool reschedule = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_ && !queue_.empty()) {
      reschedule = true;
    } else {
      drain_scheduled_ = false;
    }
  }
  if (reschedule) {
    boost::asio::post(io_, [self = shared_from_this()] { self->Drain(); });
  }
}

// =============================================================================
// SchedulerBridge
// =============================================================================

SchedulerBridge::SchedulerBridge() : work_(boost::asio::make_work_guard(io_)) {}

SchedulerBridge::~SchedulerBridge() {
  Stop();
}

void SchedulerBridge::Start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return;
  }
  loop_thread_ = std::thread(&SchedulerBridge::Run, this);
}

void SchedulerBridge::Stop() {
  bool expected = true;
  if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
    return;
  }
  work_.reset();
  io_.stop();
  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }
  Logger::Info("[SchedulerBridge] Loop stopped");
}

bool SchedulerBridge::Post(std::function<void()> task) {
  if (!running_.load(std::memory_order_acquire)) return false;
  boost::asio::post(io_, std::move(task));
  return true;
}

std::shared_ptr<Subscription> SchedulerBridge::Subscribe(Subscription::Consumer consumer) {
  const uint64_t id = next_subscription_id_.fetch_add(1, std::memory_order_relaxed);
  return std::shared_ptr<Subscription>(new Subscription(io_, std::move(consumer), id));
}

bool SchedulerBridge::IsLoopThread() const {
  return std::this_thread::get_id() == loop_thread_.get_id();
}

void SchedulerBridge::Run() {
  Logger::Info("[SchedulerBridge] Loop running");
  while (true) {
    try {
      io_.run();
      return;
    } catch (const std::exception& e) {
      // A handler threw; report it and keep serving the other connections.
      Logger::Error(std::string("[SchedulerBridge] Handler exception: ") + e.what());
    }
  }
}

}  // namespace pulsecast::bridge
