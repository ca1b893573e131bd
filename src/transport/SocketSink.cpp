// Repository: Pulsecast
// Component: SocketSink Implementation
// Purpose: Non-blocking line writer for one stream connection.
// Copyright (c) 2026 Pulsecast

#include "pulsecast/transport/SocketSink.hpp"

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "pulsecast/util/Logger.hpp"

namespace pulsecast::transport {

using pulsecast::util::Logger;

namespace {
constexpr int kPollTimeoutMs = 100;  // writer re-checks the stop flag this often
}  // namespace

SocketSink::SocketSink(int fd, const std::string& name, size_t buffer_capacity)
    : fd_(fd), name_(name), buffer_capacity_(buffer_capacity) {
  writer_thread_ = std::thread(&SocketSink::WriterThreadLoop, this);
}

SocketSink::~SocketSink() {
  Close();
}

void SocketSink::Detach(const std::string& reason) {
  bool expected = false;
  if (!detached_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return;
  }
  Logger::Warn("[SocketSink:" + name_ + "] Detach: " + reason + " (enqueued=" +
               std::to_string(bytes_enqueued_.load(std::memory_order_relaxed)) +
               ", delivered=" + std::to_string(bytes_delivered_.load(std::memory_order_relaxed)) +
               ")");

  writer_stop_.store(true, std::memory_order_release);
  queue_cv_.notify_all();
  drained_cv_.notify_all();

  // Wakes the connection's reader, which owns the fd and will close it.
  if (fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
  }
}

bool SocketSink::Enqueue(std::string bytes) {
  if (closed_.load(std::memory_order_acquire) || detached_.load(std::memory_order_acquire)) {
    return false;
  }
  if (bytes.empty()) return true;

  const size_t len = bytes.size();
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (current_buffer_size_ + len <= buffer_capacity_) {
      current_buffer_size_ += len;
      queue_.push_back(std::move(bytes));
      bytes_enqueued_.fetch_add(len, std::memory_order_relaxed);
      queue_cv_.notify_one();
      return true;
    }
  }
  Detach("buffer overflow (buffered=" + std::to_string(GetCurrentBufferSize()) +
         ", incoming=" + std::to_string(len) + ", capacity=" +
         std::to_string(buffer_capacity_) + ")");
  return false;
}

bool SocketSink::WaitUntilDrained(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  return drained_cv_.wait_for(lock, timeout, [this] {
    return (queue_.empty() && !writing_) || writer_stop_.load(std::memory_order_acquire);
  }) && queue_.empty() && !writing_;
}

bool SocketSink::SendAll(const std::string& bytes) {
  const char* ptr = bytes.data();
  size_t remaining = bytes.size();

  while (remaining > 0) {
    if (writer_stop_.load(std::memory_order_acquire)) return false;

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLOUT;
    pfd.revents = 0;

    int poll_ret = ::poll(&pfd, 1, kPollTimeoutMs);
    if (poll_ret < 0) {
      if (errno == EINTR) continue;
      write_errors_.fetch_add(1, std::memory_order_relaxed);
      Detach(std::string("poll() error: ") + std::strerror(errno));
      return false;
    }
    if (poll_ret == 0) continue;  // timeout: re-check stop flag

    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
      write_errors_.fetch_add(1, std::memory_order_relaxed);
      Detach("peer hung up");
      return false;
    }

    ssize_t n = ::send(fd_, ptr, remaining, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
      write_errors_.fetch_add(1, std::memory_order_relaxed);
      Detach(std::string("send() error: ") + std::strerror(errno));
      return false;
    }
    ptr += n;
    remaining -= static_cast<size_t>(n);
    bytes_delivered_.fetch_add(static_cast<uint64_t>(n), std::memory_order_relaxed);
  }
  return true;
}

void SocketSink::WriterThreadLoop() {
  while (!writer_stop_.load(std::memory_order_acquire)) {
    std::string bytes;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait_for(lock, std::chrono::milliseconds(kPollTimeoutMs), [this] {
        return !queue_.empty() || writer_stop_.load(std::memory_order_acquire);
      });
      if (writer_stop_.load(std::memory_order_acquire)) break;
      if (queue_.empty()) continue;

      bytes = std::move(queue_.front());
      queue_.pop_front();
      current_buffer_size_ -= bytes.size();
      writing_ = true;
    }

    const bool ok = SendAll(bytes);
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      writing_ = false;
    }
    drained_cv_.notify_all();
    if (!ok) break;
  }
}

void SocketSink::Close() {
  bool expected = false;
  if (!closed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
    return;
  }
  writer_stop_.store(true, std::memory_order_release);
  queue_cv_.notify_all();
  drained_cv_.notify_all();
  if (writer_thread_.joinable()) {
    writer_thread_.join();
  }
}

}  // namespace pulsecast::transport
