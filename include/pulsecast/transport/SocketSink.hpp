// Repository: Pulsecast
// Component: SocketSink
// Purpose: Non-blocking line writer for one stream connection: bounded queue
//          drained by a dedicated writer thread.
// Copyright (c) 2026 Pulsecast

#ifndef PULSECAST_TRANSPORT_SOCKET_SINK_HPP_
#define PULSECAST_TRANSPORT_SOCKET_SINK_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace pulsecast::transport {

// SocketSink is the per-connection writer of the stream transport.
//
//   - Enqueue() never blocks; the broadcast fan-out calls it on the player
//     worker thread.
//   - A writer thread drains the queue with poll() + send(MSG_NOSIGNAL).
//   - Memory is bounded by buffer_capacity. A peer that falls that far behind
//     is detached rather than having payloads dropped from the middle of its
//     stream.
//   - Once detached or closed, Enqueue() returns false forever; the router
//     treats that as a send failure and evicts the connection.
//
// The sink does not own the fd. It may shut it down (to wake a blocked reader
// on the same socket) but closing is the connection's job.
class SocketSink {
 public:
  explicit SocketSink(int fd, const std::string& name = "SocketSink",
                      size_t buffer_capacity = 1024 * 1024);
  ~SocketSink();

  SocketSink(const SocketSink&) = delete;
  SocketSink& operator=(const SocketSink&) = delete;

  // Queues bytes for delivery. Returns false when closed or detached, or
  // when the bytes would overflow the buffer (which detaches the sink).
  bool Enqueue(std::string bytes);

  // Blocks until the queue is empty and the writer is idle, or timeout.
  // Test and shutdown helper.
  bool WaitUntilDrained(std::chrono::milliseconds timeout);

  // Stops the writer thread. Idempotent. Undelivered bytes are discarded.
  void Close();

  bool IsDetached() const { return detached_.load(std::memory_order_acquire); }
  bool IsClosed() const { return closed_.load(std::memory_order_acquire); }
  const std::string& GetName() const { return name_; }

  uint64_t GetBytesEnqueued() const { return bytes_enqueued_.load(std::memory_order_relaxed); }
  uint64_t GetBytesDelivered() const { return bytes_delivered_.load(std::memory_order_relaxed); }
  uint64_t GetWriteErrors() const { return write_errors_.load(std::memory_order_relaxed); }

  size_t GetCurrentBufferSize() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return current_buffer_size_;
  }
  size_t GetBufferCapacity() const { return buffer_capacity_; }

 private:
  void WriterThreadLoop();
  bool SendAll(const std::string& bytes);
  void Detach(const std::string& reason);

  const int fd_;
  const std::string name_;
  const size_t buffer_capacity_;
  std::atomic<bool> closed_{false};
  std::atomic<bool> detached_{false};

  mutable std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::condition_variable drained_cv_;
  std::deque<std::string> queue_;
  size_t current_buffer_size_ = 0;
  bool writing_ = false;  // guarded by queue_mutex_

  std::thread writer_thread_;
  std::atomic<bool> writer_stop_{false};

  std::atomic<uint64_t> bytes_enqueued_{0};
  std::atomic<uint64_t> bytes_delivered_{0};
  std::atomic<uint64_t> write_errors_{0};
};

}  // namespace pulsecast::transport

#endif  // PULSECAST_TRANSPORT_SOCKET_SINK_HPP_
