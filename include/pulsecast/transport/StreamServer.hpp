// Repository: Pulsecast
// Component: StreamServer
// Purpose: Transport A. TCP listener delivering newline-delimited JSON events
//          and reading newline-delimited commands, one reader thread and one
//          writer thread per connection.
// Copyright (c) 2026 Pulsecast

#ifndef PULSECAST_TRANSPORT_STREAM_SERVER_HPP_
#define PULSECAST_TRANSPORT_STREAM_SERVER_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "pulsecast/broadcast/BroadcastRouter.hpp"
#include "pulsecast/broadcast/IEventReceiver.hpp"
#include "pulsecast/transport/SocketSink.hpp"

namespace pulsecast::transport {

struct StreamServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 5000;  // 0 = ephemeral (tests)
  int backlog = 16;
  size_t max_line_bytes = 64 * 1024;
  size_t sink_buffer_bytes = 1024 * 1024;
};

// One accepted stream client. Registered with the router as a kStream
// receiver for as long as its reader thread runs.
class StreamConnection : public broadcast::IEventReceiver,
                         public std::enable_shared_from_this<StreamConnection> {
 public:
  // Takes ownership of fd.
  StreamConnection(int fd, std::string peer, std::shared_ptr<broadcast::BroadcastRouter> router,
                   const StreamServerConfig& config);
  ~StreamConnection() override;

  StreamConnection(const StreamConnection&) = delete;
  StreamConnection& operator=(const StreamConnection&) = delete;

  // Attaches to the router (welcome first) and spawns the reader thread.
  // Returns false if the welcome could not be queued.
  bool Start();

  // Appends '\n' and queues for the writer thread.
  bool Deliver(const std::string& payload) override;
  std::string GetName() const override { return name_; }

  // Shuts the socket down, joins both threads, closes the fd. Idempotent.
  void Close();

  bool IsFinished() const { return finished_.load(std::memory_order_acquire); }
  const SocketSink* sink() const { return sink_.get(); }

 private:
  void ReaderLoop();
  void ConsumeInput(const char* data, size_t len);

  int fd_;
  const std::string name_;
  std::shared_ptr<broadcast::BroadcastRouter> router_;
  const size_t max_line_bytes_;

  std::unique_ptr<SocketSink> sink_;
  std::thread reader_;
  std::atomic<bool> stop_{false};
  std::atomic<bool> finished_{false};
  std::mutex close_mutex_;
  bool closed_ = false;

  // Reader thread only.
  std::string pending_;
  bool discarding_ = false;
};

class StreamServer {
 public:
  StreamServer(StreamServerConfig config, std::shared_ptr<broadcast::BroadcastRouter> router);
  ~StreamServer();

  StreamServer(const StreamServer&) = delete;
  StreamServer& operator=(const StreamServer&) = delete;

  // Binds, listens and starts the accept thread. On failure returns false
  // with a description in *error.
  bool Start(std::string* error);

  // Stops accepting and closes every connection. Idempotent.
  void Stop();

  uint16_t BoundPort() const { return bound_port_.load(std::memory_order_acquire); }
  size_t ConnectionCount();

 private:
  void AcceptLoop();
  void ReapFinished();

  StreamServerConfig config_;
  std::shared_ptr<broadcast::BroadcastRouter> router_;

  int listen_fd_ = -1;
  std::atomic<uint16_t> bound_port_{0};
  std::thread accept_thread_;
  std::atomic<bool> stop_{false};

  std::mutex connections_mutex_;
  std::vector<std::shared_ptr<StreamConnection>> connections_;
};

}  // namespace pulsecast::transport

#endif  // PULSECAST_TRANSPORT_STREAM_SERVER_HPP_
