// Repository: Pulsecast
// Component: MessageServer
// Purpose: Transport B. WebSocket listener whose connections all live on the
//          SchedulerBridge's cooperative loop; one JSON text frame per event.
// Copyright (c) 2026 Pulsecast

#ifndef PULSECAST_TRANSPORT_MESSAGE_SERVER_HPP_
#define PULSECAST_TRANSPORT_MESSAGE_SERVER_HPP_

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "pulsecast/bridge/SchedulerBridge.hpp"
#include "pulsecast/broadcast/BroadcastRouter.hpp"
#include "pulsecast/broadcast/IEventReceiver.hpp"

namespace pulsecast::transport {

struct MessageServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 8092;  // 0 = ephemeral (tests)
  size_t max_message_bytes = 64 * 1024;
};

// One WebSocket client. Every member except Deliver() and Close() runs on the
// loop thread. Deliver() only pushes into the bridge subscription, so the
// player worker never touches the socket.
class MessageSession : public broadcast::IEventReceiver,
                       public std::enable_shared_from_this<MessageSession> {
 public:
  MessageSession(boost::asio::ip::tcp::socket socket, bridge::SchedulerBridge& bridge,
                 std::shared_ptr<broadcast::BroadcastRouter> router,
                 size_t max_message_bytes);
  ~MessageSession() override;

  // Loop thread. Performs the WebSocket handshake, then attaches.
  void Run();

  bool Deliver(const std::string& payload) override;
  std::string GetName() const override { return name_; }

  // Any thread. Tears the connection down on the loop.
  void Close();

  // Loop thread.
  void Shutdown(const std::string& reason);

 private:
  void OnHandshake(boost::beast::error_code ec);
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes);
  void Send(const std::string& payload);
  void DoWrite();
  void OnWrite(boost::beast::error_code ec, std::size_t bytes);
  void Fail(boost::beast::error_code ec, const char* what);

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  bridge::SchedulerBridge& bridge_;
  std::shared_ptr<broadcast::BroadcastRouter> router_;
  const size_t max_message_bytes_;
  const std::string name_;

  std::shared_ptr<bridge::Subscription> subscription_;

  // Loop thread only.
  boost::beast::flat_buffer buffer_;
  std::deque<std::string> write_queue_;
  bool attached_ = false;
  bool finished_ = false;
};

class MessageServer {
 public:
  MessageServer(MessageServerConfig config, bridge::SchedulerBridge& bridge,
                std::shared_ptr<broadcast::BroadcastRouter> router);
  ~MessageServer();

  MessageServer(const MessageServer&) = delete;
  MessageServer& operator=(const MessageServer&) = delete;

  // Opens the listening socket on the calling thread and schedules the accept
  // loop on the bridge.
  bool Start(std::string* error);

  // Closes the acceptor and every session on the loop, waiting a bounded time
  // for it unless called from the loop thread. Idempotent.
  void Stop();

  uint16_t BoundPort() const { return bound_port_.load(std::memory_order_acquire); }
  size_t SessionCount();

 private:
  // Acceptor and session list. Loop handlers hold it by shared_ptr, so one
  // that runs after the server is gone still finds live state.
  class Listener;

  MessageServerConfig config_;
  bridge::SchedulerBridge& bridge_;
  std::shared_ptr<Listener> listener_;
  std::atomic<uint16_t> bound_port_{0};
  std::atomic<bool> stopped_{false};
};

}  // namespace pulsecast::transport

#endif  // PULSECAST_TRANSPORT_MESSAGE_SERVER_HPP_
