// Repository: Pulsecast
// Component: MessageServer Implementation
// Purpose: Beast WebSocket sessions multiplexed on the cooperative loop.
// Copyright (c) 2026 Pulsecast

#include "pulsecast/transport/MessageServer.hpp"

#include <algorithm>
#include <chrono>
#include <future>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>

#include "pulsecast/util/Logger.hpp"

namespace pulsecast::transport {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;
using pulsecast::util::Logger;

namespace {

constexpr auto kStopWait = std::chrono::seconds(2);

std::string EndpointName(const tcp::socket& socket) {
  beast::error_code ec;
  auto ep = socket.remote_endpoint(ec);
  if (ec) return "message:unknown";
  return "message:" + ep.address().to_string() + ":" + std::to_string(ep.port());
}

}  // namespace

// =============================================================================
// MessageSession
// =============================================================================

MessageSession::MessageSession(tcp::socket socket, bridge::SchedulerBridge& bridge,
                               std::shared_ptr<broadcast::BroadcastRouter> router,
                               size_t max_message_bytes)
    : ws_(std::move(socket)),
      bridge_(bridge),
      router_(std::move(router)),
      max_message_bytes_(max_message_bytes),
      name_(EndpointName(beast::get_lowest_layer(ws_).socket())) {}

MessageSession::~MessageSession() {
  if (subscription_) subscription_->Close();
}

void MessageSession::Run() {
  std::weak_ptr<MessageSession> weak = shared_from_this();
  subscription_ = bridge_.Subscribe([weak](const std::string& payload) {
    if (auto self = weak.lock()) self->Send(payload);
  });

  ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
  ws_.read_message_max(max_message_bytes_);
  ws_.async_accept(beast::bind_front_handler(&MessageSession::OnHandshake, shared_from_this()));
}

void MessageSession::OnHandshake(beast::error_code ec) {
  if (ec) return Fail(ec, "handshake");
  if (finished_) return;

  attached_ = router_->Attach(shared_from_this(), broadcast::ClientKind::kMessage);
  if (!attached_) return Shutdown("welcome rejected");
  DoRead();
}

void MessageSession::DoRead() {
  ws_.async_read(buffer_, beast::bind_front_handler(&MessageSession::OnRead, shared_from_this()));
}

void MessageSession::OnRead(beast::error_code ec, std::size_t /*bytes*/) {
  if (ec) return Fail(ec, "read");

  if (ws_.got_text()) {
    router_->ReceiveCommand(beast::buffers_to_string(buffer_.data()), name_);
  } else {
    Logger::Warn("[MessageServer] " + name_ + " sent a binary frame; ignored");
  }
  buffer_.consume(buffer_.size());
  DoRead();
}

bool MessageSession::Deliver(const std::string& payload) {
  if (!subscription_) return false;
  return subscription_->Push(payload);
}

void MessageSession::Send(const std::string& payload) {
  if (finished_) return;
  write_queue_.push_back(payload);
  if (write_queue_.size() == 1) DoWrite();
}

void MessageSession::DoWrite() {
  ws_.text(true);
  ws_.async_write(net::buffer(write_queue_.front()),
                  beast::bind_front_handler(&MessageSession::OnWrite, shared_from_this()));
}

void MessageSession::OnWrite(beast::error_code ec, std::size_t /*bytes*/) {
  if (ec) return Fail(ec, "write");
  write_queue_.pop_front();
  if (!write_queue_.empty() && !finished_) DoWrite();
}

void MessageSession::Fail(beast::error_code ec, const char* what) {
  if (finished_) return;
  if (ec == websocket::error::closed || ec == net::error::eof ||
      ec == net::error::connection_reset || ec == net::error::operation_aborted) {
    Logger::Info("[MessageServer] " + name_ + " disconnected");
  } else {
    Logger::Warn("[MessageServer] " + name_ + " " + what + " failed: " + ec.message());
  }
  Shutdown(what);
}

void MessageSession::Shutdown(const std::string& reason) {
  if (finished_) return;
  finished_ = true;
  Logger::Debug("[MessageServer] " + name_ + " closing (" + reason + ")");

  if (subscription_) subscription_->Close();
  if (attached_) {
    router_->Detach(shared_from_this(), broadcast::ClientKind::kMessage);
    attached_ = false;
  }
  write_queue_.clear();

  // Cancels outstanding reads/writes; their handlers see finished_.
  beast::error_code ignored;
  beast::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_both, ignored);
  beast::get_lowest_layer(ws_).socket().close(ignored);
}

void MessageSession::Close() {
  std::weak_ptr<MessageSession> weak = shared_from_this();
  bridge_.Post([weak] {
    if (auto self = weak.lock()) self->Shutdown("closed by server");
  });
}

// =============================================================================
// MessageServer
// =============================================================================

class MessageServer::Listener : public std::enable_shared_from_this<MessageServer::Listener> {
 public:
  Listener(bridge::SchedulerBridge& bridge, std::shared_ptr<broadcast::BroadcastRouter> router,
           size_t max_message_bytes)
      : bridge_(bridge),
        router_(std::move(router)),
        max_message_bytes_(max_message_bytes),
        acceptor_(bridge.context()) {}

  tcp::acceptor& acceptor() { return acceptor_; }

  void MarkStopped() { stopped_.store(true, std::memory_order_release); }

  // Loop thread.
  void DoAccept() {
    if (!acceptor_.is_open()) return;
    acceptor_.async_accept(beast::bind_front_handler(&Listener::OnAccept, shared_from_this()));
  }

  // Loop thread, or any thread once the loop has stopped.
  void CloseAll() {
    beast::error_code ignored;
    acceptor_.close(ignored);
    std::vector<std::weak_ptr<MessageSession>> sessions;
    {
      std::lock_guard<std::mutex> lock(sessions_mutex_);
      sessions.swap(sessions_);
    }
    for (auto& weak : sessions) {
      if (auto session = weak.lock()) session->Shutdown("server stopping");
    }
  }

  size_t SessionCount() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return static_cast<size_t>(std::count_if(
        sessions_.begin(), sessions_.end(),
        [](const std::weak_ptr<MessageSession>& w) { return !w.expired(); }));
  }

 private:
  void OnAccept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted || stopped_.load(std::memory_order_acquire)) {
      return;
    }
    if (ec) {
      Logger::Warn("[MessageServer] accept failed: " + ec.message());
    } else {
      auto session = std::make_shared<MessageSession>(std::move(socket), bridge_, router_,
                                                      max_message_bytes_);
      Logger::Info("[MessageServer] Accepted " + session->GetName());
      {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                       [](const std::weak_ptr<MessageSession>& w) {
                                         return w.expired();
                                       }),
                        sessions_.end());
        sessions_.push_back(session);
      }
      session->Run();
    }
    DoAccept();
  }

  bridge::SchedulerBridge& bridge_;
  std::shared_ptr<broadcast::BroadcastRouter> router_;
  const size_t max_message_bytes_;
  tcp::acceptor acceptor_;
  std::atomic<bool> stopped_{false};

  std::mutex sessions_mutex_;
  std::vector<std::weak_ptr<MessageSession>> sessions_;
};

MessageServer::MessageServer(MessageServerConfig config, bridge::SchedulerBridge& bridge,
                             std::shared_ptr<broadcast::BroadcastRouter> router)
    : config_(std::move(config)),
      bridge_(bridge),
      listener_(std::make_shared<Listener>(bridge, std::move(router),
                                           config_.max_message_bytes)) {}

MessageServer::~MessageServer() {
  Stop();
}

bool MessageServer::Start(std::string* error) {
  beast::error_code ec;
  auto address = net::ip::make_address(config_.host, ec);
  if (ec) {
    if (error) *error = "invalid host '" + config_.host + "': " + ec.message();
    return false;
  }
  tcp::endpoint endpoint(address, config_.port);
  tcp::acceptor& acceptor = listener_->acceptor();

  auto fail = [&](const std::string& what) {
    if (error) *error = what + ": " + ec.message();
    beast::error_code ignored;
    acceptor.close(ignored);
    return false;
  };

  acceptor.open(endpoint.protocol(), ec);
  if (ec) return fail("open");
  acceptor.set_option(net::socket_base::reuse_address(true), ec);
  if (ec) return fail("set_option");
  acceptor.bind(endpoint, ec);
  if (ec) return fail("bind(" + config_.host + ":" + std::to_string(config_.port) + ")");
  acceptor.listen(net::socket_base::max_listen_connections, ec);
  if (ec) return fail("listen");

  bound_port_.store(acceptor.local_endpoint(ec).port(), std::memory_order_release);
  net::post(bridge_.context(), [listener = listener_] { listener->DoAccept(); });
  Logger::Info("[MessageServer] Listening on " + config_.host + ":" +
               std::to_string(BoundPort()));
  return true;
}

size_t MessageServer::SessionCount() {
  return listener_->SessionCount();
}

void MessageServer::Stop() {
  if (stopped_.exchange(true, std::memory_order_acq_rel)) return;
  listener_->MarkStopped();

  if (!bridge_.IsRunning() || bridge_.IsLoopThread()) {
    listener_->CloseAll();
  } else {
    auto done = std::make_shared<std::promise<void>>();
    std::future<void> finished = done->get_future();
    if (bridge_.Post([listener = listener_, done] {
          listener->CloseAll();
          done->set_value();
        })) {
      if (finished.wait_for(kStopWait) != std::future_status::ready) {
        Logger::Warn("[MessageServer] Loop did not confirm shutdown in time; "
                     "close stays queued on the loop");
      }
    } else {
      listener_->CloseAll();
    }
  }
  Logger::Info("[MessageServer] Stopped");
}

}  // namespace pulsecast::transport
