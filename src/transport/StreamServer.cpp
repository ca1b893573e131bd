// Repository: Pulsecast
// Component: StreamServer Implementation
// Purpose: TCP listener, per-connection reader threads and line framing.
// Copyright (c) 2026 Pulsecast

#include "pulsecast/transport/StreamServer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iterator>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "pulsecast/util/Logger.hpp"

namespace pulsecast::transport {

using pulsecast::util::Logger;

namespace {

constexpr int kPollTimeoutMs = 100;
constexpr size_t kReadChunk = 4096;

bool SetNonBlocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

std::string PeerName(const sockaddr_in& addr) {
  char buf[INET_ADDRSTRLEN] = {0};
  ::inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));
  return std::string(buf) + ":" + std::to_string(ntohs(addr.sin_port));
}

}  // namespace

// =============================================================================
// StreamConnection
// =============================================================================

StreamConnection::StreamConnection(int fd, std::string peer,
                                   std::shared_ptr<broadcast::BroadcastRouter> router,
                                   const StreamServerConfig& config)
    : fd_(fd),
      name_("stream:" + peer),
      router_(std::move(router)),
      max_line_bytes_(config.max_line_bytes) {
  SetNonBlocking(fd_);
  sink_ = std::make_unique<SocketSink>(fd_, name_, config.sink_buffer_bytes);
}

StreamConnection::~StreamConnection() {
  Close();
}

bool StreamConnection::Start() {
  if (!router_->Attach(shared_from_this(), broadcast::ClientKind::kStream)) {
    finished_.store(true, std::memory_order_release);
    return false;
  }
  reader_ = std::thread(&StreamConnection::ReaderLoop, this);
  return true;
}

bool StreamConnection::Deliver(const std::string& payload) {
  std::string line;
  line.reserve(payload.size() + 1);
  line.append(payload);
  line.push_back('\n');
  return sink_->Enqueue(std::move(line));
}

void StreamConnection::ConsumeInput(const char* data, size_t len) {
  pending_.append(data, len);

  size_t start = 0;
  while (true) {
    size_t nl = pending_.find('\n', start);
    if (nl == std::string::npos) break;
    std::string line = pending_.substr(start, nl - start);
    start = nl + 1;
    if (discarding_) {
      // Tail of an over-long line.
      discarding_ = false;
      continue;
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty()) continue;
    router_->ReceiveCommand(line, name_);
  }
  pending_.erase(0, start);

  if (pending_.size() > max_line_bytes_) {
    if (!discarding_) {
      Logger::Warn("[StreamServer] " + name_ + " sent a line over " +
                   std::to_string(max_line_bytes_) + " bytes; discarding it");
    }
    discarding_ = true;
    pending_.clear();
  }
}

void StreamConnection::ReaderLoop() {
  char buf[kReadChunk];
  while (!stop_.load(std::memory_order_acquire)) {
    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int poll_ret = ::poll(&pfd, 1, kPollTimeoutMs);
    if (poll_ret < 0) {
      if (errno == EINTR) continue;
      Logger::Warn("[StreamServer] " + name_ + " poll() error: " + std::strerror(errno));
      break;
    }
    if (poll_ret == 0) continue;

    ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
    if (n > 0) {
      ConsumeInput(buf, static_cast<size_t>(n));
      continue;
    }
    if (n == 0) {
      Logger::Info("[StreamServer] " + name_ + " disconnected");
      break;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
    Logger::Info("[StreamServer] " + name_ + " read error: " + std::strerror(errno));
    break;
  }

  if (auto self = weak_from_this().lock()) {
    router_->Detach(self, broadcast::ClientKind::kStream);
  }
  finished_.store(true, std::memory_order_release);
}

void StreamConnection::Close() {
  std::lock_guard<std::mutex> lock(close_mutex_);
  if (closed_) return;
  closed_ = true;

  stop_.store(true, std::memory_order_release);
  if (fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
  }
  if (reader_.joinable()) {
    if (reader_.get_id() == std::this_thread::get_id()) {
      reader_.detach();
    } else {
      reader_.join();
    }
  }
  if (sink_) {
    sink_->Close();
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  finished_.store(true, std::memory_order_release);
}

// =============================================================================
// StreamServer
// =============================================================================

StreamServer::StreamServer(StreamServerConfig config,
                           std::shared_ptr<broadcast::BroadcastRouter> router)
    : config_(std::move(config)), router_(std::move(router)) {}

StreamServer::~StreamServer() {
  Stop();
}

bool StreamServer::Start(std::string* error) {
  auto fail = [&](const std::string& what) {
    if (error) *error = what + ": " + std::strerror(errno);
    if (listen_fd_ >= 0) {
      ::close(listen_fd_);
      listen_fd_ = -1;
    }
    return false;
  };

  listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) return fail("socket()");

  int reuse = 1;
  ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(config_.port);
  if (::inet_pton(AF_INET, config_.host.c_str(), &addr.sin_addr) != 1) {
    errno = EINVAL;
    return fail("invalid host '" + config_.host + "'");
  }
  if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    return fail("bind(" + config_.host + ":" + std::to_string(config_.port) + ")");
  }
  if (::listen(listen_fd_, config_.backlog) < 0) return fail("listen()");

  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) < 0) {
    return fail("getsockname()");
  }
  bound_port_.store(ntohs(bound.sin_port), std::memory_order_release);

  stop_.store(false, std::memory_order_release);
  accept_thread_ = std::thread(&StreamServer::AcceptLoop, this);
  Logger::Info("[StreamServer] Listening on " + config_.host + ":" +
               std::to_string(BoundPort()));
  return true;
}

void StreamServer::AcceptLoop() {
  while (!stop_.load(std::memory_order_acquire)) {
    ReapFinished();

    struct pollfd pfd;
    pfd.fd = listen_fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int poll_ret = ::poll(&pfd, 1, kPollTimeoutMs);
    if (poll_ret < 0) {
      if (errno == EINTR) continue;
      Logger::Error(std::string("[StreamServer] poll() on listener failed: ") +
                    std::strerror(errno));
      break;
    }
    if (poll_ret == 0) continue;

    sockaddr_in peer{};
    socklen_t peer_len = sizeof(peer);
    int fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&peer), &peer_len);
    if (fd < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK ||
          errno == ECONNABORTED) {
        continue;
      }
      Logger::Warn(std::string("[StreamServer] accept() failed: ") + std::strerror(errno));
      continue;
    }

    auto conn = std::make_shared<StreamConnection>(fd, PeerName(peer), router_, config_);
    Logger::Info("[StreamServer] Accepted " + conn->GetName());
    if (!conn->Start()) {
      conn->Close();
      continue;
    }
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.push_back(std::move(conn));
  }
}

void StreamServer::ReapFinished() {
  std::vector<std::shared_ptr<StreamConnection>> finished;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = std::stable_partition(
        connections_.begin(), connections_.end(),
        [](const std::shared_ptr<StreamConnection>& c) { return !c->IsFinished(); });
    finished.assign(std::make_move_iterator(it), std::make_move_iterator(connections_.end()));
    connections_.erase(it, connections_.end());
  }
  for (auto& conn : finished) {
    conn->Close();
  }
}

size_t StreamServer::ConnectionCount() {
  ReapFinished();
  std::lock_guard<std::mutex> lock(connections_mutex_);
  return connections_.size();
}

void StreamServer::Stop() {
  bool already = stop_.exchange(true, std::memory_order_acq_rel);
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
  }
  std::vector<std::shared_ptr<StreamConnection>> connections;
  {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections.swap(connections_);
  }
  for (auto& conn : connections) {
    conn->Close();
  }
  if (!already) {
    Logger::Info("[StreamServer] Stopped");
  }
}

}  // namespace pulsecast::transport
