#pragma once

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

// Newline-delimited TCP client for the stream listener.
class LineClient {
public:
  LineClient() = default;
  ~LineClient() { Close(); }

  LineClient(const LineClient&) = delete;
  LineClient& operator=(const LineClient&) = delete;

  bool Connect(uint16_t port, const std::string& host = "127.0.0.1") {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) return false;
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    ::inet_pton(AF_INET, host.c_str(), &addr.sin_addr);
    if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      Close();
      return false;
    }
    return true;
  }

  bool SendRaw(const std::string& bytes) {
    size_t off = 0;
    while (off < bytes.size()) {
      ssize_t n = ::send(fd_, bytes.data() + off, bytes.size() - off, MSG_NOSIGNAL);
      if (n < 0) {
        if (errno == EINTR) continue;
        return false;
      }
      off += static_cast<size_t>(n);
    }
    return true;
  }

  bool SendLine(const std::string& line) { return SendRaw(line + "\n"); }

  // Next complete line without its '\n', or nullopt on timeout / EOF.
  std::optional<std::string> ReadLine(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
      size_t nl = pending_.find('\n');
      if (nl != std::string::npos) {
        std::string line = pending_.substr(0, nl);
        pending_.erase(0, nl + 1);
        return line;
      }
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0 || fd_ < 0) return std::nullopt;

      pollfd pfd{fd_, POLLIN, 0};
      int ret = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
      if (ret < 0 && errno == EINTR) continue;
      if (ret <= 0) return std::nullopt;
      char buf[4096];
      ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
      if (n <= 0) return std::nullopt;
      pending_.append(buf, static_cast<size_t>(n));
    }
  }

  // True when the server has closed the connection within the timeout.
  bool WaitForEof(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      pollfd pfd{fd_, POLLIN, 0};
      int ret = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
      if (ret <= 0) continue;
      char buf[4096];
      ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
      if (n == 0) return true;
      if (n < 0 && errno != EINTR && errno != EAGAIN) return true;
      if (n > 0) pending_.append(buf, static_cast<size_t>(n));
    }
    return false;
  }

  void Close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

private:
  int fd_ = -1;
  std::string pending_;
};

// WebSocket client for the message listener. Reads run on a private
// io_context so each one can be bounded by a timeout.
class FrameClient {
public:
  FrameClient() : ws_(ioc_) {}
  ~FrameClient() { Close(); }

  FrameClient(const FrameClient&) = delete;
  FrameClient& operator=(const FrameClient&) = delete;

  bool Connect(uint16_t port, const std::string& host = "127.0.0.1") {
    boost::beast::error_code ec;
    boost::asio::ip::tcp::resolver resolver(ioc_);
    auto results = resolver.resolve(host, std::to_string(port), ec);
    if (ec) return false;
    boost::asio::connect(ws_.next_layer(), results, ec);
    if (ec) return false;
    ws_.handshake(host + ":" + std::to_string(port), "/", ec);
    if (ec) return false;
    open_ = true;
    return true;
  }

  bool SendText(const std::string& text) {
    boost::beast::error_code ec;
    ws_.text(true);
    ws_.write(boost::asio::buffer(text), ec);
    return !ec;
  }

  bool SendBinary(const std::string& bytes) {
    boost::beast::error_code ec;
    ws_.binary(true);
    ws_.write(boost::asio::buffer(bytes), ec);
    return !ec;
  }

  // Next text frame, or nullopt on timeout or close.
  std::optional<std::string> ReadFrame(std::chrono::milliseconds timeout) {
    if (!open_) return std::nullopt;
    boost::beast::flat_buffer buffer;
    boost::beast::error_code result = boost::asio::error::would_block;
    bool done = false;
    ws_.async_read(buffer, [&](boost::beast::error_code ec, std::size_t) {
      result = ec;
      done = true;
    });
    ioc_.restart();
    ioc_.run_for(timeout);
    if (!done) {
      boost::beast::error_code ignored;
      ws_.next_layer().cancel(ignored);
      ioc_.restart();
      ioc_.run();
      open_ = false;
      return std::nullopt;
    }
    if (result) {
      open_ = false;
      return std::nullopt;
    }
    return boost::beast::buffers_to_string(buffer.data());
  }

  void Close() {
    if (!open_) return;
    open_ = false;
    boost::beast::error_code ec;
    ws_.next_layer().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    ws_.next_layer().close(ec);
  }

private:
  boost::asio::io_context ioc_;
  boost::beast::websocket::stream<boost::asio::ip::tcp::socket> ws_;
  bool open_ = false;
};
