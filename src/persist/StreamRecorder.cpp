// Repository: Pulsecast
// Component: StreamRecorder Implementation
// Purpose: Line-reading TCP client feeding the BatchedPersister.
// Copyright (c) 2026 Pulsecast

#include "pulsecast/persist/StreamRecorder.hpp"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "pulsecast/event/BiometricEvent.hpp"
#include "pulsecast/util/Logger.hpp"

namespace pulsecast::persist {

using pulsecast::util::Logger;

namespace {
constexpr int kPollTimeoutMs = 100;
}  // namespace

StreamRecorder::StreamRecorder(RecorderConfig config, std::shared_ptr<BatchedPersister> persister)
    : config_(std::move(config)), persister_(std::move(persister)) {}

StreamRecorder::~StreamRecorder() {
  Disconnect();
}

bool StreamRecorder::Connect(std::string* error) {
  Disconnect();
  fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd_ < 0) {
    if (error) *error = std::string("socket(): ") + std::strerror(errno);
    return false;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(config_.port);
  if (::inet_pton(AF_INET, config_.host.c_str(), &addr.sin_addr) != 1) {
    if (error) *error = "invalid host '" + config_.host + "'";
    Disconnect();
    return false;
  }
  if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    if (error) {
      *error = "connect(" + config_.host + ":" + std::to_string(config_.port) +
               "): " + std::strerror(errno);
    }
    Disconnect();
    return false;
  }
  Logger::Info("[StreamRecorder] Connected to " + config_.host + ":" +
               std::to_string(config_.port) + ", recording to " + persister_->path());

  if (config_.start_scenario) {
    util::JsonValue cmd = util::JsonValue::MakeObject();
    cmd.Set("command", "start_scenario");
    cmd.Set("scenario", *config_.start_scenario);
    if (!SendCommand(util::SerializeJson(cmd))) {
      if (error) *error = "failed to send start command";
      return false;
    }
  }
  return true;
}

bool StreamRecorder::SendCommand(const std::string& json) {
  if (fd_ < 0) return false;
  std::string line = json + "\n";
  const char* ptr = line.data();
  size_t remaining = line.size();
  while (remaining > 0) {
    ssize_t n = ::send(fd_, ptr, remaining, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      Logger::Warn(std::string("[StreamRecorder] send() failed: ") + std::strerror(errno));
      return false;
    }
    ptr += n;
    remaining -= static_cast<size_t>(n);
  }
  return true;
}

void StreamRecorder::HandleLine(const std::string& line) {
  std::string error;
  auto doc = util::ParseJson(line, &error);
  std::string type_name;
  if (!doc || !util::GetString(*doc, "event_type", &type_name)) {
    lines_ignored_.fetch_add(1, std::memory_order_relaxed);
    Logger::Warn("[StreamRecorder] Ignoring unparseable line: " + error);
    return;
  }
  auto type = event::ParseEventType(type_name);
  if (!type) {
    lines_ignored_.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  switch (*type) {
    case event::EventType::kScenarioStarted:
      if (!persister_->Clear()) {
        Logger::Warn("[StreamRecorder] Could not clear " + persister_->path() +
                     " at scenario start; earlier records remain");
      }
      break;
    case event::EventType::kScenarioComplete:
    case event::EventType::kScenarioStopped:
      FlushBuffered("at " + type_name);
      break;
    case event::EventType::kWelcome:
      break;
    default:
      if (persister_->Accept(*doc)) {
        records_accepted_.fetch_add(1, std::memory_order_relaxed);
      }
      break;
  }
}

bool StreamRecorder::Run(const std::atomic<bool>& stop_requested) {
  char buf[4096];
  while (!stop_requested.load(std::memory_order_acquire)) {
    if (fd_ < 0) return false;

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int poll_ret = ::poll(&pfd, 1, kPollTimeoutMs);
    if (poll_ret < 0) {
      if (errno == EINTR) continue;
      Logger::Error(std::string("[StreamRecorder] poll() failed: ") + std::strerror(errno));
      return false;
    }
    if (poll_ret == 0) continue;

    ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
    if (n == 0) {
      Logger::Info("[StreamRecorder] Server closed the connection");
      FlushBuffered("after disconnect");
      return true;
    }
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      Logger::Error(std::string("[StreamRecorder] recv() failed: ") + std::strerror(errno));
      return false;
    }

    pending_.append(buf, static_cast<size_t>(n));
    size_t start = 0;
    size_t nl;
    while ((nl = pending_.find('\n', start)) != std::string::npos) {
      std::string line = pending_.substr(start, nl - start);
      start = nl + 1;
      if (!line.empty() && line.back() == '\r') line.pop_back();
      if (!line.empty()) HandleLine(line);
    }
    pending_.erase(0, start);
    if (pending_.size() > config_.max_line_bytes) {
      Logger::Warn("[StreamRecorder] Dropping over-long partial line");
      pending_.clear();
    }
  }
  FlushBuffered("on stop");
  return true;
}

void StreamRecorder::FlushBuffered(const std::string& when) {
  if (!persister_->Flush()) {
    Logger::Warn("[StreamRecorder] Flush " + when + " failed; " +
                 std::to_string(persister_->Buffered()) + " records kept for retry");
  }
}

void StreamRecorder::Disconnect() {
  if (fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    fd_ = -1;
  }
  pending_.clear();
}

}  // namespace pulsecast::persist
