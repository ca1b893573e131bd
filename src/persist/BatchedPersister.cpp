// Repository: Pulsecast
// Component: BatchedPersister Implementation
// Purpose: Merge-and-replace persistence of buffered biometric records.
// Copyright (c) 2026 Pulsecast

#include "pulsecast/persist/BatchedPersister.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include <unistd.h>

#include "pulsecast/event/BiometricEvent.hpp"
#include "pulsecast/util/Logger.hpp"

namespace pulsecast::persist {

using pulsecast::util::JsonValue;
using pulsecast::util::Logger;

BatchedPersister::BatchedPersister(PersisterConfig config) : config_(std::move(config)) {
  if (config_.buffer_path.empty()) {
    throw std::invalid_argument("BatchedPersister: buffer_path must not be empty");
  }
  if (config_.batch_size == 0) {
    throw std::invalid_argument("BatchedPersister: batch_size must be positive");
  }
}

BatchedPersister::~BatchedPersister() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!FlushLocked()) {
    Logger::Error("[BatchedPersister] " + std::to_string(buffer_.size()) +
                  " records lost at shutdown");
  }
}

bool BatchedPersister::Accept(const JsonValue& record) {
  std::string type_name;
  if (!util::GetString(record, "event_type", &type_name)) return false;
  auto type = event::ParseEventType(type_name);
  if (!type || !event::IsBiometric(*type)) return false;

  std::lock_guard<std::mutex> lock(mutex_);
  buffer_.push_back(record);
  if (buffer_.size() >= config_.batch_size) {
    FlushLocked();
  }
  return true;
}

bool BatchedPersister::Flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  return FlushLocked();
}

bool BatchedPersister::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!FlushLocked()) {
    Logger::Warn("[BatchedPersister] Final flush before clear failed; discarding " +
                 std::to_string(buffer_.size()) + " records");
  }
  buffer_.clear();
  if (!WriteAtomically("[]")) return false;
  Logger::Info("[BatchedPersister] Cleared " + config_.buffer_path);
  return true;
}

size_t BatchedPersister::Buffered() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buffer_.size();
}

std::optional<JsonValue> BatchedPersister::ReadRecords(const std::string& path,
                                                       std::string* error) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return JsonValue::MakeArray();
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    if (error) *error = "cannot open " + path + ": " + std::strerror(errno);
    return std::nullopt;
  }
  std::ostringstream buf;
  buf << in.rdbuf();
  std::string parse_error;
  auto doc = util::ParseJson(buf.str(), &parse_error);
  if (!doc) {
    if (error) *error = path + " is not valid JSON: " + parse_error;
    return std::nullopt;
  }
  if (!doc->IsArray()) {
    if (error) *error = path + " does not hold a JSON array";
    return std::nullopt;
  }
  return doc;
}

bool BatchedPersister::FlushLocked() {
  if (buffer_.empty()) return true;

  std::string error;
  auto existing = ReadRecords(config_.buffer_path, &error);
  JsonValue merged = JsonValue::MakeArray();
  if (existing) {
    merged = std::move(*existing);
  } else {
    Logger::Warn("[BatchedPersister] Existing buffer unreadable, starting fresh: " + error);
  }
  for (const auto& record : buffer_) {
    merged.Append(record);
  }

  if (!WriteAtomically(util::SerializeJson(merged))) {
    return false;
  }
  Logger::Debug("[BatchedPersister] Flushed " + std::to_string(buffer_.size()) + " records (" +
                std::to_string(merged.size()) + " total)");
  buffer_.clear();
  return true;
}

bool BatchedPersister::WriteAtomically(const std::string& contents) {
  namespace fs = std::filesystem;
  const fs::path target(config_.buffer_path);
  if (target.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      Logger::Error("[BatchedPersister] Cannot create " + target.parent_path().string() + ": " +
                    ec.message());
      return false;
    }
  }

  const std::string tmp_path = config_.buffer_path + ".tmp." +
                               std::to_string(static_cast<unsigned long>(getpid())) + "." +
                               std::to_string(temp_counter_++);
  {
    std::ofstream of(tmp_path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!of) {
      Logger::Error("[BatchedPersister] Cannot open " + tmp_path + ": " + std::strerror(errno));
      return false;
    }
    of << contents;
    of.flush();
    if (!of) {
      of.close();
      (void)unlink(tmp_path.c_str());
      Logger::Error("[BatchedPersister] Write to " + tmp_path + " failed");
      return false;
    }
  }
  if (std::rename(tmp_path.c_str(), config_.buffer_path.c_str()) != 0) {
    const int err = errno;
    (void)unlink(tmp_path.c_str());
    Logger::Error("[BatchedPersister] rename to " + config_.buffer_path +
                  " failed: " + std::strerror(err));
    return false;
  }
  return true;
}

}  // namespace pulsecast::persist
