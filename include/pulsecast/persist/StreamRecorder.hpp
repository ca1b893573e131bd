// Repository: Pulsecast
// Component: StreamRecorder
// Purpose: Stream-transport client that records biometric events through a
//          BatchedPersister.
// Copyright (c) 2026 Pulsecast

#ifndef PULSECAST_PERSIST_STREAM_RECORDER_HPP_
#define PULSECAST_PERSIST_STREAM_RECORDER_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "pulsecast/persist/BatchedPersister.hpp"

namespace pulsecast::persist {

struct RecorderConfig {
  std::string host = "127.0.0.1";
  uint16_t port = 5000;
  std::optional<std::string> start_scenario;  // sent once after connecting
  size_t max_line_bytes = 64 * 1024;
};

// Line handling:
//   scenario_started             -> persister Clear() (new recording)
//   biometric event              -> persister Accept()
//   scenario_complete / stopped  -> persister Flush()
//   welcome, anything else       -> ignored
class StreamRecorder {
 public:
  StreamRecorder(RecorderConfig config, std::shared_ptr<BatchedPersister> persister);
  ~StreamRecorder();

  StreamRecorder(const StreamRecorder&) = delete;
  StreamRecorder& operator=(const StreamRecorder&) = delete;

  bool Connect(std::string* error);

  // Writes one command line. Returns false when not connected or on error.
  bool SendCommand(const std::string& json);

  // Reads until the server disconnects or stop_requested becomes true.
  // Returns false on a read error.
  bool Run(const std::atomic<bool>& stop_requested);

  void HandleLine(const std::string& line);
  void Disconnect();

  uint64_t records_accepted() const { return records_accepted_.load(std::memory_order_relaxed); }
  uint64_t lines_ignored() const { return lines_ignored_.load(std::memory_order_relaxed); }

 private:
  void FlushBuffered(const std::string& when);

  RecorderConfig config_;
  std::shared_ptr<BatchedPersister> persister_;
  int fd_ = -1;
  std::string pending_;
  std::atomic<uint64_t> records_accepted_{0};
  std::atomic<uint64_t> lines_ignored_{0};
};

}  // namespace pulsecast::persist

#endif  // PULSECAST_PERSIST_STREAM_RECORDER_HPP_
