// Repository: Pulsecast
// Component: BatchedPersister
// Purpose: Buffers biometric records in memory and atomically rewrites a JSON
//          array file once a batch fills.
// Copyright (c) 2026 Pulsecast

#ifndef PULSECAST_PERSIST_BATCHED_PERSISTER_HPP_
#define PULSECAST_PERSIST_BATCHED_PERSISTER_HPP_

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "pulsecast/util/Json.hpp"

namespace pulsecast::persist {

struct PersisterConfig {
  std::string buffer_path = "biometric/buffer/pulse_temp.json";
  size_t batch_size = 10;
};

// File contents are always a complete JSON array: every write goes to a
// unique temporary file in the same directory and is renamed over the target.
// A failed write removes the temporary, keeps the in-memory buffer and is
// retried on the next trigger.
class BatchedPersister {
 public:
  // Throws std::invalid_argument for an empty path or a zero batch size.
  explicit BatchedPersister(PersisterConfig config);

  // Attempts a final flush.
  ~BatchedPersister();

  BatchedPersister(const BatchedPersister&) = delete;
  BatchedPersister& operator=(const BatchedPersister&) = delete;

  // Buffers a record whose "event_type" is a biometric kind; other records
  // are ignored (returns false). Reaching batch_size triggers a flush.
  bool Accept(const util::JsonValue& record);

  // Appends buffered records to the file. Returns true when the buffer is
  // empty afterwards.
  bool Flush();

  // Final flush, then resets the file to [] and empties the buffer.
  bool Clear();

  size_t Buffered() const;
  const std::string& path() const { return config_.buffer_path; }
  size_t batch_size() const { return config_.batch_size; }

  // Reads a buffer file. A missing file reads as an empty array.
  static std::optional<util::JsonValue> ReadRecords(const std::string& path,
                                                    std::string* error);

 private:
  bool FlushLocked();
  bool WriteAtomically(const std::string& contents);

  const PersisterConfig config_;
  mutable std::mutex mutex_;
  std::vector<util::JsonValue> buffer_;
  uint64_t temp_counter_ = 0;
};

}  // namespace pulsecast::persist

#endif  // PULSECAST_PERSIST_BATCHED_PERSISTER_HPP_
