// Repository: Pulsecast
// Component: Scenario Definition
// Purpose: Immutable named timing sequence with precomputed intervals.
// Copyright (c) 2026 Pulsecast

#ifndef PULSECAST_SCENARIO_SCENARIO_DEFINITION_HPP_
#define PULSECAST_SCENARIO_SCENARIO_DEFINITION_HPP_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "pulsecast/event/BiometricEvent.hpp"
#include "pulsecast/util/Json.hpp"

namespace pulsecast::scenario {

// Per-event overrides from the typed scenario file format. Fields not set fall
// back to the computed interval or the kind's default reading.
struct ScenarioSample {
  event::EventType type = event::EventType::kHeartbeat;
  std::optional<int64_t> interval_ms;
  std::optional<double> pulse_strength;
  std::optional<util::JsonValue> value;
  std::optional<int64_t> systolic;
  std::optional<int64_t> diastolic;
};

// A scenario is an ordered list of offsets (ms from sequence start). Each pair
// of consecutive offsets produces one emitted event, so N offsets replay as
// N-1 events. Two file shapes are accepted:
//
//   [0, 800, 1610, 2395]
//       Plain offsets. Every emitted event is a heartbeat.
//
//   {"events": [{"type": "heart_beat", "offset_ms": 800, ...}, ...]}
//       Typed events measured from an implicit origin at 0. Each listed
//       event is emitted (the origin is prepended to the offsets).
//
// Offsets must be non-negative and non-decreasing; at least two offsets are
// required, counting the implicit origin, so a typed file may list a single
// event. The span from first to last offset is capped at kMaxSpanMs.
class ScenarioDefinition {
 public:
  // Half the steady clock range, so a session anchor plus the span still fits.
  static constexpr int64_t kMaxSpanMs =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::duration::max()).count() / 2;

  static std::optional<ScenarioDefinition> FromJson(const std::string& name,
                                                    const util::JsonValue& doc,
                                                    std::string* error);

  static std::optional<ScenarioDefinition> FromOffsets(const std::string& name,
                                                       std::vector<int64_t> offsets,
                                                       std::string* error);

  const std::string& name() const { return name_; }
  const std::vector<int64_t>& offsets() const { return offsets_; }

  // intervals()[k] = offsets[k+1] - offsets[k]; size is event_count().
  const std::vector<int64_t>& intervals() const { return intervals_; }
  size_t event_count() const { return intervals_.size(); }

  // Offset of emitted event k relative to the first offset.
  int64_t RelativeOffsetMs(size_t k) const { return offsets_[k + 1] - offsets_[0]; }
  int64_t total_duration_ms() const { return offsets_.back() - offsets_.front(); }

  bool has_samples() const { return !samples_.empty(); }
  const std::vector<ScenarioSample>& samples() const { return samples_; }

  // Builds emitted event k (0-based). elapsed_ms is the measured time since
  // the session anchor.
  event::BiometricEvent MakeEvent(size_t k, int64_t timestamp_ms, int64_t elapsed_ms) const;

 private:
  ScenarioDefinition() = default;

  std::string name_;
  std::vector<int64_t> offsets_;
  std::vector<int64_t> intervals_;
  std::vector<ScenarioSample> samples_;  // empty, or one per emitted event
};

}  // namespace pulsecast::scenario

#endif  // PULSECAST_SCENARIO_SCENARIO_DEFINITION_HPP_
