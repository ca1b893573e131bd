// Repository: Pulsecast
// Component: Biometric Event
// Purpose: Immutable tagged event record and its wire serialization.
// Copyright (c) 2026 Pulsecast

#ifndef PULSECAST_EVENT_BIOMETRIC_EVENT_HPP_
#define PULSECAST_EVENT_BIOMETRIC_EVENT_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "pulsecast/util/Json.hpp"

namespace pulsecast::event {

enum class EventType {
  kHeartbeat,
  kRespiration,
  kSpO2,
  kTemperature,
  kEcgRhythm,
  kBloodPressure,
  kWelcome,
  kScenarioStarted,
  kScenarioStopped,
  kScenarioComplete,
};

// Wire name ("heartbeat", "scenario_complete", ...).
const char* EventTypeName(EventType type);

// Accepts wire names plus the scenario-file alias "heart_beat".
std::optional<EventType> ParseEventType(const std::string& name);

// True for the physiological kinds a recorder keeps; false for welcome and
// lifecycle events.
bool IsBiometric(EventType type);

// Payloads. Interval-carrying kinds record their position in the run.
struct HeartbeatPayload {
  int64_t interval_ms = 0;
  int64_t event_number = 0;
  int64_t elapsed_ms = 0;
  std::optional<double> pulse_strength;
};

struct RespirationPayload {
  int64_t interval_ms = 0;
  int64_t event_number = 0;
  int64_t elapsed_ms = 0;
};

struct SpO2Payload {
  int64_t spo2 = 0;
};

struct TemperaturePayload {
  double temperature = 0.0;
};

struct EcgRhythmPayload {
  std::string rhythm;
};

struct BloodPressurePayload {
  int64_t systolic = 0;
  int64_t diastolic = 0;
};

struct ControlPayload {
  std::string message;
  std::optional<int64_t> total_events;
  std::optional<int64_t> total_duration_ms;
};

using EventPayload = std::variant<HeartbeatPayload, RespirationPayload, SpO2Payload,
                                  TemperaturePayload, EcgRhythmPayload,
                                  BloodPressurePayload, ControlPayload>;

// BiometricEvent is constructed once (by the player or the router), serialized
// once per publish, and never mutated. Copies are cheap enough for the
// per-event fan-out path since the router only passes the serialized text on.
class BiometricEvent {
 public:
  BiometricEvent(EventType type, int64_t timestamp_ms,
                 std::optional<std::string> scenario, EventPayload payload);

  // Factories for the router's control events.
  static BiometricEvent Welcome(int64_t timestamp_ms);
  static BiometricEvent ScenarioStarted(int64_t timestamp_ms, const std::string& scenario);
  static BiometricEvent ScenarioStopped(int64_t timestamp_ms, const std::string& scenario);
  static BiometricEvent ScenarioComplete(int64_t timestamp_ms, const std::string& scenario,
                                         int64_t total_events, int64_t total_duration_ms);

  EventType type() const { return type_; }
  int64_t timestamp_ms() const { return timestamp_ms_; }
  const std::optional<std::string>& scenario() const { return scenario_; }
  const EventPayload& payload() const { return payload_; }

  // {"timestamp":..., "event_type":"...", "scenario":"..."?, ...fields}
  util::JsonValue ToJson() const;
  std::string Serialize() const;

 private:
  EventType type_;
  int64_t timestamp_ms_;
  std::optional<std::string> scenario_;
  EventPayload payload_;
};

}  // namespace pulsecast::event

#endif  // PULSECAST_EVENT_BIOMETRIC_EVENT_HPP_
