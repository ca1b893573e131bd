// Repository: Pulsecast
// Component: Biometric Event
// Purpose: Immutable tagged event record and its wire serialization.
// Copyright (c) 2026 Pulsecast

#include "pulsecast/event/BiometricEvent.hpp"

#include <utility>

namespace pulsecast::event {

const char* EventTypeName(EventType type) {
  switch (type) {
    case EventType::kHeartbeat: return "heartbeat";
    case EventType::kRespiration: return "respiration";
    case EventType::kSpO2: return "spo2";
    case EventType::kTemperature: return "temperature";
    case EventType::kEcgRhythm: return "ecg_rhythm";
    case EventType::kBloodPressure: return "blood_pressure";
    case EventType::kWelcome: return "welcome";
    case EventType::kScenarioStarted: return "scenario_started";
    case EventType::kScenarioStopped: return "scenario_stopped";
    case EventType::kScenarioComplete: return "scenario_complete";
  }
  return "unknown";
}

std::optional<EventType> ParseEventType(const std::string& name) {
  if (name == "heartbeat" || name == "heart_beat") return EventType::kHeartbeat;
  if (name == "respiration") return EventType::kRespiration;
  if (name == "spo2") return EventType::kSpO2;
  if (name == "temperature") return EventType::kTemperature;
  if (name == "ecg_rhythm") return EventType::kEcgRhythm;
  if (name == "blood_pressure") return EventType::kBloodPressure;
  if (name == "welcome") return EventType::kWelcome;
  if (name == "scenario_started") return EventType::kScenarioStarted;
  if (name == "scenario_stopped") return EventType::kScenarioStopped;
  if (name == "scenario_complete") return EventType::kScenarioComplete;
  return std::nullopt;
}

bool IsBiometric(EventType type) {
  switch (type) {
    case EventType::kHeartbeat:
    case EventType::kRespiration:
    case EventType::kSpO2:
    case EventType::kTemperature:
    case EventType::kEcgRhythm:
    case EventType::kBloodPressure:
      return true;
    default:
      return false;
  }
}

BiometricEvent::BiometricEvent(EventType type, int64_t timestamp_ms,
                               std::optional<std::string> scenario, EventPayload payload)
    : type_(type),
      timestamp_ms_(timestamp_ms),
      scenario_(std::move(scenario)),
      payload_(std::move(payload)) {}

BiometricEvent BiometricEvent::Welcome(int64_t timestamp_ms) {
  return BiometricEvent(EventType::kWelcome, timestamp_ms, std::nullopt,
                        ControlPayload{"Connected to heartbeat server", std::nullopt, std::nullopt});
}

BiometricEvent BiometricEvent::ScenarioStarted(int64_t timestamp_ms, const std::string& scenario) {
  return BiometricEvent(EventType::kScenarioStarted, timestamp_ms, scenario,
                        ControlPayload{"Started " + scenario + " scenario", std::nullopt,
                                       std::nullopt});
}

BiometricEvent BiometricEvent::ScenarioStopped(int64_t timestamp_ms, const std::string& scenario) {
  return BiometricEvent(EventType::kScenarioStopped, timestamp_ms, scenario,
                        ControlPayload{"Scenario stopped", std::nullopt, std::nullopt});
}

BiometricEvent BiometricEvent::ScenarioComplete(int64_t timestamp_ms, const std::string& scenario,
                                                int64_t total_events, int64_t total_duration_ms) {
  return BiometricEvent(EventType::kScenarioComplete, timestamp_ms, scenario,
                        ControlPayload{"Scenario " + scenario + " complete", total_events,
                                       total_duration_ms});
}

namespace {

struct PayloadWriter {
  util::JsonValue* out;

  void operator()(const HeartbeatPayload& p) const {
    out->Set("interval_ms", p.interval_ms);
    out->Set("event_number", p.event_number);
    out->Set("elapsed_ms", p.elapsed_ms);
    if (p.pulse_strength) out->Set("pulse_strength", *p.pulse_strength);
  }
  void operator()(const RespirationPayload& p) const {
    out->Set("interval_ms", p.interval_ms);
    out->Set("event_number", p.event_number);
    out->Set("elapsed_ms", p.elapsed_ms);
  }
  void operator()(const SpO2Payload& p) const { out->Set("spo2", p.spo2); }
  void operator()(const TemperaturePayload& p) const { out->Set("temperature", p.temperature); }
  void operator()(const EcgRhythmPayload& p) const { out->Set("ecg_rhythm", p.rhythm); }
  void operator()(const BloodPressurePayload& p) const {
    out->Set("systolic", p.systolic);
    out->Set("diastolic", p.diastolic);
  }
  void operator()(const ControlPayload& p) const {
    out->Set("message", p.message);
    if (p.total_events) out->Set("total_events", *p.total_events);
    if (p.total_duration_ms) out->Set("total_duration_ms", *p.total_duration_ms);
  }
};

}  // namespace

util::JsonValue BiometricEvent::ToJson() const {
  util::JsonValue obj = util::JsonValue::MakeObject();
  obj.Set("timestamp", timestamp_ms_);
  obj.Set("event_type", EventTypeName(type_));
  if (scenario_) obj.Set("scenario", *scenario_);
  std::visit(PayloadWriter{&obj}, payload_);
  return obj;
}

std::string BiometricEvent::Serialize() const {
  return util::SerializeJson(ToJson());
}

}  // namespace pulsecast::event
