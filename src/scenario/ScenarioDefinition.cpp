// Repository: Pulsecast
// Component: Scenario Definition
// Purpose: Validation and event construction for timing sequences.
// Copyright (c) 2026 Pulsecast

#include "pulsecast/scenario/ScenarioDefinition.hpp"

#include <utility>

namespace pulsecast::scenario {

namespace {

constexpr double kDefaultPulseStrength = 1.0;
constexpr double kDefaultTemperature = 37.0;
constexpr const char* kDefaultRhythm = "NSR";

bool SetError(std::string* error, const std::string& message) {
  if (error) *error = message;
  return false;
}

bool ParseSample(const util::JsonValue& entry, size_t index, int64_t* offset,
                 ScenarioSample* sample, std::string* error) {
  const std::string where = "events[" + std::to_string(index) + "]";
  if (!entry.IsObject()) return SetError(error, where + " is not an object");

  std::string type_name;
  if (!util::GetString(entry, "type", &type_name)) {
    return SetError(error, where + " missing \"type\"");
  }
  auto type = event::ParseEventType(type_name);
  if (!type || !event::IsBiometric(*type)) {
    return SetError(error, where + " has unknown event type \"" + type_name + "\"");
  }
  const util::JsonValue* off = entry.Find("offset_ms");
  if (off == nullptr || !off->IsInt()) {
    return SetError(error, where + " missing integer \"offset_ms\"");
  }
  *offset = off->AsInt();
  sample->type = *type;

  int64_t i = 0;
  double d = 0.0;
  if (util::GetInt(entry, "interval_ms", &i)) sample->interval_ms = i;
  if (util::GetDouble(entry, "pulse_strength", &d)) sample->pulse_strength = d;
  if (util::GetInt(entry, "systolic", &i)) sample->systolic = i;
  if (util::GetInt(entry, "diastolic", &i)) sample->diastolic = i;
  if (const util::JsonValue* v = entry.Find("value"); v != nullptr && !v->IsNull()) {
    sample->value = *v;
  }

  switch (sample->type) {
    case event::EventType::kSpO2:
    case event::EventType::kTemperature:
      if (sample->value && !sample->value->IsNumber()) {
        return SetError(error, where + " \"value\" must be numeric for " + type_name);
      }
      break;
    case event::EventType::kEcgRhythm:
      if (sample->value && !sample->value->IsString()) {
        return SetError(error, where + " \"value\" must be a string for ecg_rhythm");
      }
      break;
    case event::EventType::kBloodPressure:
      if (!sample->systolic || !sample->diastolic) {
        return SetError(error, where + " blood_pressure requires systolic and diastolic");
      }
      break;
    default:
      break;
  }
  return true;
}

}  // namespace

std::optional<ScenarioDefinition> ScenarioDefinition::FromOffsets(const std::string& name,
                                                                  std::vector<int64_t> offsets,
                                                                  std::string* error) {
  if (offsets.size() < 2) {
    SetError(error, "scenario '" + name + "' needs at least two offsets");
    return std::nullopt;
  }
  for (size_t k = 0; k < offsets.size(); ++k) {
    if (offsets[k] < 0) {
      SetError(error, "scenario '" + name + "' has a negative offset at index " +
                          std::to_string(k));
      return std::nullopt;
    }
    if (k > 0 && offsets[k] < offsets[k - 1]) {
      SetError(error, "scenario '" + name + "' offsets decrease at index " +
                          std::to_string(k));
      return std::nullopt;
    }
  }
  if (offsets.back() - offsets.front() > kMaxSpanMs) {
    SetError(error, "scenario '" + name + "' spans " +
                        std::to_string(offsets.back() - offsets.front()) +
                        " ms, exceeding the limit of " + std::to_string(kMaxSpanMs) + " ms");
    return std::nullopt;
  }

  ScenarioDefinition def;
  def.name_ = name;
  def.offsets_ = std::move(offsets);
  def.intervals_.reserve(def.offsets_.size() - 1);
  for (size_t k = 1; k < def.offsets_.size(); ++k) {
    def.intervals_.push_back(def.offsets_[k] - def.offsets_[k - 1]);
  }
  return def;
}

std::optional<ScenarioDefinition> ScenarioDefinition::FromJson(const std::string& name,
                                                               const util::JsonValue& doc,
                                                               std::string* error) {
  if (doc.IsArray()) {
    std::vector<int64_t> offsets;
    offsets.reserve(doc.size());
    for (size_t k = 0; k < doc.AsArray().size(); ++k) {
      const util::JsonValue& v = doc.AsArray()[k];
      if (!v.IsInt()) {
        SetError(error, "scenario '" + name + "' offset " + std::to_string(k) +
                            " is not an integer");
        return std::nullopt;
      }
      offsets.push_back(v.AsInt());
    }
    return FromOffsets(name, std::move(offsets), error);
  }

  const util::JsonValue* events = doc.Find("events");
  if (events == nullptr || !events->IsArray()) {
    SetError(error, "scenario '" + name + "' is neither an offset array nor an events object");
    return std::nullopt;
  }

  std::vector<int64_t> offsets{0};
  std::vector<ScenarioSample> samples;
  samples.reserve(events->size());
  for (size_t k = 0; k < events->AsArray().size(); ++k) {
    int64_t offset = 0;
    ScenarioSample sample;
    if (!ParseSample(events->AsArray()[k], k, &offset, &sample, error)) {
      if (error) *error = "scenario '" + name + "' " + *error;
      return std::nullopt;
    }
    offsets.push_back(offset);
    samples.push_back(std::move(sample));
  }

  auto def = FromOffsets(name, std::move(offsets), error);
  if (def) def->samples_ = std::move(samples);
  return def;
}

event::BiometricEvent ScenarioDefinition::MakeEvent(size_t k, int64_t timestamp_ms,
                                                    int64_t elapsed_ms) const {
  using event::EventType;
  const int64_t interval = intervals_[k];
  const int64_t number = static_cast<int64_t>(k);

  if (samples_.empty()) {
    return event::BiometricEvent(EventType::kHeartbeat, timestamp_ms, name_,
                                 event::HeartbeatPayload{interval, number, elapsed_ms,
                                                         std::nullopt});
  }

  const ScenarioSample& s = samples_[k];
  switch (s.type) {
    case EventType::kHeartbeat:
      return event::BiometricEvent(
          s.type, timestamp_ms, name_,
          event::HeartbeatPayload{s.interval_ms.value_or(interval), number, elapsed_ms,
                                  s.pulse_strength.value_or(kDefaultPulseStrength)});
    case EventType::kRespiration:
      return event::BiometricEvent(
          s.type, timestamp_ms, name_,
          event::RespirationPayload{s.interval_ms.value_or(interval), number, elapsed_ms});
    case EventType::kSpO2:
      return event::BiometricEvent(s.type, timestamp_ms, name_,
                                   event::SpO2Payload{s.value ? s.value->AsInt() : 0});
    case EventType::kTemperature:
      return event::BiometricEvent(
          s.type, timestamp_ms, name_,
          event::TemperaturePayload{s.value ? s.value->AsDouble() : kDefaultTemperature});
    case EventType::kEcgRhythm:
      return event::BiometricEvent(
          s.type, timestamp_ms, name_,
          event::EcgRhythmPayload{s.value ? s.value->AsString() : std::string(kDefaultRhythm)});
    case EventType::kBloodPressure:
      return event::BiometricEvent(
          s.type, timestamp_ms, name_,
          event::BloodPressurePayload{s.systolic.value_or(0), s.diastolic.value_or(0)});
    default:
      break;
  }
  // Samples are validated to biometric kinds at load.
  return event::BiometricEvent(EventType::kHeartbeat, timestamp_ms, name_,
                               event::HeartbeatPayload{interval, number, elapsed_ms,
                                                       std::nullopt});
}

}  // namespace pulsecast::scenario
