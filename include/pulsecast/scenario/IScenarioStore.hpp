// Repository: Pulsecast
// Component: Scenario Store Interface
// Purpose: Read-only provider of named timing sequences.
// Copyright (c) 2026 Pulsecast

#ifndef PULSECAST_SCENARIO_ISCENARIO_STORE_HPP_
#define PULSECAST_SCENARIO_ISCENARIO_STORE_HPP_

#include <optional>
#include <string>
#include <vector>

#include "pulsecast/scenario/ScenarioDefinition.hpp"

namespace pulsecast::scenario {

enum class LoadStatus {
  kOk,
  kNotFound,      // no scenario with that name
  kInvalidName,   // name rejected before lookup
  kMalformed,     // data present but unparseable or invalid
};

struct LoadResult {
  std::optional<ScenarioDefinition> definition;
  LoadStatus status = LoadStatus::kOk;
  std::string message;

  bool ok() const { return status == LoadStatus::kOk && definition.has_value(); }
};

// Definitions are loaded on demand for each start and never cached, so a
// scenario file edited between runs takes effect on the next start.
class IScenarioStore {
 public:
  virtual ~IScenarioStore() = default;

  virtual LoadResult Load(const std::string& name) const = 0;

  // Names accepted by Load, sorted.
  virtual std::vector<std::string> List() const = 0;
};

}  // namespace pulsecast::scenario

#endif  // PULSECAST_SCENARIO_ISCENARIO_STORE_HPP_
