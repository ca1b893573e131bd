// Repository: Pulsecast
// Component: File Scenario Store
// Purpose: Loads <dir>/<name>.json scenario files.
// Copyright (c) 2026 Pulsecast

#ifndef PULSECAST_SCENARIO_FILE_SCENARIO_STORE_HPP_
#define PULSECAST_SCENARIO_FILE_SCENARIO_STORE_HPP_

#include <string>
#include <vector>

#include "pulsecast/scenario/IScenarioStore.hpp"

namespace pulsecast::scenario {

constexpr const char* kDefaultScenarioDir = "biometric/pulse/demo_stream_source";

class FileScenarioStore : public IScenarioStore {
 public:
  explicit FileScenarioStore(std::string directory);

  LoadResult Load(const std::string& name) const override;
  std::vector<std::string> List() const override;

  const std::string& directory() const { return directory_; }

  // Names are plain file stems: non-empty, no path separators, no leading '.'.
  static bool IsValidName(const std::string& name);

 private:
  std::string PathFor(const std::string& name) const;

  std::string directory_;
};

}  // namespace pulsecast::scenario

#endif  // PULSECAST_SCENARIO_FILE_SCENARIO_STORE_HPP_
