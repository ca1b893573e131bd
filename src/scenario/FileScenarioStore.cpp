// Repository: Pulsecast
// Component: File Scenario Store
// Purpose: Loads <dir>/<name>.json scenario files.
// Copyright (c) 2026 Pulsecast

#include "pulsecast/scenario/FileScenarioStore.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "pulsecast/util/Logger.hpp"

namespace pulsecast::scenario {

namespace {
constexpr const char* kExtension = ".json";
}  // namespace

FileScenarioStore::FileScenarioStore(std::string directory)
    : directory_(std::move(directory)) {}

bool FileScenarioStore::IsValidName(const std::string& name) {
  if (name.empty() || name.front() == '.') return false;
  return name.find_first_of("/\\") == std::string::npos;
}

std::string FileScenarioStore::PathFor(const std::string& name) const {
  if (directory_.empty()) return name + kExtension;
  if (directory_.back() == '/') return directory_ + name + kExtension;
  return directory_ + "/" + name + kExtension;
}

LoadResult FileScenarioStore::Load(const std::string& name) const {
  LoadResult result;
  if (!IsValidName(name)) {
    result.status = LoadStatus::kInvalidName;
    result.message = "invalid scenario name '" + name + "'";
    return result;
  }

  const std::string path = PathFor(name);
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    result.status = LoadStatus::kNotFound;
    result.message = "scenario '" + name + "' not found (" + path + ")";
    return result;
  }
  std::ostringstream buf;
  buf << in.rdbuf();

  std::string error;
  auto doc = util::ParseJson(buf.str(), &error);
  if (!doc) {
    result.status = LoadStatus::kMalformed;
    result.message = "scenario '" + name + "' is not valid JSON: " + error;
    return result;
  }
  result.definition = ScenarioDefinition::FromJson(name, *doc, &error);
  if (!result.definition) {
    result.status = LoadStatus::kMalformed;
    result.message = error;
    return result;
  }
  util::Logger::Debug("[FileScenarioStore] Loaded '" + name + "' from " + path + " (" +
                      std::to_string(result.definition->event_count()) + " events)");
  return result;
}

std::vector<std::string> FileScenarioStore::List() const {
  namespace fs = std::filesystem;
  std::vector<std::string> names;
  std::error_code ec;
  fs::directory_iterator it(directory_.empty() ? "." : directory_, ec);
  if (ec) {
    util::Logger::Warn("[FileScenarioStore] Cannot list " + directory_ + ": " + ec.message());
    return names;
  }
  for (const auto& entry : it) {
    if (!entry.is_regular_file(ec)) continue;
    const fs::path& p = entry.path();
    if (p.extension() != kExtension) continue;
    std::string stem = p.stem().string();
    if (IsValidName(stem)) names.push_back(stem);
  }
  std::sort(names.begin(), names.end());
  return names;
}

}  // namespace pulsecast::scenario
