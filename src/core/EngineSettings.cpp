/* @file EngineSettings.cpp
 * @brief Schema checks for the engine section of the config file.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

// cycleflow headers
#include "core/EngineSettings.hpp"

using namespace cycleflow::core;

namespace {
  const nlohmann::json* section(const nlohmann::json& config, const char* name) {
    auto it = config.find(name);
    if (it == config.end())
      return nullptr;
    if (!it->is_object())
      throw std::invalid_argument(std::string("[EngineSettings] '") + name + "' must be an object");
    return &*it;
  }
} // namespace

EngineSettings EngineSettings::fromJson(const nlohmann::json& config) {
  if (!config.is_object())
    throw std::invalid_argument("[EngineSettings] config root must be an object");

  EngineSettings settings;

  if (const auto* unroll = section(config, "unroll")) {
    if (auto it = unroll->find("max_iterations"); it != unroll->end()) {
      if (!it->is_number_integer() || it->get<long long>() < 1)
        throw std::invalid_argument("[EngineSettings] unroll.max_iterations must be an integer >= 1");
      settings.maxUnrollIterations = it->get<std::size_t>();
    }
  }

  if (const auto* log = section(config, "log")) {
    if (auto it = log->find("csv_path"); it != log->end()) {
      if (!it->is_string() || it->get<std::string>().empty())
        throw std::invalid_argument("[EngineSettings] log.csv_path must be a non-empty string");
      settings.eventLogPath = it->get<std::string>();
    }
  }

  return settings;
}
