#pragma once
/** @file  EngineSettings.hpp
 *  @brief Tunables of the resolution engine, read from the JSON config.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "core/LoopUnroller.hpp"

namespace cycleflow::core {

  /**
 * @struct EngineSettings
 * @brief Schema: `{"unroll": {"max_iterations": N}, "log": {"csv_path": "..."}}`.
 *
 *  Both sections are optional. Wrong types or `max_iterations < 1` throw
 *  `std::invalid_argument`.
 */
  struct EngineSettings {
    std::size_t maxUnrollIterations{ kDefaultMaxIterations };
    std::optional<std::string> eventLogPath; ///< no event log when unset

    static EngineSettings fromJson(const nlohmann::json& config);
  };

} // namespace cycleflow::core
