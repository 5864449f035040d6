#pragma once
/** @file  CapacityCheck.hpp
 *  @brief Exporter pre-flight: C-rate steps need a reference capacity.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <vector>

// cycleflow headers
#include "protocols/CyclingProtocol.hpp"
#include "protocols/Step.hpp"

namespace cycleflow::core {

  /// @throws protocols::MissingCapacityError if a step uses a C-rate and capacity is unset or zero.
  void requireCapacityIfRateUsed(const std::vector<protocols::Step>& method,
                                 std::optional<double> capacity_mAh);

  void requireCapacityIfRateUsed(const protocols::CyclingProtocol& protocol);

} // namespace cycleflow::core
