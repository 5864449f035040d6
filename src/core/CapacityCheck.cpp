/* @file CapacityCheck.cpp
 * @brief Rejects rate-relative steps when no sample capacity is configured.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>

// cycleflow headers
#include "core/CapacityCheck.hpp"
#include "protocols/ProtocolErrors.hpp"

using namespace cycleflow::protocols;

namespace cycleflow::core {

  void requireCapacityIfRateUsed(const std::vector<Step>& method,
                                 std::optional<double> capacity_mAh) {
    if (capacity_mAh && *capacity_mAh > 0.0)
      return;
    if (std::any_of(method.begin(), method.end(), usesRate))
      throw MissingCapacityError();
  }

  void requireCapacityIfRateUsed(const CyclingProtocol& protocol) {
    requireCapacityIfRateUsed(protocol.method(), protocol.sample().capacity_mAh);
  }

} // namespace cycleflow::core
