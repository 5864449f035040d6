/* @file CyclingProtocol.cpp
 * @brief Protocol container; validates the method on construction.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <utility>

// cycleflow headers
#include "protocols/CyclingProtocol.hpp"
#include "protocols/StructuralValidator.hpp"

namespace cycleflow::protocols {

  CyclingProtocol::CyclingProtocol(std::vector<Step> method, SampleParams sample,
                                   RecordParams record, SafetyParams safety)
      : method_(std::move(method)), sample_(std::move(sample)), record_(std::move(record)),
        safety_(std::move(safety)) {
    validateStructure(method_);
  }

  CyclingProtocol CyclingProtocol::withSample(std::optional<std::string> name,
                                              std::optional<double> capacity_mAh) const {
    CyclingProtocol copy = *this;
    if (name && !name->empty())
      copy.sample_.name = std::move(*name);
    if (capacity_mAh)
      copy.sample_.capacity_mAh = capacity_mAh;
    return copy;
  }

} // namespace cycleflow::protocols
