#pragma once
/** @file  CyclingProtocol.hpp
 *  @brief Battery-cycling protocol: sample/record/safety metadata plus the step method.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <optional>
#include <string>
#include <vector>

// cycleflow headers
#include "protocols/Step.hpp"

namespace cycleflow::protocols {

  struct SampleParams {
    std::string name{ "$NAME" };
    std::optional<double> capacity_mAh; ///< needed to turn C-rates into currents

    bool operator==(const SampleParams&) const = default;
  };

  /// Data-recording triggers; any one of them records a point.
  struct RecordParams {
    std::optional<double> current_mA;
    std::optional<double> voltage_V;
    double time_s{ 1.0 };

    bool operator==(const RecordParams&) const = default;
  };

  /// Limits that cancel the whole experiment once exceeded for `delay_s`.
  struct SafetyParams {
    std::optional<double> maxVoltage_V;
    std::optional<double> minVoltage_V;
    std::optional<double> maxCurrent_mA;
    std::optional<double> minCurrent_mA;
    std::optional<double> maxCapacity_mAh;
    std::optional<double> delay_s;

    bool operator==(const SafetyParams&) const = default;
  };

  /**
 * @class CyclingProtocol
 * @brief Vendor-independent protocol definition consumed by every exporter.
 *
 *  * The constructor rejects the whole protocol on any structural violation
 *    (see StructuralValidator.hpp), so a live object is always well-formed.
 *  * Value type: copying gives an independent clone, nothing is shared.
 */
  class CyclingProtocol {
  public:
    explicit CyclingProtocol(std::vector<Step> method, SampleParams sample = {},
                             RecordParams record = {}, SafetyParams safety = {});

    const std::vector<Step>& method() const { return method_; }
    const SampleParams& sample() const { return sample_; }
    const RecordParams& record() const { return record_; }
    const SafetyParams& safety() const { return safety_; }

    /// Clone with the sample name and/or capacity overridden (unset fields keep their value).
    CyclingProtocol withSample(std::optional<std::string> name,
                               std::optional<double> capacity_mAh) const;

    bool operator==(const CyclingProtocol&) const = default;

  private:
    std::vector<Step> method_;
    SampleParams sample_;
    RecordParams record_;
    SafetyParams safety_;
  };

} // namespace cycleflow::protocols
