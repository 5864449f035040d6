#pragma once
/** @file  Step.hpp
 *  @brief Closed set of cycling-protocol step types (rest, CC, CV, EIS, loop, tag).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace cycleflow {
  namespace protocols {

    /** Open-circuit rest for a fixed duration. */
    struct Rest {
      std::optional<std::string> id;
      double untilTime_s{ 0.0 };

      bool operator==(const Rest&) const = default;
    };

    /**
 * @struct ConstantCurrent
 * @brief Apply a current until any one of the stop conditions is met.
 *
 *  * `rate_C` (mA per mAh of sample capacity) takes priority over `current_mA`.
 *  * Negative values discharge.
 */
    struct ConstantCurrent {
      std::optional<std::string> id;
      std::optional<double> rate_C;
      std::optional<double> current_mA;
      std::optional<double> untilTime_s;
      std::optional<double> untilVoltage_V;

      bool operator==(const ConstantCurrent&) const = default;
    };

    /** Hold a voltage until time, C-rate or current falls below the limit. */
    struct ConstantVoltage {
      std::optional<std::string> id;
      double voltage_V{ 0.0 };
      std::optional<double> untilTime_s;
      std::optional<double> untilRate_C;
      std::optional<double> untilCurrent_mA;

      bool operator==(const ConstantVoltage&) const = default;
    };

    /** Potentio- (amplitude_V) or galvano- (amplitude_mA) impedance sweep. */
    struct ImpedanceSweep {
      std::optional<std::string> id;
      std::optional<double> amplitude_V;
      std::optional<double> amplitude_mA;
      double startFrequency_Hz{ 0.0 };
      double endFrequency_Hz{ 0.0 };
      int pointsPerDecade{ 10 };
      int measuresPerPoint{ 1 };
      bool driftCorrection{ false };

      bool operator==(const ImpedanceSweep&) const = default;
    };

    /// Loop target: 1-based step position, or the name of a Tag step.
    using LoopTarget = std::variant<std::size_t, std::string>;

    /**
 * @class Loop
 * @brief Jump back to `target` until the body has run `repeatCount` times in total.
 *
 *  * Immutable; the resolver builds a new Loop instead of rewriting the target.
 *  * Construction throws `StructuralError` for position 0, a blank tag name or
 *    a repeat count below 1.
 */
    class Loop {
    public:
      Loop(std::size_t position, int repeatCount, std::optional<std::string> id = std::nullopt);
      Loop(std::string tagName, int repeatCount, std::optional<std::string> id = std::nullopt);

      const LoopTarget& target() const { return target_; }
      int repeatCount() const { return repeatCount_; }
      const std::optional<std::string>& id() const { return id_; }

      bool isSymbolic() const { return std::holds_alternative<std::string>(target_); }
      /// Only valid when !isSymbolic().
      std::size_t position() const { return std::get<std::size_t>(target_); }
      /// Only valid when isSymbolic().
      const std::string& tagName() const { return std::get<std::string>(target_); }

      /// Same loop, pointing at \p position instead.
      Loop retargeted(std::size_t position) const;

      bool operator==(const Loop&) const = default;

    private:
      LoopTarget target_;
      int repeatCount_;
      std::optional<std::string> id_;
    };

    /**
 * @class Tag
 * @brief Named anchor for the step that follows it. Removed during resolution.
 */
    class Tag {
    public:
      explicit Tag(std::string name, std::optional<std::string> id = std::nullopt);

      const std::string& name() const { return name_; }
      const std::optional<std::string>& id() const { return id_; }

      bool operator==(const Tag&) const = default;

    private:
      std::string name_;
      std::optional<std::string> id_;
    };

    using Step = std::variant<Rest, ConstantCurrent, ConstantVoltage, ImpedanceSweep, Loop, Tag>;

    /// Stable lower-case kind name ("constant_current", "loop", ...).
    std::string_view stepKindName(const Step& step);

    /// True when the step is defined relative to the sample capacity.
    bool usesRate(const Step& step);

    inline bool isLoop(const Step& step) { return std::holds_alternative<Loop>(step); }
    inline bool isTag(const Step& step) { return std::holds_alternative<Tag>(step); }

  } // namespace protocols
} // namespace cycleflow
