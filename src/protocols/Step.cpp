/* @file Step.cpp
 * @brief Step construction invariants and kind helpers.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <string>
#include <type_traits>
#include <utility>

// cycleflow headers
#include "protocols/ProtocolErrors.hpp"
#include "protocols/Step.hpp"

namespace cycleflow::protocols {

  namespace {
    bool isBlank(const std::string& s) {
      return std::all_of(s.begin(), s.end(),
                         [](unsigned char c) { return std::isspace(c) != 0; });
    }

    void requireRepeatCount(int repeatCount) {
      if (repeatCount < 1)
        throw StructuralError("Loop repeat count must be at least 1, got " +
                              std::to_string(repeatCount) + ".");
    }

    bool nonZero(const std::optional<double>& v) { return v && *v != 0.0; }
  } // namespace

  Loop::Loop(std::size_t position, int repeatCount, std::optional<std::string> id)
      : target_(position), repeatCount_(repeatCount), id_(std::move(id)) {
    if (position == 0)
      throw StructuralError("Loop start must be a positive step number or a tag name.");
    requireRepeatCount(repeatCount);
  }

  Loop::Loop(std::string tagName, int repeatCount, std::optional<std::string> id)
      : target_(std::move(tagName)), repeatCount_(repeatCount), id_(std::move(id)) {
    if (isBlank(std::get<std::string>(target_)))
      throw StructuralError("Loop start cannot be empty.");
    requireRepeatCount(repeatCount);
  }

  Loop Loop::retargeted(std::size_t position) const { return Loop(position, repeatCount_, id_); }

  Tag::Tag(std::string name, std::optional<std::string> id)
      : name_(std::move(name)), id_(std::move(id)) {
    if (isBlank(name_))
      throw StructuralError("Tag must not be empty.");
  }

  std::string_view stepKindName(const Step& step) {
    return std::visit(
        [](const auto& s) -> std::string_view {
          using T = std::decay_t<decltype(s)>;
          if constexpr (std::is_same_v<T, Rest>)
            return "open_circuit_voltage";
          else if constexpr (std::is_same_v<T, ConstantCurrent>)
            return "constant_current";
          else if constexpr (std::is_same_v<T, ConstantVoltage>)
            return "constant_voltage";
          else if constexpr (std::is_same_v<T, ImpedanceSweep>)
            return "impedance_spectroscopy";
          else if constexpr (std::is_same_v<T, Loop>)
            return "loop";
          else {
            static_assert(std::is_same_v<T, Tag>, "unhandled step kind");
            return "tag";
          }
        },
        step);
  }

  bool usesRate(const Step& step) {
    if (const auto* cc = std::get_if<ConstantCurrent>(&step))
      return nonZero(cc->rate_C);
    if (const auto* cv = std::get_if<ConstantVoltage>(&step))
      return nonZero(cv->untilRate_C);
    return false;
  }

} // namespace cycleflow::protocols
