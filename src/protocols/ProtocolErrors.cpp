/* @file ProtocolErrors.cpp
 * @brief Diagnostic messages for the protocol error hierarchy.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <string>

// cycleflow headers
#include "protocols/ProtocolErrors.hpp"

namespace cycleflow::protocols {

  namespace {
    std::string toString(LoopInterval iv) {
      return "[" + std::to_string(iv.start) + ", " + std::to_string(iv.end) + "]";
    }
  } // namespace

  IntersectingLoopsError::IntersectingLoopsError(LoopInterval first, LoopInterval second)
      : ProtocolError("Protocol has intersecting loops: " + toString(first) + " and " +
                      toString(second) + " partially overlap."),
        first_(first), second_(second) {}

  RunawayExpansionError::RunawayExpansionError(std::size_t iterations, std::size_t limit)
      : ProtocolError("Over " + std::to_string(limit) + " steps while unrolling loops (stopped at " +
                      std::to_string(iterations) + "), likely a loop definition error."),
        iterations_(iterations), limit_(limit) {}

  UnsupportedStepError::UnsupportedStepError(std::string_view consumer, std::string_view stepKind)
      : ProtocolError(std::string(consumer) + " does not support step type: " +
                      std::string(stepKind)),
        stepKind_(stepKind) {}

} // namespace cycleflow::protocols
