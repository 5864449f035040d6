/* @file LoopUnroller.cpp
 * @brief Program-counter simulation with per-loop counters and a runaway guard.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <map>

// cycleflow headers
#include "core/LoopUnroller.hpp"
#include "protocols/ProtocolErrors.hpp"

using namespace cycleflow::protocols;

namespace cycleflow::core {

  namespace {
    struct LoopState {
      std::size_t jumpTo; ///< 0-based
      int jumps;          ///< go-backs allowed per entry
      int done{ 0 };
    };
  } // namespace

  ExecutionTrace unroll(const ResolvedSequence& seq, std::size_t maxIterations) {
    std::map<std::size_t, LoopState> loops; // ordered by position
    for (std::size_t i = 0; i < seq.size(); ++i)
      if (const auto* loop = std::get_if<Loop>(&seq[i]))
        loops.emplace(i, LoopState{ loop->position() - 1, loop->repeatCount() - 1 });

    ExecutionTrace trace;
    std::size_t i = 0;
    std::size_t moves = 0;

    while (i < seq.size()) {
      auto it = loops.find(i);
      if (it == loops.end()) {
        trace.push_back(i);
        ++i;
      } else if (LoopState& state = it->second; state.done < state.jumps) {
        // going back over nested loops: they start counting from zero again
        for (auto inner = loops.lower_bound(state.jumpTo); inner != it; ++inner)
          inner->second.done = 0;
        ++state.done;
        i = state.jumpTo;
      } else {
        ++i;
      }

      if (++moves > maxIterations)
        throw RunawayExpansionError(moves, maxIterations);
    }

    return trace;
  }

} // namespace cycleflow::core
