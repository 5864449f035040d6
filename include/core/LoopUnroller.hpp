#pragma once
/** @file  LoopUnroller.hpp
 *  @brief Expands a resolved sequence into the flat list of steps actually executed.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <vector>

// cycleflow headers
#include "core/ResolvedSequence.hpp"

namespace cycleflow::core {

  /// 0-based indices of non-loop steps of a ResolvedSequence, in execution order.
  using ExecutionTrace = std::vector<std::size_t>;

  inline constexpr std::size_t kDefaultMaxIterations = 10000;

  /**
 * @brief Simulate a program counter over \p seq and record every step visited.
 *
 *  * A loop with repeat count N sends execution back N-1 times, so its body
 *    runs N times in total.
 *  * Re-entering a loop restarts the counters of the loops nested inside it.
 *  * Precondition: `checkNesting(seq)` passed.
 *
 *  @throws protocols::RunawayExpansionError once more than \p maxIterations
 *          program-counter moves were simulated
 */
  ExecutionTrace unroll(const ResolvedSequence& seq,
                        std::size_t maxIterations = kDefaultMaxIterations);

} // namespace cycleflow::core
