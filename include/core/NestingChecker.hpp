#pragma once
/** @file  NestingChecker.hpp
 *  @brief Verifies that loop intervals form a laminar family (nested or disjoint).
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <vector>

// cycleflow headers
#include "core/ResolvedSequence.hpp"
#include "protocols/ProtocolErrors.hpp"

namespace cycleflow::core {

  /// `[target, position]` of every loop, sorted by start then end.
  std::vector<protocols::LoopInterval> loopIntervals(const ResolvedSequence& seq);

  /**
 * @brief Gate for the tree builder and the unroller.
 *
 *  Equal and properly nested intervals pass; a pair that partially overlaps
 *  (or where one ends exactly where the other starts) does not.
 *
 *  @throws protocols::IntersectingLoopsError naming the first offending pair
 */
  void checkNesting(const ResolvedSequence& seq);

} // namespace cycleflow::core
