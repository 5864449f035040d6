/* @file NestingChecker.cpp
 * @brief Sorted pairwise scan over loop intervals.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cstddef>

// cycleflow headers
#include "core/NestingChecker.hpp"

using namespace cycleflow::protocols;

namespace cycleflow::core {

  std::vector<LoopInterval> loopIntervals(const ResolvedSequence& seq) {
    std::vector<LoopInterval> intervals;
    for (std::size_t i = 0; i < seq.size(); ++i)
      if (const auto* loop = std::get_if<Loop>(&seq[i]))
        intervals.push_back({ loop->position(), i + 1 });
    std::sort(intervals.begin(), intervals.end());
    return intervals;
  }

  void checkNesting(const ResolvedSequence& seq) {
    const auto intervals = loopIntervals(seq);

    for (std::size_t a = 0; a < intervals.size(); ++a) {
      for (std::size_t b = a + 1; b < intervals.size(); ++b) {
        const LoopInterval& x = intervals[a];
        const LoopInterval& y = intervals[b];

        // sorted by start: nothing after y can reach back into x either
        if (y.start > x.end)
          break;

        const bool crosses = (x.start < y.start && x.end < y.end) ||
                             (x.start > y.start && x.end > y.end);
        if (crosses)
          throw IntersectingLoopsError(x, y);
      }
    }
  }

} // namespace cycleflow::core
