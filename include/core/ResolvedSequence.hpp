#pragma once
/** @file  ResolvedSequence.hpp
 *  @brief Tag-free step sequence whose loops point at 1-based positions.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <utility>
#include <vector>

// cycleflow headers
#include "protocols/Step.hpp"

namespace cycleflow::core {

  /**
 * @class ResolvedSequence
 * @brief Output of `resolveTags()`; input of every downstream algorithm.
 *
 *  * Holds no `Tag` steps.
 *  * Every `Loop` has a numeric target strictly below its own 1-based position.
 *  * Only `resolveTags()` can build one, so the two guarantees above always hold.
 */
  class ResolvedSequence {
  public:
    const std::vector<protocols::Step>& steps() const { return steps_; }
    std::size_t size() const { return steps_.size(); }
    const protocols::Step& operator[](std::size_t index) const { return steps_[index]; }

    auto begin() const { return steps_.begin(); }
    auto end() const { return steps_.end(); }

    bool operator==(const ResolvedSequence&) const = default;

  private:
    friend ResolvedSequence resolveTags(const std::vector<protocols::Step>& method);

    explicit ResolvedSequence(std::vector<protocols::Step> steps) : steps_(std::move(steps)) {}

    std::vector<protocols::Step> steps_;
  };

} // namespace cycleflow::core
