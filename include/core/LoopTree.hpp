#pragma once
/** @file  LoopTree.hpp
 *  @brief Hierarchical view of a resolved sequence for exporters with nested loops.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <vector>

// cycleflow headers
#include "core/ResolvedSequence.hpp"

namespace cycleflow::core {

  /**
 * @class LoopNode
 * @brief Either a leaf (index of a non-loop step) or a repeat block.
 *
 *  * A repeat block runs its body `repeatCount()` times in total.
 *  * Leaf indices are 0-based indices into the ResolvedSequence.
 */
  class LoopNode {
  public:
    static LoopNode leaf(std::size_t stepIndex);
    static LoopNode repeat(int repeatCount, std::vector<LoopNode> body);

    bool isLeaf() const { return isLeaf_; }
    std::size_t stepIndex() const { return stepIndex_; }
    int repeatCount() const { return repeatCount_; }
    const std::vector<LoopNode>& body() const { return body_; }

    bool operator==(const LoopNode& other) const;

  private:
    LoopNode() = default;

    bool isLeaf_{ true };
    std::size_t stepIndex_{ 0 };
    int repeatCount_{ 0 };
    std::vector<LoopNode> body_;
  };

  using LoopTree = std::vector<LoopNode>;

  /**
 * @brief Group a nesting-checked sequence into repeat blocks, preserving order.
 *
 *  Precondition: `checkNesting(seq)` passed. Recursion depth equals the loop
 *  nesting depth.
 */
  LoopTree buildLoopTree(const ResolvedSequence& seq);

  /// Leaf indices in document order (loop steps never appear).
  std::vector<std::size_t> flattenLeaves(const LoopTree& tree);

} // namespace cycleflow::core
