/* @file LoopTree.cpp
 * @brief Backward scan with a skip watermark, recursing into each loop body.
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cassert>
#include <optional>
#include <utility>

// cycleflow headers
#include "core/LoopTree.hpp"

using namespace cycleflow::protocols;

namespace cycleflow::core {

  LoopNode LoopNode::leaf(std::size_t stepIndex) {
    LoopNode node;
    node.isLeaf_ = true;
    node.stepIndex_ = stepIndex;
    return node;
  }

  LoopNode LoopNode::repeat(int repeatCount, std::vector<LoopNode> body) {
    LoopNode node;
    node.isLeaf_ = false;
    node.repeatCount_ = repeatCount;
    node.body_ = std::move(body);
    return node;
  }

  bool LoopNode::operator==(const LoopNode& other) const {
    if (isLeaf_ != other.isLeaf_)
      return false;
    if (isLeaf_)
      return stepIndex_ == other.stepIndex_;
    return repeatCount_ == other.repeatCount_ && body_ == other.body_;
  }

  namespace {

    // Tree for seq[first, last). skipFrom is the start of the innermost loop
    // already emitted at this depth; everything at or above it is inside it.
    LoopTree buildRange(const ResolvedSequence& seq, std::size_t first, std::size_t last) {
      LoopTree nodes;
      std::optional<std::size_t> skipFrom;

      for (std::size_t i = last; i-- > first;) {
        if (skipFrom && i >= *skipFrom)
          continue;

        if (const auto* loop = std::get_if<Loop>(&seq[i])) {
          const std::size_t start = loop->position() - 1;
          assert(start >= first && "loop escapes its enclosing range; run checkNesting() first");
          nodes.push_back(LoopNode::repeat(loop->repeatCount(), buildRange(seq, start, i)));
          skipFrom = start;
        } else {
          nodes.push_back(LoopNode::leaf(i));
        }
      }

      std::reverse(nodes.begin(), nodes.end());
      return nodes;
    }

    void collectLeaves(const LoopTree& tree, std::vector<std::size_t>& out) {
      for (const auto& node : tree) {
        if (node.isLeaf())
          out.push_back(node.stepIndex());
        else
          collectLeaves(node.body(), out);
      }
    }

  } // namespace

  LoopTree buildLoopTree(const ResolvedSequence& seq) { return buildRange(seq, 0, seq.size()); }

  std::vector<std::size_t> flattenLeaves(const LoopTree& tree) {
    std::vector<std::size_t> leaves;
    collectLeaves(tree, leaves);
    return leaves;
  }

} // namespace cycleflow::core
