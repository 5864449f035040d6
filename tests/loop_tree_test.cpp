// cycleflow headers
#include "core/LoopTree.hpp"
#include "core/NestingChecker.hpp"
#include "core/TagResolver.hpp"
#include "protocols/CyclingProtocol.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <vector>

using namespace cycleflow::core;
using namespace cycleflow::protocols;

namespace {
  Rest ocv() { return Rest{ std::nullopt, 1.0 }; }

  ResolvedSequence checked(std::vector<Step> method) {
    ResolvedSequence seq = resolveTags(CyclingProtocol(std::move(method)));
    checkNesting(seq);
    return seq;
  }

  std::vector<std::size_t> nonLoopIndices(const ResolvedSequence& seq) {
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < seq.size(); ++i)
      if (!isLoop(seq[i]))
        out.push_back(i);
    return out;
  }

  using N = LoopNode;
} // namespace

TEST(LoopTreeTest, NoLoopsGivesFlatLeaves) {
  auto seq = checked({ ocv(), ocv(), ocv() });

  LoopTree expected{ N::leaf(0), N::leaf(1), N::leaf(2) };
  EXPECT_EQ(buildLoopTree(seq), expected);
}

TEST(LoopTreeTest, LoopWrapsItsBodyAndKeepsSurroundingSteps) {
  // 0 1 [2 3] x3, 5
  auto seq = checked({ ocv(), ocv(), Tag("cycle"), ocv(), ocv(), Loop("cycle", 3), ocv() });

  LoopTree expected{ N::leaf(0), N::leaf(1), N::repeat(3, { N::leaf(2), N::leaf(3) }), N::leaf(5) };
  EXPECT_EQ(buildLoopTree(seq), expected);
}

TEST(LoopTreeTest, LoopFromFirstStepCoversEverythingBeforeIt) {
  auto seq = checked({ Tag("all"), ocv(), ocv(), Loop("all", 2) });

  LoopTree expected{ N::repeat(2, { N::leaf(0), N::leaf(1) }) };
  EXPECT_EQ(buildLoopTree(seq), expected);
}

TEST(LoopTreeTest, NestedLoopsBecomeNestedRepeats) {
  auto seq = checked({ Tag("A"), Tag("B"), ocv(), Loop("B", 12), Loop("A", 34) });

  LoopTree expected{ N::repeat(34, { N::repeat(12, { N::leaf(0) }) }) };
  EXPECT_EQ(buildLoopTree(seq), expected);
}

TEST(LoopTreeTest, SiblingLoopsInsideAnOuterLoop) {
  // [0 [1 2]x2 4 [5]x5 7]x3 9
  auto seq = checked({ Tag("outer"), ocv(), Tag("a"), ocv(), ocv(), Loop("a", 2), ocv(), Tag("b"),
                       ocv(), Loop("b", 5), ocv(), Loop("outer", 3), ocv() });

  LoopTree expected{
    N::repeat(3, { N::leaf(0), N::repeat(2, { N::leaf(1), N::leaf(2) }), N::leaf(4),
                   N::repeat(5, { N::leaf(5) }), N::leaf(7) }),
    N::leaf(9),
  };
  EXPECT_EQ(buildLoopTree(seq), expected);
}

TEST(LoopTreeTest, RepeatNodeExposesCountAndBody) {
  auto seq = checked({ ocv(), ocv(), Loop(1, 7) });

  LoopTree tree = buildLoopTree(seq);

  ASSERT_EQ(tree.size(), 1u);
  EXPECT_FALSE(tree[0].isLeaf());
  EXPECT_EQ(tree[0].repeatCount(), 7);
  ASSERT_EQ(tree[0].body().size(), 2u);
  EXPECT_TRUE(tree[0].body()[1].isLeaf());
  EXPECT_EQ(tree[0].body()[1].stepIndex(), 1u);
}

TEST(LoopTreeTest, FlattenedLeavesMatchNonLoopStepOrder) {
  std::vector<std::vector<Step>> methods{
    { ocv(), Tag("t1"), ocv(), Tag("t2"), ocv(), Loop("t2", 3), ocv(), Loop("t1", 3), ocv(),
      Tag("t3"), ocv(), Loop("t3", 3), ocv(), Loop("t1", 3) },
    { ocv(), ocv(), ocv(), Loop(2, 3), ocv(), Loop(1, 3), ocv(), ocv(), Loop(7, 3), ocv(),
      Loop(1, 3) },
    { Tag("A"), Tag("B"), ocv(), Loop("B", 12), Loop("A", 34) },
  };

  for (auto& method : methods) {
    auto seq = checked(method);
    EXPECT_EQ(flattenLeaves(buildLoopTree(seq)), nonLoopIndices(seq));
  }
}
