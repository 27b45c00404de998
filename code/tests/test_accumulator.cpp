#include <gtest/gtest.h>
#include "accumulator.hpp"
#include "errors.hpp"
#include "test_util.hpp"

#include <algorithm>

class AccumulatorTest : public ::testing::Test {
protected:
  std::vector<BoxRecord> corpus = {
    box_on(0, 0, 0, 0, 50, 50),
    box_on(0, 0, 25, 25, 75, 75),
    box_on(0, 1, 10, 60, 90, 95),
    box_on(0, 2, 5, 5, 15, 80, 200, 100),
  };
};

TEST_F(AccumulatorTest, AbsorbAddsCoverage){
  CategoryAccumulator acc(0, 2, 2);
  for(int i=0; i<3; ++i) acc.absorb(box_on(0, (u32)i, 0, 0, 50, 50));
  Grid g = acc.finalize();
  EXPECT_DOUBLE_EQ(g.at(0, 0), 3.0);
  EXPECT_DOUBLE_EQ(g.at(1, 1), 0.0);
  EXPECT_EQ(g.sample_count, 3u);
  EXPECT_EQ(g.layout_count, 3u);
}

TEST_F(AccumulatorTest, LayoutCountIsDistinct){
  CategoryAccumulator acc(0, 2, 2);
  for(const auto& b : corpus) acc.absorb(b);
  EXPECT_EQ(acc.sample_count(), 4u);
  EXPECT_EQ(acc.finalize().layout_count, 3u);
}

TEST_F(AccumulatorTest, RejectsForeignCategory){
  CategoryAccumulator acc(0, 2, 2);
  EXPECT_THROW(acc.absorb(box_on(1, 0, 0, 0, 50, 50)), HeatgridError);
}

TEST_F(AccumulatorTest, FailedAbsorbLeavesNoTrace){
  CategoryAccumulator acc(0, 2, 2);
  acc.absorb(corpus[0]);
  Grid before = acc.finalize();
  EXPECT_THROW(acc.absorb(box_on(0, 9, 150, 150, 200, 200)), InvalidBoxError);
  Grid after = acc.finalize();
  EXPECT_EQ(after.cells, before.cells);
  EXPECT_EQ(after.sample_count, 1u);
  EXPECT_EQ(after.layout_count, 1u);
}

TEST_F(AccumulatorTest, NeverDecreasesACell){
  CategoryAccumulator acc(0, 5, 4);
  Grid prev = acc.finalize();
  for(const auto& b : corpus){
    acc.absorb(b);
    Grid cur = acc.finalize();
    for(size_t i=0; i<cur.cells.size(); ++i) EXPECT_GE(cur.cells[i], prev.cells[i]);
    prev = cur;
  }
}

TEST_F(AccumulatorTest, OrderIndependent){
  CategoryAccumulator base(0, 5, 4);
  for(const auto& b : corpus) base.absorb(b);
  Grid expected = base.finalize();

  std::vector<size_t> order = {0, 1, 2, 3};
  while(std::next_permutation(order.begin(), order.end())){
    CategoryAccumulator acc(0, 5, 4);
    for(size_t i : order) acc.absorb(corpus[i]);
    Grid g = acc.finalize();
    for(size_t i=0; i<g.cells.size(); ++i) EXPECT_NEAR(g.cells[i], expected.cells[i], 1e-12);
    EXPECT_EQ(g.sample_count, expected.sample_count);
    EXPECT_EQ(g.layout_count, expected.layout_count);
  }
}

TEST_F(AccumulatorTest, MergeMatchesSingleAccumulator){
  CategoryAccumulator all(0, 5, 4), left(0, 5, 4), right(0, 5, 4);
  for(size_t i=0; i<corpus.size(); ++i){
    all.absorb(corpus[i]);
    (i < 2 ? left : right).absorb(corpus[i]);
  }
  left.merge(right);
  Grid a = all.finalize(), m = left.finalize();
  for(size_t i=0; i<a.cells.size(); ++i) EXPECT_NEAR(m.cells[i], a.cells[i], 1e-12);
  EXPECT_EQ(m.sample_count, a.sample_count);
  EXPECT_EQ(m.layout_count, a.layout_count);
}

TEST_F(AccumulatorTest, MergeRejectsOtherResolution){
  CategoryAccumulator a(0, 2, 2), b(0, 3, 2);
  EXPECT_THROW(a.merge(b), ResolutionMismatchError);
  CategoryAccumulator c(1, 2, 2);
  EXPECT_THROW(a.merge(c), HeatgridError);
}
