#include <gtest/gtest.h>
#include "scorer.hpp"
#include "errors.hpp"
#include "test_util.hpp"

#include <memory>
#include <thread>

class ScorerTest : public ::testing::Test {
protected:
  void SetUp() override {
    cfg = small_config(2, 2);
    // title: three on (0,0), one on (0,1) -> [1, 1/3, 0, 0]
    // date: two on (1,1)                 -> [0, 0, 0, 1]
    corpus = {
      box_on(0, 0, 0, 0, 50, 50),
      box_on(0, 1, 0, 0, 50, 50),
      box_on(0, 2, 0, 0, 50, 50),
      box_on(0, 2, 50, 0, 100, 50),
      box_on(1, 0, 50, 50, 100, 100),
      box_on(1, 1, 50, 50, 100, 100),
    };
    set = std::make_shared<const FinalizedHeatmapSet>(build_set(cfg, corpus));
  }

  Config cfg;
  std::vector<BoxRecord> corpus;
  std::shared_ptr<const FinalizedHeatmapSet> set;
};

TEST_F(ScorerTest, TitleOnHotCellScoresOneOnColdCellZero){
  Config c = small_config(2, 2);
  std::vector<BoxRecord> three;
  for(u32 i=0; i<3; ++i) three.push_back(box_on(0, i, 0, 0, 50, 50));
  auto s3 = std::make_shared<const FinalizedHeatmapSet>(build_set(c, three));
  LayoutScorer scorer(s3, ScoreOptions::from_config(c));

  LayoutScore hot = scorer.score({box_on(0, 0, 0, 0, 50, 50)});
  ASSERT_EQ(hot.elements.size(), 1u);
  EXPECT_DOUBLE_EQ(hot.elements[0].score, 1.0);
  EXPECT_DOUBLE_EQ(hot.total, 1.0);

  LayoutScore cold = scorer.score({box_on(0, 0, 50, 50, 100, 100)});
  EXPECT_DOUBLE_EQ(cold.elements[0].score, 0.0);
  EXPECT_DOUBLE_EQ(cold.total, 0.0);
}

TEST_F(ScorerTest, ElementScoreIsArealWeightedMean){
  LayoutScorer scorer(set, ScoreOptions::from_config(cfg));
  // half on (0,0)=1, half on (0,1)=1/3
  LayoutScore s = scorer.score({box_on(0, 0, 25, 0, 75, 50)});
  EXPECT_NEAR(s.elements[0].score, 2.0/3.0, 1e-12);
}

TEST_F(ScorerTest, MeanAndMinCombination){
  std::vector<BoxRecord> layout = {box_on(0, 0, 0, 0, 50, 50), box_on(0, 0, 50, 0, 100, 50)};
  LayoutScorer mean(set, ScoreOptions::from_config(cfg));
  EXPECT_NEAR(mean.score(layout).total, 2.0/3.0, 1e-12);

  cfg.score_combination = ScoreCombination::Min;
  LayoutScorer min(set, ScoreOptions::from_config(cfg));
  EXPECT_NEAR(min.score(layout).total, 1.0/3.0, 1e-12);
}

TEST_F(ScorerTest, WeightedCombination){
  cfg.score_combination = ScoreCombination::Weighted;
  cfg.category_weights[cfg.categories.resolve("title")] = 3.0;
  LayoutScorer scorer(set, ScoreOptions::from_config(cfg));
  // title on its hot cell (1.0), date on a cold cell (0.0), weights 3:1
  LayoutScore s = scorer.score({box_on(0, 0, 0, 0, 50, 50), box_on(1, 0, 0, 50, 50, 100)});
  EXPECT_NEAR(s.total, 0.75, 1e-12);
}

TEST_F(ScorerTest, UnseenCategoryIsNeutralWithWarning){
  Config c = small_config(2, 2, {"title", "date", "logo"});
  std::vector<BoxRecord> boxes = {box_on(0, 0, 0, 0, 50, 50)};
  auto s = std::make_shared<const FinalizedHeatmapSet>(build_set(c, boxes));
  LayoutScorer scorer(s, ScoreOptions::from_config(c));

  LayoutScore ls = scorer.score({box_on(0, 0, 0, 0, 50, 50), box_on(2, 0, 0, 0, 50, 50), box_on(kUnknownCategory, 0, 0, 0, 50, 50)});
  ASSERT_EQ(ls.elements.size(), 3u);
  EXPECT_TRUE(ls.elements[0].known);
  EXPECT_FALSE(ls.elements[1].known);
  EXPECT_FALSE(ls.elements[2].known);
  EXPECT_EQ(ls.elements[1].score, 0.0);
  EXPECT_EQ(ls.elements[2].score, 0.0);
  ASSERT_EQ(ls.warnings.size(), 2u);
  EXPECT_EQ(ls.warnings[0].index, 1u);
  EXPECT_EQ(ls.warnings[1].index, 2u);
  EXPECT_NEAR(ls.total, 1.0/3.0, 1e-12);
}

TEST_F(ScorerTest, EmptyLayoutIsNeutral){
  LayoutScorer scorer(set, ScoreOptions::from_config(cfg));
  LayoutScore s = scorer.score({});
  EXPECT_TRUE(s.elements.empty());
  EXPECT_EQ(s.total, 0.0);
}

TEST_F(ScorerTest, ResolutionMismatchOnConstruction){
  ScoreOptions opts = ScoreOptions::from_config(cfg);
  opts.rows = 21; opts.cols = 12;
  EXPECT_THROW(LayoutScorer(set, opts), ResolutionMismatchError);
}

TEST_F(ScorerTest, DefaultOptionsTakeArtifactResolution){
  LayoutScorer scorer(set, ScoreOptions());
  EXPECT_DOUBLE_EQ(scorer.score({box_on(1, 0, 50, 50, 100, 100)}).total, 1.0);
}

TEST_F(ScorerTest, OneGivenDimensionTakesTheOtherFromArtifact){
  ScoreOptions rows_only;
  rows_only.rows = 2;
  EXPECT_NO_THROW(LayoutScorer(set, rows_only));
  ScoreOptions cols_only;
  cols_only.cols = 2;
  EXPECT_NO_THROW(LayoutScorer(set, cols_only));
  ScoreOptions wrong_rows;
  wrong_rows.rows = 3;
  EXPECT_THROW(LayoutScorer(set, wrong_rows), ResolutionMismatchError);
}

TEST_F(ScorerTest, InvalidQueryBoxThrows){
  LayoutScorer scorer(set, ScoreOptions::from_config(cfg));
  EXPECT_THROW(scorer.score({box_on(0, 0, 120, 120, 150, 150)}), InvalidBoxError);
  EXPECT_THROW(scorer.score({box_on(kUnknownCategory, 0, 60, 10, 20, 30)}), InvalidBoxError);
}

TEST_F(ScorerTest, CorpusLayoutOutscoresEmptyRegion){
  LayoutScorer scorer(set, ScoreOptions::from_config(cfg));
  LayoutScore seen = scorer.score(corpus);
  // title and date both moved to (1,0), which neither ever used
  LayoutScore moved = scorer.score({box_on(0, 0, 0, 50, 50, 100), box_on(1, 0, 0, 50, 50, 100)});
  for(const auto& e : seen.elements){
    for(const auto& m : moved.elements){
      if(m.category == e.category) EXPECT_GE(e.score, m.score);
    }
  }
  EXPECT_GT(seen.total, moved.total);
}

TEST_F(ScorerTest, TopCategoryRegions){
  LayoutScorer scorer(set, ScoreOptions());
  auto top = scorer.top_category_regions(set->categories.resolve("title"), 2);
  ASSERT_EQ(top.size(), 2u);
  EXPECT_EQ(top[0].row, 0); EXPECT_EQ(top[0].col, 0);
  EXPECT_DOUBLE_EQ(top[0].value, 1.0);
  EXPECT_EQ(top[1].row, 0); EXPECT_EQ(top[1].col, 1);
  EXPECT_NEAR(top[1].value, 1.0/3.0, 1e-12);
  EXPECT_TRUE(scorer.top_category_regions(kUnknownCategory, 3).empty());
}

TEST_F(ScorerTest, SuggestRegionsAvoidsPlacedBoxes){
  LayoutScorer scorer(set, ScoreOptions());
  u32 title = set->categories.resolve("title");
  auto top = scorer.suggest_regions(title, 1, {box_on(1, 0, 0, 0, 50, 50)});
  ASSERT_EQ(top.size(), 1u);
  EXPECT_EQ(top[0].row, 0);
  EXPECT_EQ(top[0].col, 1);
}

TEST_F(ScorerTest, ConcurrentQueriesAgree){
  LayoutScorer scorer(set, ScoreOptions::from_config(cfg));
  const double expected = scorer.score(corpus).total;
  std::vector<double> totals(8, -1.0);
  std::vector<std::thread> pool;
  for(size_t t=0; t<totals.size(); ++t){
    pool.emplace_back([&, t]{
      for(int i=0; i<200; ++i) totals[t] = scorer.score(corpus).total;
    });
  }
  for(auto& th : pool) th.join();
  for(double v : totals) EXPECT_EQ(v, expected);
}
