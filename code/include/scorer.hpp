#pragma once
#include "types.hpp"
#include "grid.hpp"
#include "aggregator.hpp"
#include <memory>
#include <string>
#include <vector>

struct ElementScore {
  size_t index = 0;            // position in the query layout
  u32 category = kUnknownCategory;
  double score = 0.0;          // areal-weighted mean of the category grid
  bool known = false;          // false => neutral score, see warnings
};

// non-fatal: element whose category has no learned distribution
struct UnknownCategoryWarning {
  size_t index = 0;
  u32 category = kUnknownCategory;
  std::string message;
};

struct LayoutScore {
  std::vector<ElementScore> elements;
  double total = 0.0;          // for ranking layouts, not a probability
  std::vector<UnknownCategoryWarning> warnings;
};

struct ScoreOptions {
  int rows = 0, cols = 0;      // expected resolution; 0 = take the heatmaps'
  ScoreCombination combination = ScoreCombination::Mean;
  std::unordered_map<std::string,double> category_weights;   // by category name, missing => 1.0
  double epsilon = 1e-9;
  double neutral_score = 0.0;

  static ScoreOptions from_config(const Config& cfg);
};

// Read-only view over a finalized heatmap set. Holds no mutable state, so a
// single instance can serve concurrent queries.
class LayoutScorer {
public:
  // throws ResolutionMismatchError if opts names a different resolution
  LayoutScorer(std::shared_ptr<const FinalizedHeatmapSet> heatmaps, const ScoreOptions& opts);

  // throws InvalidBoxError for a malformed element
  LayoutScore score(const std::vector<BoxRecord>& layout) const;

  // k highest-density cells of a category; empty for unknown categories
  std::vector<RankedCell> top_category_regions(u32 category, size_t k) const;

  // as above, masked by the free space left around already-placed boxes
  std::vector<RankedCell> suggest_regions(u32 category, size_t k, const std::vector<BoxRecord>& occupied) const;

  const FinalizedHeatmapSet& heatmaps() const { return *set; }

private:
  double element_score(const BoxRecord& box, const Grid& g) const;
  double combine(const std::vector<ElementScore>& elems) const;

  std::shared_ptr<const FinalizedHeatmapSet> set;
  ScoreOptions opts;
};

// one-shot convenience over a scorer built from cfg
LayoutScore score_layout(const std::vector<BoxRecord>& layout, std::shared_ptr<const FinalizedHeatmapSet> heatmaps, const Config& cfg);
