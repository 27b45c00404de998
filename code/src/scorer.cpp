#include "scorer.hpp"
#include "mapper.hpp"
#include "errors.hpp"
#include <algorithm>

ScoreOptions ScoreOptions::from_config(const Config& cfg){
  ScoreOptions o;
  o.rows = cfg.rows; o.cols = cfg.cols;
  o.combination = cfg.score_combination;
  o.epsilon = cfg.epsilon;
  for(const auto& kv : cfg.category_weights)
    o.category_weights[cfg.categories.name(kv.first)] = kv.second;
  return o;
}

LayoutScorer::LayoutScorer(std::shared_ptr<const FinalizedHeatmapSet> heatmaps, const ScoreOptions& o)
  : set(std::move(heatmaps)), opts(o) {
  if(!set) throw HeatgridError("scorer needs a heatmap set");
  if(opts.rows == 0) opts.rows = set->rows;
  if(opts.cols == 0) opts.cols = set->cols;
  if(opts.rows != set->rows || opts.cols != set->cols)
    throw ResolutionMismatchError(opts.rows, opts.cols, set->rows, set->cols);
}

double LayoutScorer::element_score(const BoxRecord& box, const Grid& g) const{
  std::vector<CellWeight> cw;
  map_box(box, g.rows, g.cols, opts.epsilon, cw);
  double num = 0.0, den = 0.0;
  for(const auto& w : cw){
    num += w.weight * g.at(w.row, w.col);
    den += w.weight;
  }
  return den > 0.0 ? num / den : opts.neutral_score;
}

double LayoutScorer::combine(const std::vector<ElementScore>& elems) const{
  if(elems.empty()) return opts.neutral_score;
  switch(opts.combination){
    case ScoreCombination::Min: {
      double m = elems[0].score;
      for(const auto& e : elems) m = std::min(m, e.score);
      return m;
    }
    case ScoreCombination::Weighted: {
      double num = 0.0, den = 0.0;
      for(const auto& e : elems){
        auto it = opts.category_weights.find(set->categories.name(e.category));
        double w = it == opts.category_weights.end() ? 1.0 : it->second;
        num += w * e.score;
        den += w;
      }
      return den > 0.0 ? num / den : opts.neutral_score;
    }
    case ScoreCombination::Mean:
      break;
  }
  double s = 0.0;
  for(const auto& e : elems) s += e.score;
  return s / elems.size();
}

LayoutScore LayoutScorer::score(const std::vector<BoxRecord>& layout) const{
  LayoutScore out;
  out.elements.reserve(layout.size());
  for(size_t i=0; i<layout.size(); ++i){
    const BoxRecord& b = layout[i];
    ElementScore es;
    es.index = i;
    es.category = b.category;

    const Grid* g = set->grid_for(b.category);
    if(!g || g->sample_count == 0){
      // still reject malformed geometry, an unseen category only weakens the signal
      map_box(b, set->rows, set->cols, opts.epsilon);
      es.score = opts.neutral_score;
      UnknownCategoryWarning w;
      w.index = i;
      w.category = b.category;
      w.message = g ? "category '" + set->categories.name(b.category) + "' has no samples"
                    : "category id " + std::to_string(b.category) + " is unknown";
      out.warnings.push_back(std::move(w));
    }else{
      es.score = element_score(b, *g);
      es.known = true;
    }
    out.elements.push_back(es);
  }
  out.total = combine(out.elements);
  return out;
}

std::vector<RankedCell> LayoutScorer::top_category_regions(u32 category, size_t k) const{
  const Grid* g = set->grid_for(category);
  if(!g) return {};
  return top_cells(*g, k);
}

std::vector<RankedCell> LayoutScorer::suggest_regions(u32 category, size_t k, const std::vector<BoxRecord>& occupied) const{
  const Grid* g = set->grid_for(category);
  if(!g) return {};
  Grid masked = *g;
  Grid occ = occupancy_grid(occupied, set->rows, set->cols);
  for(size_t i=0; i<masked.cells.size(); ++i) masked.cells[i] *= occ.cells[i];
  return top_cells(masked, k);
}

LayoutScore score_layout(const std::vector<BoxRecord>& layout, std::shared_ptr<const FinalizedHeatmapSet> heatmaps, const Config& cfg){
  LayoutScorer scorer(std::move(heatmaps), ScoreOptions::from_config(cfg));
  return scorer.score(layout);
}
