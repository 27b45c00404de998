#include "accumulator.hpp"
#include "errors.hpp"

CategoryAccumulator::CategoryAccumulator(u32 category, int rows, int cols, double eps)
  : cid(category), epsilon(eps), grid(Grid::zeros(rows, cols)) {}

void CategoryAccumulator::absorb(const BoxRecord& box){
  if(box.category != cid)
    throw HeatgridError("accumulator for category " + std::to_string(cid) +
                        " got box of category " + std::to_string(box.category));
  map_box(box, grid.rows, grid.cols, epsilon, scratch);
  for(const auto& w : scratch) grid.at(w.row, w.col) += w.weight;
  grid.sample_count++;
  layout_ids.insert(box.layout_id);
  grid.layout_count = layout_ids.size();
}

void CategoryAccumulator::merge(const CategoryAccumulator& other){
  if(other.cid != cid)
    throw HeatgridError("cannot merge accumulators of different categories");
  merge_into(grid, other.grid);
  layout_ids.insert(other.layout_ids.begin(), other.layout_ids.end());
  grid.layout_count = layout_ids.size();
}

Grid CategoryAccumulator::finalize() const{
  return grid;
}
