#pragma once
#include "types.hpp"
#include "grid.hpp"
#include "mapper.hpp"
#include <set>
#include <vector>

// Running density grid for exactly one category. Append-only: absorbing
// never decreases a cell, so a corpus can be folded in as it streams.
class CategoryAccumulator {
public:
  CategoryAccumulator(u32 category, int rows, int cols, double epsilon = 1e-9);

  // throws InvalidBoxError before touching the grid, so a failed absorb leaves no trace
  void absorb(const BoxRecord& box);

  // cell-wise sum of another shard's accumulator for the same category
  void merge(const CategoryAccumulator& other);

  Grid finalize() const;   // copy of the raw (unnormalized) grid

  u32 category() const { return cid; }
  u64 sample_count() const { return grid.sample_count; }
  const std::set<u32>& layouts() const { return layout_ids; }

private:
  u32 cid;
  double epsilon;
  Grid grid;
  std::set<u32> layout_ids;
  std::vector<CellWeight> scratch;
};
