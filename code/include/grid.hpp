#pragma once
#include "types.hpp"
#include "geom.hpp"
#include <vector>

struct Grid {
  int rows=0, cols=0;           // fixed for the lifetime of an aggregation run
  std::vector<double> cells;    // row-major, size = rows*cols
  u64 sample_count=0;           // boxes absorbed
  u64 layout_count=0;           // distinct source layouts contributing

  static Grid zeros(int rows, int cols);

  double& at(int r, int c){ return cells[(size_t)r*cols + c]; }
  double  at(int r, int c) const { return cells[(size_t)r*cols + c]; }
  bool same_shape(const Grid& o) const { return rows==o.rows && cols==o.cols; }
  double max_value() const;
  double total() const;
};

struct RankedCell {
  int row=0, col=0;
  double value=0.0;
  Rect region;                  // unit-square rectangle of the cell
};

// rescale so the largest cell is 1.0; an all-zero grid stays all-zero
void normalize_max(Grid& g);

// cell-wise sum, throws ResolutionMismatchError on differing shapes
void merge_into(Grid& dst, const Grid& src);

// separable gaussian blur (reflect boundary, truncated at 4 sigma)
void gaussian_smooth(Grid& g, double sigma);

// k highest cells, ties broken by row-major index
std::vector<RankedCell> top_cells(const Grid& g, size_t k);

// round every cell to the given number of decimals
Grid quantize(const Grid& g, int decimals);

// free-space mask: 1.0 where nothing sits, `residual` under any placed box
Grid occupancy_grid(const std::vector<BoxRecord>& placed, int rows, int cols, double residual = 0.01);
