#pragma once
#include "types.hpp"
#include <vector>

struct CellWeight {
  int row = 0, col = 0;
  double weight = 0.0;   // share of the box's normalized area inside this cell
};

// Areal-weighted coverage of one box on a rows x cols grid, ordered row-major.
// Boxes whose normalized area is below epsilon vote 1.0 for the cell holding
// their center. Throws InvalidBoxError for malformed or out-of-canvas boxes.
std::vector<CellWeight> map_box(const BoxRecord& box, int rows, int cols, double epsilon = 1e-9);

// same, appending into a caller-owned buffer (cleared first)
void map_box(const BoxRecord& box, int rows, int cols, double epsilon, std::vector<CellWeight>& out);
