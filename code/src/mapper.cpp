#include "mapper.hpp"
#include "geom.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <string>

std::vector<CellWeight> map_box(const BoxRecord& box, int rows, int cols, double epsilon){
  std::vector<CellWeight> out;
  map_box(box, rows, cols, epsilon, out);
  return out;
}

void map_box(const BoxRecord& box, int rows, int cols, double epsilon, std::vector<CellWeight>& out){
  out.clear();
  if(rows <= 0 || cols <= 0)
    throw ConfigError("grid resolution must be positive, got " + std::to_string(rows) + "x" + std::to_string(cols));

  const Rect nb = normalize_box(box);
  const double area = rect_area(nb);
  auto clamp = [](int v, int lo, int hi){ return (v<lo?lo:(v>hi?hi:v)); };

  if(area < epsilon){
    // degenerate: single vote for the cell under the center
    double cx = std::min(std::max(0.5*(nb.minx + nb.maxx), 0.0), 1.0);
    double cy = std::min(std::max(0.5*(nb.miny + nb.maxy), 0.0), 1.0);
    int c = clamp((int)std::floor(cx * cols), 0, cols-1);
    int r = clamp((int)std::floor(cy * rows), 0, rows-1);
    out.push_back({r, c, 1.0});
    return;
  }

  // index range from the part inside the unit square; weights keep the full area
  static const Rect unit{0.0, 0.0, 1.0, 1.0};
  const Rect in = rect_intersect(nb, unit);
  int c0 = clamp((int)std::floor(in.minx * cols), 0, cols-1);
  int c1 = clamp((int)std::ceil(in.maxx * cols) - 1, 0, cols-1);
  int r0 = clamp((int)std::floor(in.miny * rows), 0, rows-1);
  int r1 = clamp((int)std::ceil(in.maxy * rows) - 1, 0, rows-1);

  out.reserve((size_t)(r1-r0+1) * (size_t)(c1-c0+1));
  for(int r=r0; r<=r1; ++r){
    for(int c=c0; c<=c1; ++c){
      double a = overlap_area(nb, cell_rect(r, c, rows, cols));
      if(a <= 0.0) continue;
      out.push_back({r, c, a / area});
    }
  }
}
