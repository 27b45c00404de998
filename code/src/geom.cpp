#include "geom.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

Rect rect_intersect(const Rect& a, const Rect& b){
  Rect r;
  r.minx = std::max(a.minx, b.minx);
  r.miny = std::max(a.miny, b.miny);
  r.maxx = std::min(a.maxx, b.maxx);
  r.maxy = std::min(a.maxy, b.maxy);
  if(r.maxx < r.minx) r.maxx = r.minx;
  if(r.maxy < r.miny) r.maxy = r.miny;
  return r;
}

double overlap_area(const Rect& a, const Rect& b){
  if(!rect_overlap(a, b)) return 0.0;
  return rect_area(rect_intersect(a, b));
}

static std::string describe(const BoxRecord& b){
  std::ostringstream ss;
  ss << "box(layout=" << b.layout_id << ", cat=" << b.category << ", "
     << "(" << b.x_min << "," << b.y_min << ")-(" << b.x_max << "," << b.y_max << ")"
     << " on " << b.canvas_width << "x" << b.canvas_height << ")";
  return ss.str();
}

Rect normalize_box(const BoxRecord& b){
  const double v[6] = {b.x_min, b.y_min, b.x_max, b.y_max, b.canvas_width, b.canvas_height};
  for(double x : v){
    if(!std::isfinite(x)) throw InvalidBoxError("non-finite coordinate in " + describe(b));
  }
  if(b.canvas_width <= 0 || b.canvas_height <= 0)
    throw InvalidBoxError("non-positive canvas in " + describe(b));
  if(!(b.x_min < b.x_max) || !(b.y_min < b.y_max))
    throw InvalidBoxError("inverted or empty corners in " + describe(b));

  Rect r;
  r.minx = b.x_min / b.canvas_width;
  r.maxx = b.x_max / b.canvas_width;
  r.miny = b.y_min / b.canvas_height;
  r.maxy = b.y_max / b.canvas_height;
  if(!std::isfinite(rect_area(r))) throw InvalidBoxError("coordinates overflow the canvas scale in " + describe(b));

  // 完全在画布外：与单位正方形没有正面积交集
  static const Rect unit{0.0, 0.0, 1.0, 1.0};
  if(!rect_overlap(r, unit)) throw InvalidBoxError("outside canvas: " + describe(b));
  return r;
}

Rect cell_rect(int r, int c, int rows, int cols){
  Rect out;
  out.minx = (double)c / cols;
  out.maxx = (double)(c+1) / cols;
  out.miny = (double)r / rows;
  out.maxy = (double)(r+1) / rows;
  return out;
}
