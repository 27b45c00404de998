#pragma once
#include "types.hpp"

// axis-aligned rectangle in unit-square coordinates
struct Rect { double minx=0, miny=0, maxx=0, maxy=0; };

inline double rect_area(const Rect& r){
  double w = r.maxx - r.minx, h = r.maxy - r.miny;
  return (w > 0 && h > 0) ? w*h : 0.0;
}
inline bool rect_overlap(const Rect& a, const Rect& b){
  return !(a.maxx <= b.minx || b.maxx <= a.minx || a.maxy <= b.miny || b.maxy <= a.miny);
}
Rect rect_intersect(const Rect& a, const Rect& b);   // empty => zero-area rect
double overlap_area(const Rect& a, const Rect& b);

// throws InvalidBoxError on non-finite values, inverted corners or bad canvas
Rect normalize_box(const BoxRecord& b);

// unit-square rectangle covered by grid cell (r,c); row 0 is the top
Rect cell_rect(int r, int c, int rows, int cols);
