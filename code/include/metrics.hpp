#pragma once
#include "types.hpp"
#include "grid.hpp"
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <limits>
#include <vector>

// canvas size statistics over distinct source layouts
struct CanvasStats {
  u64 count = 0;
  double w_min = 0, w_max = 0, w_sum = 0;
  double h_min = 0, h_max = 0, h_sum = 0;

  void add(double w, double h){
    if(count == 0){ w_min = w_max = w; h_min = h_max = h; }
    else{
      w_min = std::min(w_min, w); w_max = std::max(w_max, w);
      h_min = std::min(h_min, h); h_max = std::max(h_max, h);
    }
    w_sum += w; h_sum += h;
    count++;
  }
  void merge(const CanvasStats& o){
    if(o.count == 0) return;
    if(count == 0){ *this = o; return; }
    w_min = std::min(w_min, o.w_min); w_max = std::max(w_max, o.w_max);
    h_min = std::min(h_min, o.h_min); h_max = std::max(h_max, o.h_max);
    w_sum += o.w_sum; h_sum += o.h_sum;
    count += o.count;
  }
  double w_mean() const { return count ? w_sum / count : 0.0; }
  double h_mean() const { return count ? h_sum / count : 0.0; }
};

// 聚合仪表盘：一次运行的关键计数
struct RunStats {
  u64 records_read = 0;
  u64 records_absorbed = 0;
  u64 records_skipped = 0;
  CanvasStats canvas;

  void merge(const RunStats& o){
    records_read += o.records_read;
    records_absorbed += o.records_absorbed;
    records_skipped += o.records_skipped;
    canvas.merge(o.canvas);
  }

  // per-category counts come from the finalized grids, indexed by category id
  void print_summary(const CategorySet& cats, const std::vector<Grid>& grids, u64 layout_count,
                     std::ostream& os = std::cerr) const {
    os << "\n========================================\n";
    os << "  Aggregation summary\n";
    os << "========================================\n";
    os << "  records read: " << records_read
       << ", absorbed: " << records_absorbed
       << ", skipped: " << records_skipped << "\n";
    os << "  layouts: " << layout_count << "\n";
    if(canvas.count > 0){
      os << "  canvas width  min/mean/max: " << canvas.w_min << " / " << canvas.w_mean() << " / " << canvas.w_max << "\n";
      os << "  canvas height min/mean/max: " << canvas.h_min << " / " << canvas.h_mean() << " / " << canvas.h_max << "\n";
    }
    os << "\n  category              samples  layouts\n";
    os << "  ---------------------------------------\n";
    for(u32 cid = 0; cid < cats.size(); ++cid){
      u64 s = cid < grids.size() ? grids[cid].sample_count : 0;
      u64 l = cid < grids.size() ? grids[cid].layout_count : 0;
      os << "  " << std::left << std::setw(20) << cats.name(cid)
         << std::right << std::setw(9) << s << std::setw(9) << l << "\n";
    }
  }
};
