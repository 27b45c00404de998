#include "grid.hpp"
#include "mapper.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

Grid Grid::zeros(int rows, int cols){
  if(rows <= 0 || cols <= 0)
    throw ConfigError("grid resolution must be positive, got " + std::to_string(rows) + "x" + std::to_string(cols));
  Grid g;
  g.rows = rows; g.cols = cols;
  g.cells.assign((size_t)rows*cols, 0.0);
  return g;
}

double Grid::max_value() const{
  double m = 0.0;
  for(double v : cells) m = std::max(m, v);
  return m;
}

double Grid::total() const{
  double s = 0.0;
  for(double v : cells) s += v;
  return s;
}

void normalize_max(Grid& g){
  double m = g.max_value();
  if(m <= 0.0) return;
  if(m == 1.0) return;
  for(double& v : g.cells) v /= m;
}

void merge_into(Grid& dst, const Grid& src){
  if(!dst.same_shape(src)) throw ResolutionMismatchError(dst.rows, dst.cols, src.rows, src.cols);
  for(size_t i=0; i<dst.cells.size(); ++i) dst.cells[i] += src.cells[i];
  dst.sample_count += src.sample_count;
  dst.layout_count += src.layout_count;
}

// half-sample symmetric reflection: d c b a | a b c d | d c b a
static int reflect_index(int i, int n){
  if(n == 1) return 0;
  int period = 2*n;
  i %= period;
  if(i < 0) i += period;
  return i < n ? i : period - 1 - i;
}

static std::vector<double> gaussian_kernel(double sigma){
  int radius = (int)(4.0 * sigma + 0.5);
  std::vector<double> k(2*radius + 1);
  double sum = 0.0;
  for(int i=-radius; i<=radius; ++i){
    double w = std::exp(-0.5 * (double)i*i / (sigma*sigma));
    k[i+radius] = w;
    sum += w;
  }
  for(double& w : k) w /= sum;
  return k;
}

void gaussian_smooth(Grid& g, double sigma){
  if(sigma <= 0.0 || g.cells.empty()) return;
  const std::vector<double> k = gaussian_kernel(sigma);
  const int radius = (int)k.size() / 2;
  std::vector<double> tmp(g.cells.size(), 0.0);

  // 先沿行方向（x），再沿列方向（y）
  for(int r=0; r<g.rows; ++r)
    for(int c=0; c<g.cols; ++c){
      double s = 0.0;
      for(int d=-radius; d<=radius; ++d) s += k[d+radius] * g.at(r, reflect_index(c+d, g.cols));
      tmp[(size_t)r*g.cols + c] = s;
    }
  for(int r=0; r<g.rows; ++r)
    for(int c=0; c<g.cols; ++c){
      double s = 0.0;
      for(int d=-radius; d<=radius; ++d) s += k[d+radius] * tmp[(size_t)reflect_index(r+d, g.rows)*g.cols + c];
      g.at(r, c) = s;
    }
}

std::vector<RankedCell> top_cells(const Grid& g, size_t k){
  std::vector<size_t> idx(g.cells.size());
  for(size_t i=0; i<idx.size(); ++i) idx[i] = i;
  k = std::min(k, idx.size());
  std::partial_sort(idx.begin(), idx.begin()+k, idx.end(), [&](size_t a, size_t b){
    if(g.cells[a] != g.cells[b]) return g.cells[a] > g.cells[b];
    return a < b;
  });
  std::vector<RankedCell> out;
  out.reserve(k);
  for(size_t i=0; i<k; ++i){
    RankedCell rc;
    rc.row = (int)(idx[i] / g.cols);
    rc.col = (int)(idx[i] % g.cols);
    rc.value = g.cells[idx[i]];
    rc.region = cell_rect(rc.row, rc.col, g.rows, g.cols);
    out.push_back(rc);
  }
  return out;
}

Grid quantize(const Grid& g, int decimals){
  Grid q = g;
  double scale = std::pow(10.0, decimals);
  for(double& v : q.cells) v = std::round(v * scale) / scale;
  return q;
}

Grid occupancy_grid(const std::vector<BoxRecord>& placed, int rows, int cols, double residual){
  Grid occ = Grid::zeros(rows, cols);
  std::fill(occ.cells.begin(), occ.cells.end(), 1.0);
  std::vector<CellWeight> cw;
  for(const auto& b : placed){
    map_box(b, rows, cols, 0.0, cw);
    for(const auto& w : cw) occ.at(w.row, w.col) = residual;
  }
  return occ;
}
