#include "io.hpp"
#include "errors.hpp"
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

std::string format_utc(std::time_t t){
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

void write_heatmaps(const FinalizedHeatmapSet& set, std::ostream& os){
  const auto& m = set.meta;
  auto old_precision = os.precision(17);
  os << "HEATGRID 1\n";
  os << "RESOLUTION " << set.rows << " " << set.cols << "\n";
  os << "SAMPLES " << m.sample_count << "\n";
  os << "LAYOUTS " << m.layout_count << "\n";
  os << "SKIPPED " << m.skipped_count << "\n";
  os << "BUILT " << (long long)m.built_at << " " << format_utc(m.built_at) << "\n";
  os << "CANVAS " << m.canvas.w_min << " " << m.canvas.w_mean() << " " << m.canvas.w_max << " "
     << m.canvas.h_min << " " << m.canvas.h_mean() << " " << m.canvas.h_max << " " << m.canvas.count << "\n";
  os << "CATEGORIES " << set.categories.size() << "\n";
  for(u32 cid = 0; cid < set.categories.size(); ++cid){
    const Grid& g = set.grids[cid];
    os << "CATEGORY " << set.categories.name(cid) << " " << g.sample_count << " " << g.layout_count << "\n";
    for(int r=0; r<g.rows; ++r){
      for(int c=0; c<g.cols; ++c){
        if(c) os << " ";
        os << g.at(r, c);
      }
      os << "\n";
    }
  }
  os.precision(old_precision);
}

void write_heatmaps(const FinalizedHeatmapSet& set, const std::string& out_path){
  const std::string tmp = out_path + ".tmp";
  {
    std::ofstream fout(tmp);
    if(!fout) throw std::runtime_error("Cannot open output file: "+tmp);
    write_heatmaps(set, fout);
    fout.flush();
    if(!fout){
      std::remove(tmp.c_str());
      throw std::runtime_error("Write failed: "+tmp);
    }
  }
  if(std::rename(tmp.c_str(), out_path.c_str()) != 0){
    std::remove(tmp.c_str());
    throw std::runtime_error("Cannot move " + tmp + " to " + out_path);
  }
}

namespace {
struct LineReader {
  std::istream& in;
  std::string origin;
  int line_num = 0;

  std::istringstream expect(const std::string& tag){
    std::string line;
    while(std::getline(in, line)){
      line_num++;
      if(line.find_first_not_of(" \t\r") == std::string::npos) continue;
      std::istringstream ss(line);
      if(tag.empty()) return ss;
      std::string head; ss >> head;
      if(head != tag) fail("expected '" + tag + "', got '" + head + "'");
      return ss;
    }
    fail("unexpected end of file, expected '" + (tag.empty() ? std::string("grid row") : tag) + "'");
    return std::istringstream();
  }
  [[noreturn]] void fail(const std::string& msg) const {
    throw std::runtime_error(origin + ":" + std::to_string(line_num) + ": " + msg);
  }
};
}

FinalizedHeatmapSet read_heatmaps(std::istream& in, const std::string& origin){
  LineReader lr{in, origin};
  FinalizedHeatmapSet set;
  auto& m = set.meta;

  int version = 0;
  if(!(lr.expect("HEATGRID") >> version) || version != 1) lr.fail("unsupported HEATGRID version");
  if(!(lr.expect("RESOLUTION") >> set.rows >> set.cols) || set.rows <= 0 || set.cols <= 0) lr.fail("bad RESOLUTION");
  if(!(lr.expect("SAMPLES") >> m.sample_count)) lr.fail("bad SAMPLES");
  if(!(lr.expect("LAYOUTS") >> m.layout_count)) lr.fail("bad LAYOUTS");
  if(!(lr.expect("SKIPPED") >> m.skipped_count)) lr.fail("bad SKIPPED");
  long long built = 0;
  if(!(lr.expect("BUILT") >> built)) lr.fail("bad BUILT");
  m.built_at = (std::time_t)built;

  double w_mean = 0, h_mean = 0;
  auto canvas = lr.expect("CANVAS");
  if(!(canvas >> m.canvas.w_min >> w_mean >> m.canvas.w_max >> m.canvas.h_min >> h_mean >> m.canvas.h_max >> m.canvas.count))
    lr.fail("bad CANVAS");
  m.canvas.w_sum = w_mean * m.canvas.count;
  m.canvas.h_sum = h_mean * m.canvas.count;

  size_t n = 0;
  if(!(lr.expect("CATEGORIES") >> n)) lr.fail("bad CATEGORIES");
  for(size_t i=0; i<n; ++i){
    std::string name;
    Grid g = Grid::zeros(set.rows, set.cols);
    if(!(lr.expect("CATEGORY") >> name >> g.sample_count >> g.layout_count)) lr.fail("bad CATEGORY");
    try{
      set.categories.add(name);
    }catch(const ConfigError& e){
      lr.fail(e.what());
    }
    for(int r=0; r<set.rows; ++r){
      auto row = lr.expect("");
      for(int c=0; c<set.cols; ++c){
        if(!(row >> g.at(r, c)) || g.at(r, c) < 0) lr.fail("bad cell value in category '" + name + "'");
      }
      std::string extra;
      if(row >> extra) lr.fail("too many values in row of category '" + name + "'");
    }
    set.grids.push_back(std::move(g));
  }
  return set;
}

FinalizedHeatmapSet read_heatmaps(const std::string& path){
  std::ifstream fin(path);
  if(!fin) throw std::runtime_error("Cannot open heatmap file: "+path);
  return read_heatmaps(fin, path);
}

void write_heat_prompt(const FinalizedHeatmapSet& set, std::ostream& os){
  os << "<LAYOUT_HEAT>\n";
  os << "FRAME_PCT 100 100\n";
  auto old_precision = os.precision(1);
  os << std::fixed;
  for(u32 cid = 0; cid < set.categories.size(); ++cid){
    Grid q = quantize(set.grids[cid], 1);
    os << set.categories.heat_tag(cid);
    for(double v : q.cells) os << " " << v;
    os << "\n";
  }
  os << std::defaultfloat;
  os.precision(old_precision);
}
