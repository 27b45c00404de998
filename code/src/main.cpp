#include "parser.hpp"
#include "aggregator.hpp"
#include "scorer.hpp"
#include "io.hpp"
#include "errors.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

static const char* kUsage =
  "Usage:\n"
  "  heatgrid build   -corpus <file> [-corpus <file>...] -output <heat.txt> [-config <cfg>] [-thread n]\n"
  "                   [-rows r] [-cols c] [-policy skip|fail_fast] [-sigma s]\n"
  "  heatgrid score   -heatmaps <heat.txt> -layout <layout.txt> [-config <cfg>] [-rows r] [-cols c]\n"
  "                   [-combine mean|min|weighted]\n"
  "  heatgrid regions -heatmaps <heat.txt> -category <name> [-k n] [-layout <placed.txt>]\n"
  "  heatgrid prompt  -heatmaps <heat.txt>\n";

struct Args {
  std::string cmd, config_path, output, heatmaps, layout, category;
  std::vector<std::string> corpora;
  int rows=-1, cols=-1, threads=-1, k=5;
  std::string policy, combine;
  double sigma=-1;
};

// LAYOUT lines per file, so shards get disjoint layout ids
static u32 count_layouts(const std::string& path){
  std::ifstream fin(path);
  if(!fin) throw std::runtime_error("Cannot open corpus file: "+path);
  std::string line, head;
  u32 n=0;
  while(std::getline(fin,line)){
    std::istringstream ss(line);
    if(ss>>head && head=="LAYOUT") ++n;
  }
  return n;
}

static Config load_config(const Args& a){
  Config cfg = a.config_path.empty() ? Config() : parse_config_file(a.config_path);
  if(a.rows>0) cfg.rows = a.rows;
  if(a.cols>0) cfg.cols = a.cols;
  if(a.threads>0) cfg.threads = a.threads;
  if(!a.policy.empty()) cfg.malformed_policy = parse_policy(a.policy);
  if(!a.combine.empty()) cfg.score_combination = parse_combination(a.combine);
  if(a.sigma>=0) cfg.sigma = a.sigma;
  return cfg;
}

static int cmd_build(const Args& a){
  if(a.corpora.empty() || a.output.empty()){ std::cerr<<kUsage; return 1; }
  Config cfg = load_config(a);
  HeatmapAggregator agg(cfg);

  std::vector<std::unique_ptr<CorpusReader>> readers;
  u32 next_id = 0;
  for(const auto& path : a.corpora){
    u32 first = next_id;
    if(a.corpora.size() > 1) next_id += count_layouts(path);
    readers.push_back(std::make_unique<CorpusReader>(path, cfg.categories, first));
  }

  FinalizedHeatmapSet set;
  if(readers.size() == 1){
    set = agg.run(*readers[0]);
  }else{
    std::vector<BoxSource*> shards;
    for(auto& r : readers) shards.push_back(r.get());
    set = agg.run_sharded(shards);
  }

  u64 dropped = 0;
  for(auto& r : readers) dropped += r->dropped_unknown();
  if(dropped) std::cerr << "[corpus] dropped " << dropped << " boxes with undeclared categories\n";

  RunStats stats;
  stats.records_absorbed = set.meta.sample_count;
  stats.records_skipped = set.meta.skipped_count;
  stats.records_read = set.meta.sample_count + set.meta.skipped_count;
  stats.canvas = set.meta.canvas;
  stats.print_summary(set.categories, set.grids, set.meta.layout_count);

  write_heatmaps(set, a.output);
  std::cerr << "[build] wrote " << a.output << "\n";
  return 0;
}

static std::shared_ptr<const FinalizedHeatmapSet> load_set(const Args& a){
  return std::make_shared<const FinalizedHeatmapSet>(read_heatmaps(a.heatmaps));
}

static int cmd_score(const Args& a){
  if(a.heatmaps.empty() || a.layout.empty()){ std::cerr<<kUsage; return 1; }
  auto set = load_set(a);
  ScoreOptions opts;
  if(!a.config_path.empty()) opts = ScoreOptions::from_config(load_config(a));
  else{
    // a lone -rows or -cols leaves the other dimension to the artifact
    opts.rows = std::max(a.rows, 0);
    opts.cols = std::max(a.cols, 0);
    if(!a.combine.empty()) opts.combination = parse_combination(a.combine);
  }
  LayoutScorer scorer(set, opts);
  std::vector<BoxRecord> layout = parse_layout_file(a.layout, set->categories);
  LayoutScore s = scorer.score(layout);

  for(const auto& w : s.warnings) std::cerr << "[score] warning: element " << w.index << ": " << w.message << "\n";
  for(const auto& e : s.elements){
    std::cout << e.index << " " << set->categories.name(e.category) << " " << e.score
              << (e.known ? "" : " (no data)") << "\n";
  }
  std::cout << "total " << s.total << "\n";
  return 0;
}

static int cmd_regions(const Args& a){
  if(a.heatmaps.empty() || a.category.empty()){ std::cerr<<kUsage; return 1; }
  auto set = load_set(a);
  LayoutScorer scorer(set, ScoreOptions());
  u32 cid = set->categories.resolve(a.category);
  if(cid == kUnknownCategory){
    std::cerr << "[regions] no data for category '" << a.category << "'\n";
    return 2;
  }
  std::vector<RankedCell> cells;
  if(a.layout.empty()) cells = scorer.top_category_regions(cid, (size_t)std::max(0, a.k));
  else cells = scorer.suggest_regions(cid, (size_t)std::max(0, a.k), parse_layout_file(a.layout, set->categories));
  for(const auto& c : cells){
    std::cout << c.row << " " << c.col << " " << c.value
              << " (" << c.region.minx << "," << c.region.miny << ")-(" << c.region.maxx << "," << c.region.maxy << ")\n";
  }
  return 0;
}

static int cmd_prompt(const Args& a){
  if(a.heatmaps.empty()){ std::cerr<<kUsage; return 1; }
  write_heat_prompt(*load_set(a), std::cout);
  return 0;
}

int main(int argc, char** argv){
  if(argc<2){ std::cerr<<kUsage; return 1; }
  Args a;
  a.cmd = argv[1];
  try{
    for(int i=2;i<argc;i++){
      std::string s=argv[i];
      auto need=[&](const char* k){ return s==k && i+1<argc; };
      if(need("-config")) a.config_path=argv[++i];
      else if(need("-corpus")) a.corpora.push_back(argv[++i]);
      else if(need("-output")) a.output=argv[++i];
      else if(need("-heatmaps")) a.heatmaps=argv[++i];
      else if(need("-layout")) a.layout=argv[++i];
      else if(need("-category")) a.category=argv[++i];
      else if(need("-k")) a.k=std::stoi(argv[++i]);
      else if(need("-rows")) a.rows=std::stoi(argv[++i]);
      else if(need("-cols")) a.cols=std::stoi(argv[++i]);
      else if(need("-thread")) a.threads=std::stoi(argv[++i]);
      else if(need("-policy")) a.policy=argv[++i];
      else if(need("-combine")) a.combine=argv[++i];
      else if(need("-sigma")) a.sigma=std::stod(argv[++i]);
      else { std::cerr<<"unknown argument: "<<s<<"\n"<<kUsage; return 1; }
    }
  }catch(const std::exception& e){
    std::cerr<<"bad argument value: "<<e.what()<<"\n"<<kUsage;
    return 1;
  }

  try{
    if(a.cmd=="build") return cmd_build(a);
    if(a.cmd=="score") return cmd_score(a);
    if(a.cmd=="regions") return cmd_regions(a);
    if(a.cmd=="prompt") return cmd_prompt(a);
  }catch(const InvalidBoxError& e){
    std::cerr<<"invalid box: "<<e.what()<<"\n"; return 2;
  }catch(const ResolutionMismatchError& e){
    std::cerr<<e.what()<<"\n"; return 2;
  }catch(const EmptyCorpusError& e){
    std::cerr<<e.what()<<"\n"; return 2;
  }catch(const ConfigError& e){
    std::cerr<<"config error: "<<e.what()<<"\n"; return 2;
  }catch(const std::exception& e){
    std::cerr<<"error: "<<e.what()<<"\n"; return 2;
  }
  std::cerr<<"unknown command: "<<a.cmd<<"\n"<<kUsage;
  return 1;
}
