#include "aggregator.hpp"
#include "errors.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <thread>
#include <tuple>

static const u64 kMaxSkipLogs = 10;

HeatmapAggregator::HeatmapAggregator(const Config& c) : cfg(c) {
  if(cfg.rows <= 0 || cfg.cols <= 0)
    throw ConfigError("grid resolution must be positive, got " + std::to_string(cfg.rows) + "x" + std::to_string(cfg.cols));
  if(cfg.categories.empty()) throw ConfigError("category set is empty");
}

RawHeatmapSet HeatmapAggregator::accumulate(BoxSource& source) const{
  RawHeatmapSet raw;
  raw.rows = cfg.rows; raw.cols = cfg.cols;
  raw.categories = cfg.categories;

  BoxRecord box;
  while(true){
    if(should_stop && should_stop()) throw AggregationCancelled(raw.stats.records_absorbed);
    if(!source.next(box)) break;
    raw.stats.records_read++;

    try{
      if(box.category >= cfg.categories.size())
        throw InvalidBoxError("category id " + std::to_string(box.category) + " is not declared");
      auto it = raw.accumulators.find(box.category);
      if(it == raw.accumulators.end()){
        it = raw.accumulators.emplace(std::piecewise_construct,
                                      std::forward_as_tuple(box.category),
                                      std::forward_as_tuple(box.category, cfg.rows, cfg.cols, cfg.epsilon)).first;
      }
      it->second.absorb(box);
    }catch(const InvalidBoxError& e){
      if(cfg.malformed_policy == MalformedPolicy::FailFast) throw;
      if(raw.stats.records_skipped < kMaxSkipLogs)
        std::cerr << "[aggregate] skip record " << raw.stats.records_read << ": " << e.what() << "\n";
      raw.stats.records_skipped++;
      continue;
    }

    raw.stats.records_absorbed++;
    if(raw.layouts.insert(box.layout_id).second)
      raw.stats.canvas.add(box.canvas_width, box.canvas_height);
  }

  if(raw.stats.records_skipped > kMaxSkipLogs)
    std::cerr << "[aggregate] ... " << (raw.stats.records_skipped - kMaxSkipLogs) << " more skipped records not shown\n";
  return raw;
}

void HeatmapAggregator::merge_raw(RawHeatmapSet& dst, const RawHeatmapSet& src){
  if(dst.rows != src.rows || dst.cols != src.cols)
    throw ResolutionMismatchError(dst.rows, dst.cols, src.rows, src.cols);
  if(dst.categories != src.categories)
    throw HeatgridError("cannot merge shards with different category sets");
  for(const auto& kv : src.accumulators){
    auto it = dst.accumulators.find(kv.first);
    if(it == dst.accumulators.end()) dst.accumulators.emplace(kv.first, kv.second);
    else it->second.merge(kv.second);
  }
  dst.layouts.insert(src.layouts.begin(), src.layouts.end());
  dst.stats.merge(src.stats);
}

FinalizedHeatmapSet HeatmapAggregator::finalize(const RawHeatmapSet& raw, std::time_t built_at) const{
  if(raw.stats.records_absorbed == 0 && !cfg.allow_empty_corpus) throw EmptyCorpusError();

  FinalizedHeatmapSet out;
  out.rows = raw.rows; out.cols = raw.cols;
  out.categories = raw.categories;
  out.grids.reserve(raw.categories.size());
  for(u32 cid = 0; cid < raw.categories.size(); ++cid){
    auto it = raw.accumulators.find(cid);
    Grid g = (it == raw.accumulators.end()) ? Grid::zeros(raw.rows, raw.cols) : it->second.finalize();
    gaussian_smooth(g, cfg.sigma);
    normalize_max(g);
    out.meta.sample_count += g.sample_count;
    out.grids.push_back(std::move(g));
  }
  out.meta.layout_count = raw.layouts.size();
  out.meta.skipped_count = raw.stats.records_skipped;
  out.meta.canvas = raw.stats.canvas;
  out.meta.built_at = built_at;
  return out;
}

FinalizedHeatmapSet HeatmapAggregator::run(BoxSource& source) const{
  std::cerr << "[aggregate] grid " << cfg.rows << "x" << cfg.cols
            << ", " << cfg.categories.size() << " categories"
            << ", policy=" << policy_name(cfg.malformed_policy) << "\n";
  RawHeatmapSet raw = accumulate(source);
  return finalize(raw, std::time(nullptr));
}

FinalizedHeatmapSet HeatmapAggregator::run_sharded(const std::vector<BoxSource*>& shards) const{
  std::vector<RawHeatmapSet> parts(shards.size());
  std::vector<std::exception_ptr> errors(shards.size());
  std::atomic<size_t> next_shard{0};

  auto worker = [&](){
    while(true){
      size_t i = next_shard.fetch_add(1);
      if(i >= shards.size()) return;
      try{
        parts[i] = accumulate(*shards[i]);
      }catch(...){
        errors[i] = std::current_exception();
      }
    }
  };

  int n = std::max(1, std::min(cfg.threads, (int)shards.size()));
  std::cerr << "[aggregate] " << shards.size() << " shards on " << n << " threads\n";
  std::vector<std::thread> pool;
  for(int t=1; t<n; ++t) pool.emplace_back(worker);
  worker();
  for(auto& th : pool) th.join();

  // first failing shard in shard order wins
  for(auto& e : errors) if(e) std::rethrow_exception(e);

  RawHeatmapSet merged;
  merged.rows = cfg.rows; merged.cols = cfg.cols;
  merged.categories = cfg.categories;
  for(const auto& p : parts) merge_raw(merged, p);
  return finalize(merged, std::time(nullptr));
}
