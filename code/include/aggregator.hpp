#pragma once
#include "types.hpp"
#include "grid.hpp"
#include "accumulator.hpp"
#include "metrics.hpp"
#include <ctime>
#include <functional>
#include <map>
#include <set>
#include <vector>

// one-pass producer of records; next() returns false when exhausted
class BoxSource {
public:
  virtual ~BoxSource() = default;
  virtual bool next(BoxRecord& out) = 0;
};

class VectorSource : public BoxSource {
public:
  explicit VectorSource(const std::vector<BoxRecord>& boxes) : boxes(&boxes) {}
  bool next(BoxRecord& out) override {
    if(pos >= boxes->size()) return false;
    out = (*boxes)[pos++];
    return true;
  }
private:
  const std::vector<BoxRecord>* boxes;
  size_t pos = 0;
};

struct CorpusMeta {
  u64 sample_count = 0;
  u64 layout_count = 0;
  u64 skipped_count = 0;
  CanvasStats canvas;
  std::time_t built_at = 0;
};

// unnormalized shard result; safe to merge in any order
struct RawHeatmapSet {
  int rows = 0, cols = 0;
  CategorySet categories;
  std::map<u32, CategoryAccumulator> accumulators;   // created on first sight
  std::set<u32> layouts;
  RunStats stats;
};

// Immutable artifact of one aggregation run. Every declared category is
// present; grids are max-normalized.
struct FinalizedHeatmapSet {
  int rows = 0, cols = 0;
  CategorySet categories;
  std::vector<Grid> grids;   // indexed by category id
  CorpusMeta meta;

  const Grid* grid_for(u32 cid) const { return cid < grids.size() ? &grids[cid] : nullptr; }
  const Grid* grid_for(const std::string& name) const { return grid_for(categories.resolve(name)); }
};

class HeatmapAggregator {
public:
  explicit HeatmapAggregator(const Config& cfg);

  // polled before each record; must be thread-safe when used with run_sharded
  void set_cancel_check(std::function<bool()> fn){ should_stop = std::move(fn); }

  RawHeatmapSet accumulate(BoxSource& source) const;
  FinalizedHeatmapSet finalize(const RawHeatmapSet& raw, std::time_t built_at) const;
  FinalizedHeatmapSet run(BoxSource& source) const;

  // one accumulator set per shard, merged in shard order, normalized once
  FinalizedHeatmapSet run_sharded(const std::vector<BoxSource*>& shards) const;

  static void merge_raw(RawHeatmapSet& dst, const RawHeatmapSet& src);

  const Config& config() const { return cfg; }

private:
  Config cfg;
  std::function<bool()> should_stop;
};
