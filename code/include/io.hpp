#pragma once
#include "types.hpp"
#include "aggregator.hpp"
#include <iosfwd>
#include <string>

// Self-describing text artifact:
//   HEATGRID 1
//   RESOLUTION <rows> <cols>
//   SAMPLES <n> / LAYOUTS <n> / SKIPPED <n>
//   BUILT <epoch seconds> <ISO-8601 UTC>
//   CANVAS <w_min> <w_mean> <w_max> <h_min> <h_mean> <h_max> <count>
//   CATEGORIES <n>
//   CATEGORY <name> <samples> <layouts>   followed by <rows> lines of <cols> values
void write_heatmaps(const FinalizedHeatmapSet& set, std::ostream& os);
// writes to <path>.tmp and renames, so a failure never leaves a partial file
void write_heatmaps(const FinalizedHeatmapSet& set, const std::string& out_path);

FinalizedHeatmapSet read_heatmaps(std::istream& in, const std::string& origin = "<stream>");
FinalizedHeatmapSet read_heatmaps(const std::string& path);

// <LAYOUT_HEAT> prompt block, one "<heat_tag> v v ..." line per category,
// values rounded to one decimal
void write_heat_prompt(const FinalizedHeatmapSet& set, std::ostream& os);

std::string format_utc(std::time_t t);
