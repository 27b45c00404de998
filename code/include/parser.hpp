#pragma once
#include "types.hpp"
#include "aggregator.hpp"
#include <fstream>
#include <string>
#include <vector>

// "key value..." lines; unknown keys and bad values throw ConfigError
Config parse_config_file(const std::string& config_path);
Config parse_config_stream(std::istream& in, const std::string& origin = "<config>");

// Streams a text corpus one record at a time:
//   LAYOUT <name> <canvas_w> <canvas_h>
//   <category> <x_min> <y_min> <x_max> <y_max>
// Records with undeclared categories are dropped and counted. Layout ids are
// dense in order of appearance, starting at first_layout_id.
class CorpusReader : public BoxSource {
public:
  CorpusReader(const std::string& path, const CategorySet& cats, u32 first_layout_id = 0);
  CorpusReader(std::istream& in, const CategorySet& cats, const std::string& origin = "<stream>", u32 first_layout_id = 0);

  bool next(BoxRecord& out) override;

  // pass undeclared categories through as kUnknownCategory instead of dropping
  void set_keep_unknown(bool keep){ keep_unknown = keep; }

  u64 dropped_unknown() const { return unknown_count; }
  u32 layouts_seen() const { return layout_count; }
  const std::vector<std::string>& layout_names() const { return names; }

private:
  std::ifstream file;
  std::istream* in;
  const CategorySet& cats;
  std::string origin;
  int line_num = 0;
  u32 next_layout_id;
  u32 layout_count = 0;
  bool in_layout = false;
  u32 cur_layout = 0;
  double cur_w = 0, cur_h = 0;
  u64 unknown_count = 0;
  bool keep_unknown = false;
  std::vector<std::string> names;
};

// whole-file convenience for query layouts; undeclared categories are kept
// as kUnknownCategory so the scorer can report them
std::vector<BoxRecord> parse_layout_file(const std::string& layout_path, const CategorySet& cats);
