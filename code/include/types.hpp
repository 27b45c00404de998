#pragma once
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>
#include <unordered_map>

using i32 = int32_t; using u32 = uint32_t; using u64 = uint64_t;

constexpr u32 kUnknownCategory = UINT32_MAX;

// one annotated element; coordinates in source-canvas units, origin upper-left
struct BoxRecord {
  u32 category = kUnknownCategory;  // dense id in the CategorySet
  u32 layout_id = 0;                // dense id of the source layout
  double x_min = 0, y_min = 0, x_max = 0, y_max = 0;
  double canvas_width = 0, canvas_height = 0;
};

// annotation-tool rectangle: x,y,w,h as percentages of a 100x100 frame
BoxRecord make_box_from_percent(u32 category, u32 layout_id, double x, double y, double w, double h);

// enumerated categories, resolved once at configuration load
class CategorySet {
public:
  CategorySet() = default;
  explicit CategorySet(const std::vector<std::string>& names);

  static std::string canonical(const std::string& name);
  static CategorySet poster_defaults();

  // returns the new id; throws ConfigError on duplicates
  u32 add(const std::string& name);
  u32 resolve(const std::string& name) const;  // kUnknownCategory if absent
  const std::string& name(u32 cid) const;
  std::string heat_tag(u32 cid) const;         // "<name>_heat" as used in prompts
  size_t size() const { return names.size(); }
  bool empty() const { return names.empty(); }
  const std::vector<std::string>& all() const { return names; }

  bool operator==(const CategorySet& o) const { return names == o.names; }
  bool operator!=(const CategorySet& o) const { return !(*this == o); }

private:
  std::vector<std::string> names;
  std::unordered_map<std::string,u32> name2cid;
};

enum class MalformedPolicy { Skip, FailFast };
enum class ScoreCombination { Mean, Min, Weighted };

struct Config {
  int rows = 21;
  int cols = 12;
  CategorySet categories = CategorySet::poster_defaults();
  MalformedPolicy malformed_policy = MalformedPolicy::FailFast;
  ScoreCombination score_combination = ScoreCombination::Mean;
  std::unordered_map<u32,double> category_weights;  // missing => 1.0
  double sigma = 0.0;          // gaussian smoothing in cells, 0 = off
  double epsilon = 1e-9;       // degenerate-box area threshold (unit square)
  int threads = 1;
  bool allow_empty_corpus = true;

  double weight_of(u32 cid) const {
    auto it = category_weights.find(cid);
    return it == category_weights.end() ? 1.0 : it->second;
  }
};

const char* policy_name(MalformedPolicy p);
const char* combination_name(ScoreCombination c);
MalformedPolicy parse_policy(const std::string& s);          // throws ConfigError
ScoreCombination parse_combination(const std::string& s);    // throws ConfigError
