#include "types.hpp"
#include "errors.hpp"
#include <cctype>

BoxRecord make_box_from_percent(u32 category, u32 layout_id, double x, double y, double w, double h){
  BoxRecord b;
  b.category = category;
  b.layout_id = layout_id;
  b.x_min = x; b.y_min = y;
  b.x_max = x + w; b.y_max = y + h;
  b.canvas_width = 100.0; b.canvas_height = 100.0;
  return b;
}

CategorySet::CategorySet(const std::vector<std::string>& ns){
  for(const auto& n : ns) add(n);
}

// "Host/organization" -> "host_organization"
std::string CategorySet::canonical(const std::string& name){
  std::string out; out.reserve(name.size());
  for(char ch : name){
    unsigned char c = (unsigned char)ch;
    if(c=='/' || c=='-' || std::isspace(c)) out.push_back('_');
    else out.push_back((char)std::tolower(c));
  }
  return out;
}

CategorySet CategorySet::poster_defaults(){
  return CategorySet({"Title", "Location", "Time", "Host/organization",
                      "Call-To-Action/Purpose", "Text descriptions/details"});
}

// prompt tags keep the hyphens the fine-tuning set was labelled with
std::string CategorySet::heat_tag(u32 cid) const{
  static const std::unordered_map<std::string,std::string> prompt_names = {
    {"call_to_action_purpose", "call-to-action_purpose"},
  };
  const std::string& n = name(cid);
  auto it = prompt_names.find(n);
  return (it == prompt_names.end() ? n : it->second) + "_heat";
}

u32 CategorySet::add(const std::string& name){
  std::string key = canonical(name);
  if(key.empty()) throw ConfigError("empty category name");
  if(name2cid.count(key)) throw ConfigError("duplicate category: " + key);
  u32 cid = (u32)names.size();
  names.push_back(key);
  name2cid[key] = cid;
  return cid;
}

u32 CategorySet::resolve(const std::string& name) const{
  auto it = name2cid.find(canonical(name));
  return it == name2cid.end() ? kUnknownCategory : it->second;
}

const std::string& CategorySet::name(u32 cid) const{
  static const std::string unknown = "<unknown>";
  return cid < names.size() ? names[cid] : unknown;
}

const char* policy_name(MalformedPolicy p){
  return p == MalformedPolicy::Skip ? "skip" : "fail_fast";
}

const char* combination_name(ScoreCombination c){
  switch(c){
    case ScoreCombination::Mean: return "mean";
    case ScoreCombination::Min: return "min";
    case ScoreCombination::Weighted: return "weighted";
  }
  return "mean";
}

MalformedPolicy parse_policy(const std::string& s){
  if(s == "skip") return MalformedPolicy::Skip;
  if(s == "fail_fast") return MalformedPolicy::FailFast;
  throw ConfigError("unknown malformed_policy: " + s);
}

ScoreCombination parse_combination(const std::string& s){
  if(s == "mean") return ScoreCombination::Mean;
  if(s == "min") return ScoreCombination::Min;
  if(s == "weighted") return ScoreCombination::Weighted;
  throw ConfigError("unknown score_combination: " + s);
}
