#include "parser.hpp"
#include "errors.hpp"
#include <sstream>
#include <cctype>
#include <stdexcept>
#include <iostream>

static std::string trim(const std::string& s){
  size_t i=0,j=s.size();
  while(i<j && std::isspace((unsigned char)s[i])) ++i;
  while(j>i && std::isspace((unsigned char)s[j-1])) --j;
  return s.substr(i,j-i);
}

static std::string strip_comment(const std::string& s){
  auto pos = s.find('#');
  return pos == std::string::npos ? s : s.substr(0, pos);
}

template<typename T>
static T read_value(std::istringstream& ss, const std::string& key, const std::string& where){
  T v;
  if(!(ss >> v)) throw ConfigError(where + ": bad or missing value for '" + key + "'");
  return v;
}

Config parse_config_file(const std::string& config_path){
  std::ifstream fin(config_path);
  if(!fin) throw std::runtime_error("Cannot open config file: "+config_path);
  return parse_config_stream(fin, config_path);
}

Config parse_config_stream(std::istream& in, const std::string& origin){
  Config cfg;
  std::string line;
  int line_num = 0;
  // weights are resolved after the category list is final
  std::vector<std::pair<std::string,double>> pending_weights;

  while(std::getline(in,line)){
    line_num++;
    line = trim(strip_comment(line));
    if(line.empty()) continue;
    std::istringstream ss(line);
    std::string key; ss >> key;
    std::string where = origin + ":" + std::to_string(line_num);

    if(key=="rows") cfg.rows = read_value<int>(ss, key, where);
    else if(key=="cols") cfg.cols = read_value<int>(ss, key, where);
    else if(key=="categories"){
      std::vector<std::string> names; std::string n;
      while(ss>>n) names.push_back(n);
      if(names.empty()) throw ConfigError(where + ": 'categories' needs at least one name");
      cfg.categories = CategorySet(names);
    }
    else if(key=="malformed_policy") cfg.malformed_policy = parse_policy(read_value<std::string>(ss, key, where));
    else if(key=="score_combination") cfg.score_combination = parse_combination(read_value<std::string>(ss, key, where));
    else if(key=="weight"){
      std::string name = read_value<std::string>(ss, key, where);
      pending_weights.push_back({name, read_value<double>(ss, key, where)});
    }
    else if(key=="sigma") cfg.sigma = read_value<double>(ss, key, where);
    else if(key=="epsilon") cfg.epsilon = read_value<double>(ss, key, where);
    else if(key=="threads") cfg.threads = read_value<int>(ss, key, where);
    else if(key=="allow_empty_corpus") cfg.allow_empty_corpus = read_value<int>(ss, key, where) != 0;
    else throw ConfigError(where + ": unknown key '" + key + "'");
  }

  if(cfg.rows <= 0 || cfg.cols <= 0) throw ConfigError(origin + ": rows and cols must be positive");
  if(cfg.sigma < 0) throw ConfigError(origin + ": sigma must be >= 0");
  if(cfg.epsilon < 0) throw ConfigError(origin + ": epsilon must be >= 0");
  if(cfg.threads < 1) cfg.threads = 1;
  for(const auto& pw : pending_weights){
    u32 cid = cfg.categories.resolve(pw.first);
    if(cid == kUnknownCategory) throw ConfigError(origin + ": weight for undeclared category '" + pw.first + "'");
    if(pw.second < 0) throw ConfigError(origin + ": negative weight for '" + pw.first + "'");
    cfg.category_weights[cid] = pw.second;
  }
  return cfg;
}

CorpusReader::CorpusReader(const std::string& path, const CategorySet& c, u32 first_layout_id)
  : file(path), in(&file), cats(c), origin(path), next_layout_id(first_layout_id) {
  if(!file) throw std::runtime_error("Cannot open corpus file: "+path);
}

CorpusReader::CorpusReader(std::istream& s, const CategorySet& c, const std::string& o, u32 first_layout_id)
  : in(&s), cats(c), origin(o), next_layout_id(first_layout_id) {}

bool CorpusReader::next(BoxRecord& out){
  std::string line;
  while(std::getline(*in,line)){
    line_num++;
    line = trim(strip_comment(line));
    if(line.empty()) continue;
    std::istringstream ss(line);
    std::string head; ss >> head;
    std::string where = origin + ":" + std::to_string(line_num);

    if(head=="LAYOUT"){
      std::string name; double w=0, h=0;
      if(!(ss >> name >> w >> h)) throw std::runtime_error(where + ": expected 'LAYOUT <name> <width> <height>'");
      cur_layout = next_layout_id++;
      cur_w = w; cur_h = h;
      in_layout = true;
      layout_count++;
      names.push_back(name);
      continue;
    }

    if(!in_layout) throw std::runtime_error(where + ": box line before any LAYOUT line");
    BoxRecord b;
    if(!(ss >> b.x_min >> b.y_min >> b.x_max >> b.y_max))
      throw std::runtime_error(where + ": expected '<category> <x_min> <y_min> <x_max> <y_max>'");
    b.category = cats.resolve(head);
    if(b.category == kUnknownCategory && !keep_unknown){
      if(unknown_count == 0) std::cerr << "[corpus] " << where << ": dropping undeclared category '" << head << "'\n";
      unknown_count++;
      continue;
    }
    b.layout_id = cur_layout;
    b.canvas_width = cur_w;
    b.canvas_height = cur_h;
    out = b;
    return true;
  }
  if(in->bad()) throw std::runtime_error("Read error in " + origin);
  return false;
}

std::vector<BoxRecord> parse_layout_file(const std::string& layout_path, const CategorySet& cats){
  CorpusReader reader(layout_path, cats);
  reader.set_keep_unknown(true);
  std::vector<BoxRecord> boxes;
  BoxRecord b;
  while(reader.next(b)) boxes.push_back(b);
  return boxes;
}
