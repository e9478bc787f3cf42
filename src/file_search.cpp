#include "file_search.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace {

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

bool name_matches(const std::string& pattern, const std::string& name) {
  if(pattern.empty() || pattern == "*") return true;
  // a bare word searches by substring
  if(pattern.find_first_of("*?[") == std::string::npos) {
    return to_lower(name).find(to_lower(pattern)) != std::string::npos;
  }
  return fnmatch(pattern.c_str(), name.c_str(), FNM_CASEFOLD) == 0;
}

// .gitignore files from the enclosing repository root down to dir.
IgnoreRules rules_above(const fs::path& dir) {
  std::vector<fs::path> chain;
  std::error_code ec;
  for(fs::path cur = dir; ; cur = cur.parent_path()) {
    chain.push_back(cur);
    if(fs::exists(cur / ".git", ec) || cur == cur.root_path() || !cur.has_relative_path()) break;
  }
  IgnoreRules rules;
  if(!fs::exists(chain.back() / ".git", ec)) {
    chain.assign(1, dir);
  }
  for(auto it = chain.rbegin(); it != chain.rend(); ++it) {
    rules.load_file(*it / ".gitignore");
  }
  return rules;
}

} // namespace

nlohmann::json SearchMatch::to_json() const {
  nlohmann::json j;
  j["path"] = path;
  j["entry"] = entry.to_json();
  if(!content_matches.empty()) {
    auto arr = nlohmann::json::array();
    for(const auto& m : content_matches) {
      arr.push_back({
        {"line_number", m.line_number},
        {"line_content", m.line_content},
        {"match_start", m.match_start},
        {"match_end", m.match_end}
      });
    }
    j["content_matches"] = std::move(arr);
  }
  return j;
}

void IgnoreRules::load_file(const fs::path& gitignore) {
  std::ifstream in(gitignore);
  if(!in) return;
  std::string line;
  while(std::getline(in, line)) {
    add_rule(gitignore.parent_path(), line);
  }
}

void IgnoreRules::add_rule(const fs::path& base, const std::string& raw) {
  std::string line = raw;
  while(!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
  if(line.empty() || line[0] == '#') return;

  Rule rule;
  rule.base = base;
  if(line[0] == '!') {
    rule.negated = true;
    line.erase(0, 1);
  } else if(line[0] == '\\') {
    line.erase(0, 1);
  }
  if(!line.empty() && line.back() == '/') {
    rule.directory_only = true;
    line.pop_back();
  }
  if(!line.empty() && line[0] == '/') {
    rule.anchored = true;
    line.erase(0, 1);
  } else if(line.find('/') != std::string::npos) {
    rule.anchored = true;
  }
  if(line.empty()) return;
  rule.pattern = line;
  rules_.push_back(std::move(rule));
}

bool IgnoreRules::is_ignored(const fs::path& path, bool is_directory) const {
  bool ignored = false;
  const std::string name = path.filename().string();
  for(const auto& rule : rules_) {
    if(rule.directory_only && !is_directory) continue;
    auto rel = path.lexically_relative(rule.base);
    if(rel.empty() || *rel.begin() == "..") continue;
    bool hit;
    if(rule.anchored) {
      hit = fnmatch(rule.pattern.c_str(), rel.generic_string().c_str(), FNM_PATHNAME) == 0;
    } else {
      hit = fnmatch(rule.pattern.c_str(), name.c_str(), 0) == 0;
    }
    if(hit) ignored = !rule.negated;
  }
  return ignored;
}

FileSearch::FileSearch(const FileOperations& ops) : ops_(ops) {}

std::vector<ContentMatch> FileSearch::search_content(const fs::path& file, const std::string& needle) {
  std::vector<ContentMatch> matches;
  if(needle.empty()) return matches;
  std::ifstream in(file, std::ios::binary);
  if(!in) return matches;
  std::string line;
  uint32_t line_number = 0;
  while(matches.size() < kMaxContentMatchesPerFile && std::getline(in, line)) {
    ++line_number;
    if(!line.empty() && line.back() == '\r') line.pop_back();
    auto pos = line.find(needle);
    if(pos == std::string::npos) continue;
    ContentMatch m;
    m.line_number = line_number;
    m.match_start = static_cast<uint32_t>(pos);
    m.match_end = static_cast<uint32_t>(pos + needle.size());
    m.line_content = std::move(line);
    matches.push_back(std::move(m));
  }
  return matches;
}

SearchResults FileSearch::search_files(const std::string& path,
                                       const std::string& name_pattern,
                                       const std::optional<std::string>& content_pattern,
                                       std::optional<uint32_t> max_depth,
                                       std::optional<std::size_t> max_results) const {
  auto policy = ops_.validator().policy();
  auto root = ops_.validator().validate_existing(*policy, path);
  std::error_code ec;
  if(!fs::is_directory(root, ec)) throw FsError::not_a_directory(path);

  const std::size_t limit = std::min(max_results.value_or(policy->max_search_results),
                                     policy->max_search_results);

  SearchResults results;
  results.path = root.string();

  struct Frame {
    fs::path dir;
    uint32_t depth;
    IgnoreRules rules;
  };
  std::vector<Frame> stack;
  stack.push_back({root, 0, rules_above(root)});
  // canonical directories already walked, so linked loops end
  std::set<fs::path> visited{root};

  while(!stack.empty() && !results.truncated) {
    Frame frame = std::move(stack.back());
    stack.pop_back();

    std::vector<fs::directory_entry> children;
    fs::directory_iterator it(frame.dir, fs::directory_options::skip_permission_denied, ec);
    if(ec) { ec.clear(); continue; }
    for(fs::directory_iterator end; it != end; it.increment(ec)) {
      if(ec) break;
      children.push_back(*it);
    }
    ec.clear();
    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b){ return a.path() < b.path(); });

    const uint32_t depth = frame.depth + 1;
    std::vector<Frame> subdirs;
    for(const auto& child : children) {
      const auto& child_path = child.path();
      const auto name = child_path.filename().string();
      const bool is_symlink = child.is_symlink(ec);
      const bool is_dir = !is_symlink && child.is_directory(ec);
      if(is_dir && name == ".git") continue;
      if(frame.rules.is_ignored(child_path, is_dir)) continue;
      if(policy->is_denied(child_path)) continue;

      if(name_matches(name_pattern, name)) {
        fs::path canonical;
        try {
          canonical = ops_.validator().validate_existing(*policy, child_path.string());
        } catch(const FsError&) {
          continue;
        }
        SearchMatch match;
        if(content_pattern && !content_pattern->empty()) {
          if(is_dir || !fs::is_regular_file(canonical, ec)) continue;
          auto size = fs::file_size(canonical, ec);
          if(ec || size > policy->max_read_size) { ec.clear(); continue; }
          match.content_matches = search_content(canonical, *content_pattern);
          if(match.content_matches.empty()) continue;
        }
        try {
          match.entry = FileOperations::make_entry(child_path);
        } catch(const FsError&) {
          continue;
        }
        match.path = canonical.string();
        results.matches.push_back(std::move(match));
        if(results.matches.size() >= limit) {
          results.truncated = true;
          break;
        }
      }

      if(!max_depth || depth < *max_depth) {
        fs::path walk_as;
        if(is_dir) {
          walk_as = fs::canonical(child_path, ec);
        } else if(is_symlink && policy->follow_symlinks && child.is_directory(ec)) {
          try {
            walk_as = ops_.validator().validate_existing(*policy, child_path.string());
          } catch(const FsError&) {
            walk_as.clear();
          }
        }
        ec.clear();
        if(walk_as.empty() || !visited.insert(walk_as).second) continue;
        IgnoreRules rules = frame.rules;
        rules.load_file(child_path / ".gitignore");
        subdirs.push_back({child_path, depth, std::move(rules)});
      }
    }
    // keep a depth-first walk in name order
    for(auto it2 = subdirs.rbegin(); it2 != subdirs.rend(); ++it2) {
      stack.push_back(std::move(*it2));
    }
  }
  return results;
}
