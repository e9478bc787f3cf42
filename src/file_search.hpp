#pragma once

#include "file_operations.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct ContentMatch {
  uint32_t line_number = 0;
  std::string line_content;
  uint32_t match_start = 0;
  uint32_t match_end = 0;
};

struct SearchMatch {
  std::string path;
  FileEntry entry;
  std::vector<ContentMatch> content_matches;

  nlohmann::json to_json() const;
};

struct SearchResults {
  std::string path;
  std::vector<SearchMatch> matches;
  bool truncated = false;
};

// .gitignore rules, scoped to the directory that declared them.
class IgnoreRules {
public:
  void load_file(const std::filesystem::path& gitignore);
  void add_rule(const std::filesystem::path& base, const std::string& line);
  bool is_ignored(const std::filesystem::path& path, bool is_directory) const;
  bool empty() const { return rules_.empty(); }

private:
  struct Rule {
    std::filesystem::path base;
    std::string pattern;
    bool negated = false;
    bool directory_only = false;
    bool anchored = false;
  };
  std::vector<Rule> rules_;
};

class FileSearch {
public:
  static constexpr std::size_t kMaxContentMatchesPerFile = 20;

  explicit FileSearch(const FileOperations& ops);

  // When content_pattern is set, only name matches whose text contains it
  // are reported.
  SearchResults search_files(const std::string& path,
                             const std::string& name_pattern,
                             const std::optional<std::string>& content_pattern = std::nullopt,
                             std::optional<uint32_t> max_depth = std::nullopt,
                             std::optional<std::size_t> max_results = std::nullopt) const;

  static std::vector<ContentMatch> search_content(const std::filesystem::path& file,
                                                  const std::string& needle);

private:
  const FileOperations& ops_;
};
