#include "sandbox_policy.hpp"

#include "settings_manager.hpp"
#include "utils.hpp"

#include <pwd.h>
#include <unistd.h>

#include <atomic>
#include <cstdlib>
#include <iterator>

namespace fs = std::filesystem;

bool path_is_within(const fs::path& path, const fs::path& root) {
  if(root.empty()) return false;
  auto p = path.begin();
  for(auto r = root.begin(); r != root.end(); ++r) {
    // a trailing separator on the root yields an empty final element
    if(r->empty() && std::next(r) == root.end()) break;
    if(p == path.end() || *p != *r) return false;
    ++p;
  }
  return true;
}

fs::path home_directory() {
  const char* home = std::getenv("HOME");
  if(home && *home) return fs::path(home);
  if(const passwd* pw = getpwuid(getuid())) {
    if(pw->pw_dir) return fs::path(pw->pw_dir);
  }
  return fs::path("/");
}

bool SandboxPolicy::is_within_roots(const fs::path& path) const {
  for(const auto& root : canonical_roots) {
    if(path_is_within(path, root)) return true;
  }
  for(const auto& root : allowed_roots) {
    if(path_is_within(path, root)) return true;
  }
  return false;
}

std::optional<std::string> SandboxPolicy::denied_by(const fs::path& path) const {
  const std::string text = path.generic_string();
  for(const auto& pattern : denied_patterns) {
    if(glob_match(pattern, text)) return pattern;
  }
  return std::nullopt;
}

bool SandboxPolicy::is_writable(const fs::path& path) const {
  const std::string text = path.generic_string();
  for(const auto& pattern : read_only_patterns) {
    if(glob_match(pattern, text)) return false;
  }
  return true;
}

void SandboxPolicy::set_roots(std::vector<fs::path> roots) {
  allowed_roots.clear();
  canonical_roots.clear();
  for(auto& root : roots) {
    if(root.empty()) continue;
    auto normal = root.lexically_normal();
    if(!normal.has_filename() && normal != normal.root_path()) {
      normal = normal.parent_path();
    }
    std::error_code ec;
    auto canonical = fs::canonical(normal, ec);
    if(!ec) canonical_roots.push_back(canonical);
    allowed_roots.push_back(std::move(normal));
  }
}

SandboxPolicy SandboxPolicy::defaults() {
  SandboxPolicy policy;
  policy.set_roots({home_directory()});
  policy.denied_patterns = DEFAULT_DENIED_PATTERNS.get<std::vector<std::string>>();
  policy.read_only_patterns = DEFAULT_READ_ONLY_PATTERNS.get<std::vector<std::string>>();
  return policy;
}

SandboxPolicy SandboxPolicy::from_settings(const SettingsManager& settings) {
  SandboxPolicy policy;
  std::vector<fs::path> roots;
  for(const auto& root : settings.get_strings("allowed_roots")) {
    if(root == "~") {
      roots.push_back(home_directory());
    } else if(root.rfind("~/", 0) == 0) {
      roots.push_back(home_directory() / root.substr(2));
    } else {
      roots.emplace_back(root);
    }
  }
  if(roots.empty()) roots.push_back(home_directory());
  policy.set_roots(std::move(roots));

  policy.denied_patterns = settings.get_strings("denied_patterns");
  policy.read_only_patterns = settings.get_strings("read_only_patterns");

  auto positive = [&](const char* key, uint64_t fallback) -> uint64_t {
    int value = settings.get<int>(key);
    return value > 0 ? static_cast<uint64_t>(value) : fallback;
  };
  policy.max_read_size = positive("max_read_size", policy.max_read_size);
  policy.max_write_size = positive("max_write_size", policy.max_write_size);
  policy.max_list_entries = static_cast<std::size_t>(positive("max_list_entries", policy.max_list_entries));
  policy.max_search_results = static_cast<std::size_t>(positive("max_search_results", policy.max_search_results));
  policy.follow_symlinks = settings.get<bool>("follow_symlinks");
  return policy;
}

PolicyStore::PolicyStore(SandboxPolicy initial)
  : current_(std::make_shared<const SandboxPolicy>(std::move(initial))) {}

std::shared_ptr<const SandboxPolicy> PolicyStore::snapshot() const {
  return std::atomic_load(&current_);
}

void PolicyStore::replace(SandboxPolicy next) {
  std::atomic_store(&current_, std::shared_ptr<const SandboxPolicy>(
    std::make_shared<const SandboxPolicy>(std::move(next))));
}
