#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class SettingsManager;

// Immutable once published through a PolicyStore.
struct SandboxPolicy {
  // As configured, and canonicalized where the directory exists.
  std::vector<std::filesystem::path> allowed_roots;
  std::vector<std::filesystem::path> canonical_roots;
  std::vector<std::string> denied_patterns;
  std::vector<std::string> read_only_patterns;
  uint64_t max_read_size = 50ull * 1024 * 1024;
  uint64_t max_write_size = 50ull * 1024 * 1024;
  bool follow_symlinks = false;
  std::size_t max_list_entries = 10000;
  std::size_t max_search_results = 1000;

  bool is_within_roots(const std::filesystem::path& path) const;
  // First deny glob matching path, if any.
  std::optional<std::string> denied_by(const std::filesystem::path& path) const;
  bool is_denied(const std::filesystem::path& path) const { return denied_by(path).has_value(); }
  bool is_writable(const std::filesystem::path& path) const;

  void set_roots(std::vector<std::filesystem::path> roots);

  static SandboxPolicy defaults();
  static SandboxPolicy from_settings(const SettingsManager& settings);
};

// Holds the current policy snapshot. Readers take a shared_ptr and keep it
// for the whole request; reload swaps the pointer atomically.
class PolicyStore {
public:
  explicit PolicyStore(SandboxPolicy initial);

  std::shared_ptr<const SandboxPolicy> snapshot() const;
  void replace(SandboxPolicy next);

private:
  std::shared_ptr<const SandboxPolicy> current_;
};

bool path_is_within(const std::filesystem::path& path, const std::filesystem::path& root);
std::filesystem::path home_directory();
