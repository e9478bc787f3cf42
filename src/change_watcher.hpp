#pragma once

#include "log.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

enum class ChangeKind { Created, Modified, Deleted, Renamed };

const char* change_kind_name(ChangeKind kind);

struct ChangeEvent {
  std::string path;
  ChangeKind kind = ChangeKind::Modified;
  // set for Renamed
  std::optional<std::string> from;
};

// inotify based directory watcher. Each directory is watched once no matter
// how many callers asked for it; raw events are coalesced per path and
// delivered to listeners from the watcher thread.
class ChangeWatcher {
public:
  using Clock = std::chrono::steady_clock;
  using Listener = std::function<void(const ChangeEvent&)>;

  explicit ChangeWatcher(std::chrono::milliseconds debounce = std::chrono::milliseconds(250),
                         std::shared_ptr<Logger> logger = nullptr);
  ~ChangeWatcher();

  ChangeWatcher(const ChangeWatcher&) = delete;
  ChangeWatcher& operator=(const ChangeWatcher&) = delete;

  void start();
  void stop();

  // Returns true when this call installed the OS watch. Throws FsError.
  bool watch(const std::filesystem::path& dir);
  // Returns true when the last reference went away and the OS watch was removed.
  bool unwatch(const std::filesystem::path& dir);

  std::size_t reference_count(const std::filesystem::path& dir) const;
  std::size_t watch_count() const;

  void add_listener(Listener listener);

private:
  struct Pending {
    bool first_was_create = false;
    std::optional<std::string> renamed_from;
    Clock::time_point last_event;
  };

  struct MoveOrigin {
    std::string path;
    Clock::time_point when;
  };

  void run();
  void drain();
  void record(const std::string& path, uint32_t mask, uint32_t cookie, Clock::time_point now);
  std::vector<ChangeEvent> collect_due(Clock::time_point now);
  void deliver(const std::vector<ChangeEvent>& events);
  int poll_timeout_ms() const;

  std::chrono::milliseconds debounce_;
  std::shared_ptr<Logger> logger_;

  int inotify_fd_ = -1;
  int wake_pipe_[2] = {-1, -1};
  std::thread thread_;
  std::atomic<bool> running_{false};

  mutable std::mutex m_;
  std::unordered_map<std::string, int> wd_by_path_;
  std::unordered_map<int, std::string> path_by_wd_;
  std::unordered_map<std::string, std::size_t> refs_;
  std::map<std::string, Pending> pending_;
  std::unordered_map<uint32_t, MoveOrigin> move_origins_;

  std::mutex listener_mutex_;
  std::vector<Listener> listeners_;
};
