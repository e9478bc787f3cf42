#include "change_watcher.hpp"

#include "fs_error.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace fs = std::filesystem;

namespace {

constexpr uint32_t kWatchMask = IN_CREATE | IN_DELETE | IN_MODIFY | IN_CLOSE_WRITE |
                                IN_MOVED_FROM | IN_MOVED_TO | IN_ATTRIB | IN_DELETE_SELF;

std::string key_for(const fs::path& dir) {
  auto normal = dir.lexically_normal().string();
  while(normal.size() > 1 && normal.back() == '/') normal.pop_back();
  return normal;
}

} // namespace

const char* change_kind_name(ChangeKind kind) {
  switch(kind) {
    case ChangeKind::Created: return "created";
    case ChangeKind::Modified: return "modified";
    case ChangeKind::Deleted: return "deleted";
    case ChangeKind::Renamed: return "renamed";
  }
  return "modified";
}

ChangeWatcher::ChangeWatcher(std::chrono::milliseconds debounce, std::shared_ptr<Logger> logger)
  : debounce_(debounce.count() > 0 ? debounce : std::chrono::milliseconds(1)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("watcher")) {}

ChangeWatcher::~ChangeWatcher() {
  stop();
}

void ChangeWatcher::start() {
  if(running_) return;
  inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if(inotify_fd_ < 0) {
    throw std::system_error(errno, std::generic_category(), "inotify_init1");
  }
  if(pipe2(wake_pipe_, O_NONBLOCK | O_CLOEXEC) != 0) {
    int err = errno;
    close(inotify_fd_);
    inotify_fd_ = -1;
    throw std::system_error(err, std::generic_category(), "pipe2");
  }
  running_ = true;
  thread_ = std::thread([this]{ run(); });
}

void ChangeWatcher::stop() {
  if(!running_.exchange(false)) return;
  char byte = 1;
  if(write(wake_pipe_[1], &byte, 1) < 0) {
    logger_->debug("watcher wake write failed: {}", std::strerror(errno));
  }
  if(thread_.joinable()) thread_.join();

  std::lock_guard lg(m_);
  for(auto& kv : wd_by_path_) {
    inotify_rm_watch(inotify_fd_, kv.second);
  }
  wd_by_path_.clear();
  path_by_wd_.clear();
  refs_.clear();
  pending_.clear();
  move_origins_.clear();
  close(inotify_fd_);
  close(wake_pipe_[0]);
  close(wake_pipe_[1]);
  inotify_fd_ = -1;
  wake_pipe_[0] = wake_pipe_[1] = -1;
}

bool ChangeWatcher::watch(const fs::path& dir) {
  auto key = key_for(dir);
  std::lock_guard lg(m_);
  if(inotify_fd_ < 0) {
    throw FsError::io_error("change watcher is not running");
  }
  // the same inode yields the same wd; a directory recreated under this
  // path yields a new one, whether or not its IN_IGNORED was seen yet
  int wd = inotify_add_watch(inotify_fd_, key.c_str(), kWatchMask);
  if(wd < 0) {
    throw FsError::from_error_code(std::error_code(errno, std::generic_category()), key);
  }
  ++refs_[key];
  auto old = wd_by_path_.find(key);
  if(old != wd_by_path_.end() && old->second == wd) return false;
  if(old != wd_by_path_.end()) {
    path_by_wd_.erase(old->second);
  }
  wd_by_path_[key] = wd;
  path_by_wd_[wd] = key;
  logger_->debug("watching {} (wd {})", key, wd);
  return true;
}

bool ChangeWatcher::unwatch(const fs::path& dir) {
  auto key = key_for(dir);
  std::lock_guard lg(m_);
  auto it = refs_.find(key);
  if(it == refs_.end()) return false;
  if(--it->second > 0) return false;
  refs_.erase(it);
  auto wd_it = wd_by_path_.find(key);
  if(wd_it != wd_by_path_.end()) {
    inotify_rm_watch(inotify_fd_, wd_it->second);
    path_by_wd_.erase(wd_it->second);
    wd_by_path_.erase(wd_it);
  }
  logger_->debug("stopped watching {}", key);
  return true;
}

std::size_t ChangeWatcher::reference_count(const fs::path& dir) const {
  std::lock_guard lg(m_);
  auto it = refs_.find(key_for(dir));
  return it == refs_.end() ? 0 : it->second;
}

std::size_t ChangeWatcher::watch_count() const {
  std::lock_guard lg(m_);
  return wd_by_path_.size();
}

void ChangeWatcher::add_listener(Listener listener) {
  std::lock_guard lg(listener_mutex_);
  listeners_.push_back(std::move(listener));
}

int ChangeWatcher::poll_timeout_ms() const {
  std::lock_guard lg(m_);
  if(pending_.empty() && move_origins_.empty()) return 1000;
  return static_cast<int>(std::max<std::chrono::milliseconds::rep>(debounce_.count() / 4, 5));
}

void ChangeWatcher::run() {
  while(running_) {
    pollfd fds[2];
    fds[0] = {inotify_fd_, POLLIN, 0};
    fds[1] = {wake_pipe_[0], POLLIN, 0};
    int rc = poll(fds, 2, poll_timeout_ms());
    if(rc < 0 && errno != EINTR) {
      logger_->error("watcher poll failed: {}", std::strerror(errno));
      break;
    }
    if(!running_) break;
    if(rc > 0 && (fds[0].revents & POLLIN)) {
      drain();
    }
    deliver(collect_due(Clock::now()));
  }
}

void ChangeWatcher::drain() {
  alignas(inotify_event) char buf[16 * 1024];
  for(;;) {
    ssize_t n = read(inotify_fd_, buf, sizeof(buf));
    if(n < 0) {
      if(errno == EINTR) continue;
      if(errno != EAGAIN) {
        logger_->warn("inotify read failed: {}", std::strerror(errno));
      }
      return;
    }
    if(n == 0) return;
    auto now = Clock::now();
    std::lock_guard lg(m_);
    for(char* p = buf; p < buf + n; ) {
      auto* ev = reinterpret_cast<inotify_event*>(p);
      p += sizeof(inotify_event) + ev->len;

      if(ev->mask & IN_Q_OVERFLOW) {
        logger_->warn("inotify queue overflow, some changes were dropped");
        continue;
      }
      auto dir_it = path_by_wd_.find(ev->wd);
      if(dir_it == path_by_wd_.end()) continue;
      const std::string dir = dir_it->second;

      if(ev->mask & IN_IGNORED) {
        // the directory is gone; the next watch() of the path installs a new wd
        auto wd_it = wd_by_path_.find(dir);
        if(wd_it != wd_by_path_.end() && wd_it->second == ev->wd) wd_by_path_.erase(wd_it);
        path_by_wd_.erase(ev->wd);
        continue;
      }
      std::string path = dir;
      if(ev->len > 0 && ev->name[0] != '\0') {
        path = (fs::path(dir) / ev->name).string();
      }
      record(path, ev->mask, ev->cookie, now);
    }
  }
}

void ChangeWatcher::record(const std::string& path, uint32_t mask, uint32_t cookie, Clock::time_point now) {
  if(mask & IN_MOVED_FROM) {
    move_origins_[cookie] = MoveOrigin{path, now};
    return;
  }
  bool inserted = pending_.find(path) == pending_.end();
  auto& pending = pending_[path];
  pending.last_event = now;

  if(mask & IN_MOVED_TO) {
    auto origin = move_origins_.find(cookie);
    if(origin != move_origins_.end()) {
      pending.renamed_from = origin->second.path;
      pending_.erase(origin->second.path);
      move_origins_.erase(origin);
    } else if(inserted) {
      pending.first_was_create = true;
    }
    return;
  }
  if(inserted && (mask & IN_CREATE)) {
    pending.first_was_create = true;
  }
}

std::vector<ChangeEvent> ChangeWatcher::collect_due(Clock::time_point now) {
  std::vector<ChangeEvent> out;
  std::lock_guard lg(m_);

  // a move whose destination never showed up left the watched directory
  for(auto it = move_origins_.begin(); it != move_origins_.end(); ) {
    if(now - it->second.when >= debounce_) {
      auto& pending = pending_[it->second.path];
      pending.last_event = it->second.when;
      it = move_origins_.erase(it);
    } else {
      ++it;
    }
  }

  for(auto it = pending_.begin(); it != pending_.end(); ) {
    if(now - it->second.last_event < debounce_) {
      ++it;
      continue;
    }
    std::error_code ec;
    bool exists = fs::symlink_status(it->first, ec).type() != fs::file_type::not_found && !ec;
    const Pending& p = it->second;
    ChangeEvent ev;
    ev.path = it->first;
    if(p.renamed_from && exists) {
      ev.kind = ChangeKind::Renamed;
      ev.from = p.renamed_from;
      out.push_back(std::move(ev));
    } else if(exists) {
      ev.kind = p.first_was_create ? ChangeKind::Created : ChangeKind::Modified;
      out.push_back(std::move(ev));
    } else if(!p.first_was_create) {
      ev.kind = ChangeKind::Deleted;
      out.push_back(std::move(ev));
    }
    it = pending_.erase(it);
  }
  return out;
}

void ChangeWatcher::deliver(const std::vector<ChangeEvent>& events) {
  if(events.empty()) return;
  std::vector<Listener> listeners;
  {
    std::lock_guard lg(listener_mutex_);
    listeners = listeners_;
  }
  for(const auto& ev : events) {
    logger_->debug("{} {}", change_kind_name(ev.kind), ev.path);
    for(auto& listener : listeners) {
      try {
        listener(ev);
      } catch(const std::exception& e) {
        logger_->error("change listener failed for {}: {}", ev.path, e.what());
      }
    }
  }
}
