#pragma once

#include "broadcast_channel.hpp"
#include "wait_state_detector.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

class PtyProcess;

struct WaitState {
  WaitEvent event;
  std::string since;  // RFC 3339
};

// One terminal-bound process, whether it runs inside a wrapper or was
// spawned by the hub. All members are guarded by the session mutex.
class Session {
public:
  // Returns false when the bytes were not accepted.
  using InputSink = std::function<bool(const std::string& bytes)>;
  using ResizeSink = std::function<void(uint16_t cols, uint16_t rows)>;

  Session(std::string id,
          std::string name,
          std::string command,
          std::string project_path,
          std::size_t scrollback_bytes);
  ~Session();

  const std::string& id() const { return id_; }
  std::string name() const;
  void set_name(std::string name);
  const std::string& command() const { return command_; }
  const std::string& project_path() const { return project_path_; }
  const std::string& started_at() const { return started_at_; }

  bool alive() const;
  std::optional<int> exit_code() const;
  std::optional<std::chrono::steady_clock::time_point> ended_at() const;

  CliType cli_type() const;
  ApprovalModel approval_model() const;
  std::optional<WaitState> wait_state() const;

  // Appends to scrollback, runs the wait detector and publishes the chunk to
  // subscribers, in that order, under one lock.
  std::optional<WaitTransition> handle_output(const std::string& bytes);
  // Keystrokes from any source clear a pending wait.
  std::optional<WaitTransition> note_input();
  WaitTransition mark_ended(int exit_code);

  // Subscribes and returns the scrollback as of the subscription, so replay
  // and live output neither overlap nor leave a gap.
  std::string subscribe(uint64_t viewer_id, BroadcastChannel<std::string>::Callback callback);
  // Returns the number of viewers left.
  std::size_t unsubscribe(uint64_t viewer_id);
  bool is_subscribed(uint64_t viewer_id) const;
  std::size_t viewer_count() const;

  // Tail of the scrollback (at most max_bytes) and the full scrollback size.
  std::pair<std::string, std::size_t> history(std::optional<std::size_t> max_bytes) const;

  void set_sinks(InputSink input, ResizeSink resize);
  // Returns false when the session has ended, nothing is attached or the
  // sink refused the bytes. Never blocks.
  bool send_input(const std::string& bytes);
  bool resize(uint16_t cols, uint16_t rows);

  // Sessions spawned by the hub own their process.
  void attach_process(std::unique_ptr<PtyProcess> process);
  void terminate_process();

  nlohmann::json to_json(uint16_t port) const;

private:
  const std::string id_;
  const std::string command_;
  const std::string project_path_;
  const std::string started_at_;
  const std::size_t scrollback_limit_;

  mutable std::mutex m_;
  std::string name_;
  bool alive_ = true;
  std::optional<int> exit_code_;
  std::optional<std::chrono::steady_clock::time_point> ended_at_;
  std::string scrollback_;
  WaitStateDetector detector_;
  std::optional<WaitState> wait_;
  InputSink input_sink_;
  ResizeSink resize_sink_;
  std::unique_ptr<PtyProcess> process_;
  BroadcastChannel<std::string> output_;
};

// Live sessions plus recently ended ones, which stay visible for
// session_retention_seconds.
class SessionRegistry {
public:
  SessionRegistry(std::size_t scrollback_bytes, std::chrono::seconds retention);

  // Generates an id when none is given. Throws std::runtime_error when a live
  // session already uses the id.
  std::shared_ptr<Session> create(std::string id,
                                  std::string name,
                                  std::string command,
                                  std::string project_path);

  std::shared_ptr<Session> find(const std::string& id) const;
  std::shared_ptr<Session> find_live(const std::string& id) const;

  // Marks the session ended and moves it to the recent list.
  std::shared_ptr<Session> end(const std::string& id, int exit_code);
  bool rename(const std::string& id, const std::string& new_name);

  std::vector<std::shared_ptr<Session>> live() const;
  std::size_t live_count() const;
  std::size_t recent_count() const;

  // Drops recent sessions older than the retention window.
  std::size_t purge_expired(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

  nlohmann::json list_json(uint16_t port) const;
  // Writes the live session list; returns false when the file cannot be written.
  bool persist(const std::filesystem::path& file, uint16_t port) const;

private:
  std::size_t scrollback_bytes_;
  std::chrono::seconds retention_;

  mutable std::mutex m_;
  std::map<std::string, std::shared_ptr<Session>> live_;
  std::map<std::string, std::shared_ptr<Session>> recent_;
};
