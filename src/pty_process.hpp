#pragma once

#include "log.hpp"

#include <sys/types.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

class PathValidator;

// A child process attached to a pseudo-terminal. Output is read on a
// dedicated thread and handed to the OutputHandler in arrival order.
class PtyProcess {
public:
  using OutputHandler = std::function<void(std::string chunk)>;
  using ExitHandler = std::function<void(int exit_code)>;

  static constexpr std::size_t kReadChunkBytes = 64 * 1024;
  static constexpr std::size_t kMaxPendingInput = 1024 * 1024;

  // Throws std::system_error when the pty or the fork cannot be created.
  static std::unique_ptr<PtyProcess> spawn(const std::string& command,
                                           const std::vector<std::string>& args,
                                           const std::filesystem::path& working_dir,
                                           uint16_t cols = 80,
                                           uint16_t rows = 24,
                                           std::shared_ptr<Logger> logger = nullptr);

  ~PtyProcess();

  PtyProcess(const PtyProcess&) = delete;
  PtyProcess& operator=(const PtyProcess&) = delete;

  void start(OutputHandler on_output, ExitHandler on_exit);

  // Queues bytes for the reader thread to write and returns at once. False
  // when the terminal is closed or kMaxPendingInput would be exceeded.
  bool write_input(std::string_view bytes);
  std::size_t pending_input() const;
  void resize(uint16_t cols, uint16_t rows);
  // SIGHUP, then SIGTERM, then SIGKILL until the child is gone.
  void terminate();

  pid_t pid() const { return pid_; }
  bool running() const { return !exited_; }
  std::shared_future<int> wait_for_exit() const { return exit_future_; }

private:
  PtyProcess(pid_t pid, int master_fd, int wake_fds[2], std::shared_ptr<Logger> logger);

  void reader_loop();
  void flush_pending();
  void drain_wake_pipe();
  // Closes the master and the wake pipe; later writes and resizes fail.
  void release_fds();
  int reap();
  bool wait_exit_for(std::chrono::milliseconds timeout);

  pid_t pid_;
  int master_fd_;
  int wake_read_fd_;
  int wake_write_fd_;
  std::shared_ptr<Logger> logger_;
  std::thread reader_;
  std::atomic<bool> stop_{false};
  std::atomic<bool> exited_{false};
  bool started_ = false;
  // guards the fds against release and the pending input
  mutable std::mutex io_mutex_;
  std::string pending_;
  std::promise<int> exit_promise_;
  std::shared_future<int> exit_future_;
  OutputHandler on_output_;
  ExitHandler on_exit_;
};

struct SpawnRequest {
  std::string command;
  std::vector<std::string> args;
  std::string name;
  std::string working_dir;
};

// Commands a remote client may launch without further configuration.
const std::vector<std::string>& default_spawn_allow_list();

bool is_spawn_command_allowed(const std::string& command,
                              const std::vector<std::string>& extra_allowed);

// Rejects strings that could smuggle a second command through a shell.
bool is_shell_safe(std::string_view value);

// Checks a remote spawn. On failure returns false and fills error. When
// validator is given, working_dir must also be inside the sandbox.
bool validate_spawn_request(const SpawnRequest& request,
                            const std::vector<std::string>& extra_allowed,
                            const PathValidator* validator,
                            std::string& error);
