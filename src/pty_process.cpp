#include "pty_process.hpp"

#include "fs_error.hpp"
#include "path_validator.hpp"

#include <fcntl.h>
#include <poll.h>
#include <pty.h>
#include <signal.h>
#include <sys/ioctl.h>
#include <sys/wait.h>
#include <termios.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <system_error>

namespace {

int decode_wait_status(int status) {
  if(WIFEXITED(status)) return WEXITSTATUS(status);
  if(WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

[[noreturn]] void exec_child(const std::string& command,
                             const std::vector<std::string>& args,
                             const std::filesystem::path& working_dir) {
  if(!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
    std::fprintf(stderr, "ttyhub: cannot enter %s: %s\n", working_dir.c_str(), std::strerror(errno));
    _exit(127);
  }
  setenv("TERM", "xterm-256color", 1);

  std::vector<char*> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char*>(command.c_str()));
  for(const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);

  execvp(command.c_str(), argv.data());
  std::fprintf(stderr, "ttyhub: cannot run %s: %s\n", command.c_str(), std::strerror(errno));
  _exit(127);
}

} // namespace

std::unique_ptr<PtyProcess> PtyProcess::spawn(const std::string& command,
                                              const std::vector<std::string>& args,
                                              const std::filesystem::path& working_dir,
                                              uint16_t cols,
                                              uint16_t rows,
                                              std::shared_ptr<Logger> logger) {
  winsize ws{};
  ws.ws_col = cols ? cols : 80;
  ws.ws_row = rows ? rows : 24;

  // wakes the reader when input is queued; close-on-exec keeps it from the child
  int wake[2] = {-1, -1};
  if(pipe2(wake, O_NONBLOCK | O_CLOEXEC) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe2");
  }

  int master = -1;
  pid_t child = forkpty(&master, nullptr, nullptr, &ws);
  if(child < 0) {
    int err = errno;
    close(wake[0]);
    close(wake[1]);
    throw std::system_error(err, std::generic_category(), "forkpty");
  }
  if(child == 0) {
    exec_child(command, args, working_dir);
  }

  int flags = fcntl(master, F_GETFL, 0);
  if(flags >= 0) fcntl(master, F_SETFL, flags | O_NONBLOCK);
  fcntl(master, F_SETFD, FD_CLOEXEC);

  auto proc = std::unique_ptr<PtyProcess>(new PtyProcess(child, master, wake, std::move(logger)));
  proc->logger_->info("spawned '{}' pid {} ({}x{})", command, child, ws.ws_col, ws.ws_row);
  return proc;
}

PtyProcess::PtyProcess(pid_t pid, int master_fd, int wake_fds[2], std::shared_ptr<Logger> logger)
  : pid_(pid),
    master_fd_(master_fd),
    wake_read_fd_(wake_fds[0]),
    wake_write_fd_(wake_fds[1]),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("pty")),
    exit_future_(exit_promise_.get_future().share()) {}

PtyProcess::~PtyProcess() {
  if(!exited_) {
    terminate();
  }
  stop_ = true;
  if(reader_.joinable()) {
    // the exit handler may drop the last reference from the reader itself
    if(reader_.get_id() == std::this_thread::get_id()) reader_.detach();
    else reader_.join();
  }
  if(!started_ && !exited_) {
    int code = reap();
    exit_promise_.set_value(code);
  }
  release_fds();
}

void PtyProcess::release_fds() {
  std::lock_guard lg(io_mutex_);
  for(int* fd : {&master_fd_, &wake_read_fd_, &wake_write_fd_}) {
    if(*fd >= 0) {
      close(*fd);
      *fd = -1;
    }
  }
  pending_.clear();
}

void PtyProcess::start(OutputHandler on_output, ExitHandler on_exit) {
  if(started_) return;
  started_ = true;
  on_output_ = std::move(on_output);
  on_exit_ = std::move(on_exit);
  reader_ = std::thread([this]{ reader_loop(); });
}

int PtyProcess::reap() {
  int status = 0;
  for(;;) {
    pid_t r = waitpid(pid_, &status, 0);
    if(r == pid_) break;
    if(r < 0 && errno == EINTR) continue;
    exited_ = true;
    return -1;
  }
  exited_ = true;
  return decode_wait_status(status);
}

void PtyProcess::reader_loop() {
  std::string buf(kReadChunkBytes, '\0');
  while(!stop_) {
    pollfd fds[2];
    {
      std::lock_guard lg(io_mutex_);
      fds[0] = {master_fd_, static_cast<short>(POLLIN | (pending_.empty() ? 0 : POLLOUT)), 0};
    }
    fds[1] = {wake_read_fd_, POLLIN, 0};
    int rc = poll(fds, 2, 100);
    if(rc < 0) {
      if(errno == EINTR) continue;
      logger_->error("pty poll failed: {}", std::strerror(errno));
      break;
    }
    if(rc == 0) continue;
    if(fds[1].revents & POLLIN) drain_wake_pipe();
    if(fds[0].revents & POLLOUT) flush_pending();
    if(!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

    ssize_t n = read(master_fd_, buf.data(), buf.size());
    if(n > 0) {
      if(on_output_) on_output_(std::string(buf.data(), static_cast<std::size_t>(n)));
      continue;
    }
    if(n < 0 && (errno == EAGAIN || errno == EINTR)) continue;
    // EOF, or EIO once the slave side is closed
    break;
  }

  int code = reap();
  release_fds();
  logger_->info("pid {} exited with {}", pid_, code);
  auto on_exit = on_exit_;
  exit_promise_.set_value(code);
  if(on_exit) on_exit(code);
}

void PtyProcess::drain_wake_pipe() {
  char sink[64];
  while(read(wake_read_fd_, sink, sizeof(sink)) > 0) {
  }
}

void PtyProcess::flush_pending() {
  std::lock_guard lg(io_mutex_);
  while(!pending_.empty()) {
    ssize_t n = write(master_fd_, pending_.data(), pending_.size());
    if(n > 0) {
      pending_.erase(0, static_cast<std::size_t>(n));
      continue;
    }
    if(n < 0 && errno == EINTR) continue;
    if(n < 0 && errno == EAGAIN) return;
    logger_->warn("pty write for pid {} failed: {}", pid_, std::strerror(errno));
    pending_.clear();
    return;
  }
}

bool PtyProcess::write_input(std::string_view bytes) {
  std::lock_guard lg(io_mutex_);
  if(master_fd_ < 0 || exited_) return false;
  if(pending_.size() + bytes.size() > kMaxPendingInput) {
    logger_->warn("input for pid {} dropped: {} bytes already pending", pid_, pending_.size());
    return false;
  }
  pending_.append(bytes.data(), bytes.size());
  // EAGAIN means the pipe is full, so a wakeup is already pending
  const char wake = 1;
  if(write(wake_write_fd_, &wake, 1) < 0 && errno != EAGAIN) {
    logger_->warn("cannot wake pty reader for pid {}: {}", pid_, std::strerror(errno));
  }
  return true;
}

std::size_t PtyProcess::pending_input() const {
  std::lock_guard lg(io_mutex_);
  return pending_.size();
}

void PtyProcess::resize(uint16_t cols, uint16_t rows) {
  if(cols == 0 || rows == 0) return;
  winsize ws{};
  ws.ws_col = cols;
  ws.ws_row = rows;
  {
    std::lock_guard lg(io_mutex_);
    if(master_fd_ < 0) return;
    if(ioctl(master_fd_, TIOCSWINSZ, &ws) != 0) {
      logger_->warn("TIOCSWINSZ failed for pid {}: {}", pid_, std::strerror(errno));
      return;
    }
  }
  pid_t group = getpgid(pid_);
  if(group > 0) {
    kill(-group, SIGWINCH);
  } else {
    kill(pid_, SIGWINCH);
  }
}

bool PtyProcess::wait_exit_for(std::chrono::milliseconds timeout) {
  if(started_) {
    return exit_future_.wait_for(timeout) == std::future_status::ready;
  }
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if(r == pid_) {
      exited_ = true;
      exit_promise_.set_value(decode_wait_status(status));
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  return false;
}

void PtyProcess::terminate() {
  if(exited_) return;
  using namespace std::chrono_literals;
  const int signals[] = {SIGHUP, SIGTERM, SIGKILL};
  const std::chrono::milliseconds grace[] = {500ms, 1000ms, 2000ms};
  for(std::size_t i = 0; i < 3; ++i) {
    if(exited_) return;
    // forkpty made the child a session leader, so its pid is also the group id
    if(kill(-pid_, signals[i]) != 0 && kill(pid_, signals[i]) != 0 && errno == ESRCH) return;
    if(wait_exit_for(grace[i])) return;
  }
  logger_->warn("pid {} survived SIGKILL", pid_);
}

const std::vector<std::string>& default_spawn_allow_list() {
  static const std::vector<std::string> commands = {
    "claude", "codex", "gemini", "opencode", "bash", "zsh", "sh", "fish", "nu", "pwsh",
    "python", "python3", "node", "ruby"
  };
  return commands;
}

bool is_spawn_command_allowed(const std::string& command,
                              const std::vector<std::string>& extra_allowed) {
  auto base = std::filesystem::path(command).filename().string();
  if(base.empty()) return false;
  const auto& defaults = default_spawn_allow_list();
  return std::find(defaults.begin(), defaults.end(), base) != defaults.end() ||
         std::find(extra_allowed.begin(), extra_allowed.end(), base) != extra_allowed.end();
}

bool is_shell_safe(std::string_view value) {
  for(char ch : value) {
    switch(ch) {
      case '\n': case '\r': case '\0': case '`': case ';': case '|': case '&':
        return false;
      default:
        break;
    }
  }
  return value.find("$(") == std::string_view::npos;
}

bool validate_spawn_request(const SpawnRequest& request,
                            const std::vector<std::string>& extra_allowed,
                            const PathValidator* validator,
                            std::string& error) {
  if(request.command.empty()) {
    error = "Command must not be empty";
    return false;
  }
  if(!is_spawn_command_allowed(request.command, extra_allowed)) {
    error = "Command '" + request.command + "' is not in the allowed list";
    return false;
  }
  if(!is_shell_safe(request.command) || !is_shell_safe(request.name)) {
    error = "Command or name contains unsafe characters";
    return false;
  }
  for(const auto& arg : request.args) {
    if(!is_shell_safe(arg)) {
      error = "Argument contains unsafe characters";
      return false;
    }
  }
  if(request.working_dir.empty()) return true;

  std::filesystem::path dir(request.working_dir);
  std::error_code ec;
  if(!dir.is_absolute()) {
    error = "Working directory must be absolute";
    return false;
  }
  if(!std::filesystem::is_directory(dir, ec)) {
    error = "Working directory does not exist";
    return false;
  }
  if(validator) {
    try {
      validator->validate_existing(request.working_dir);
    } catch(const FsError& e) {
      error = std::string("Working directory rejected: ") + e.what();
      return false;
    }
  }
  return true;
}
