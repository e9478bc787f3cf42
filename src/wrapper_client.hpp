#pragma once

#include "connection.hpp"
#include "log.hpp"
#include "pty_process.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <unistd.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Runs one command in a PTY, mirrors it to the local terminal and registers
// it with the hub as a session. The command keeps running when the hub is
// unreachable.
class WrapperClient : public ConnectionHandler, public std::enable_shared_from_this<WrapperClient> {
public:
  struct Options {
    std::string host = "127.0.0.1";
    uint16_t port = 9847;
    std::string session_id;
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::filesystem::path working_dir = std::filesystem::current_path();
    uint16_t cols = 80;
    uint16_t rows = 24;
    std::size_t max_message_bytes = 96 * 1024 * 1024;
    // Output is copied here as well; -1 disables the mirror.
    int mirror_fd = STDOUT_FILENO;
  };

  // Output produced before the hub confirms registration is kept up to this size.
  static constexpr std::size_t kPendingOutputLimit = 64 * 1024;

  WrapperClient(asio::io_context& io, Options options, std::shared_ptr<Logger> logger = nullptr);
  ~WrapperClient() override;

  // Spawns the command and dials the hub. Throws std::system_error when the
  // PTY cannot be created.
  void start();
  // Blocks until the command exits and the hub has been told; returns the exit code.
  int wait();
  bool wait_until_registered(std::chrono::milliseconds timeout);

  // Keystrokes typed into the local terminal.
  void write_local_input(std::string_view bytes);
  // The local terminal changed size.
  void set_local_size(uint16_t cols, uint16_t rows);

  std::string session_id() const;
  bool registered() const;

  void on_message(const std::shared_ptr<Connection>& conn, const nlohmann::json& message) override;
  void on_invalid_message(const std::shared_ptr<Connection>& conn, const std::string& reason) override;
  void on_closed(const std::shared_ptr<Connection>& conn) override;

private:
  void connect();
  void handle_output(std::string chunk);
  void handle_exit(int exit_code);
  void forward_output(const std::string& chunk);
  void mirror(std::string_view bytes);
  void mark_hub_done();

  asio::io_context& io_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<PtyProcess> process_;

  // io thread only
  std::shared_ptr<Connection> conn_;
  std::string pending_output_;

  mutable std::mutex m_;
  std::condition_variable cv_;
  std::string session_id_;
  bool registered_ = false;
  bool hub_done_ = false;
  uint16_t local_cols_ = 80;
  uint16_t local_rows_ = 24;
};

// Size of the terminal on fd, if it is one.
std::optional<std::pair<uint16_t, uint16_t>> terminal_size(int fd);
