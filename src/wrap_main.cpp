#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <atomic>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "wrapper_client.hpp"

namespace {

const nlohmann::json WRAP_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","host"},       {"aliases", {"H"}},          {"type","string"}, {"default","127.0.0.1"}, {"description","Hub address"}, {"persistent", false}},
  {{"key","port"},       {"aliases", {"p"}},          {"type","int"},    {"default",0}, {"min",0}, {"max",65535}, {"description","Hub port (default: the running daemon's port)"}, {"persistent", false}},
  {{"key","name"},       {"aliases", {"n"}},          {"type","string"}, {"default",""},          {"description","Session name shown to clients"}, {"persistent", false}},
  {{"key","session_id"}, {"aliases", {"id"}},         {"type","string"}, {"default",""},          {"description","Session id to register (default: generated)"}, {"persistent", false}},
  {{"key","verbose"},    {"aliases", {"v"}},          {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}, {"persistent", false}},
  {{"key","help"},       {"aliases", {"h","?"}},      {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}}
});

// Puts the local terminal into raw mode for the lifetime of the object.
class RawTerminal {
public:
  explicit RawTerminal(int fd) : fd_(fd) {
    if(!::isatty(fd_) || ::tcgetattr(fd_, &saved_) != 0) return;
    struct termios raw = saved_;
    ::cfmakeraw(&raw);
    active_ = ::tcsetattr(fd_, TCSANOW, &raw) == 0;
  }
  ~RawTerminal() {
    if(active_) ::tcsetattr(fd_, TCSANOW, &saved_);
  }
  RawTerminal(const RawTerminal&) = delete;
  RawTerminal& operator=(const RawTerminal&) = delete;

private:
  int fd_;
  struct termios saved_{};
  bool active_ = false;
};

uint16_t daemon_port() {
  std::ifstream in(default_state_dir() / "daemon.port");
  int port = 0;
  if(in >> port && port > 0 && port <= 65535) return static_cast<uint16_t>(port);
  for(const auto& entry : SETTINGS_SPECIFICATION) {
    if(entry.at("key") == "listen_port") return static_cast<uint16_t>(entry.at("default").get<int>());
  }
  return 0;
}

std::string default_shell() {
  const char* shell = std::getenv("SHELL");
  return (shell && *shell) ? shell : "/bin/sh";
}

void watch_window_size(asio::signal_set& signals, const std::shared_ptr<WrapperClient>& client) {
  std::weak_ptr<WrapperClient> weak = client;
  signals.async_wait([&signals, weak](const std::error_code& ec, int){
    if(ec) return;
    auto client = weak.lock();
    if(!client) return;
    if(auto size = terminal_size(STDIN_FILENO)) {
      client->set_local_size(size->first, size->second);
    }
    watch_window_size(signals, client);
  });
}

} // namespace

int main(int argc, char** argv){
  try {
    SettingsManager settings(WRAP_SETTINGS_SPECIFICATION);
    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "ttyhub-wrap",
                             "run a command as a ttyhub session",
                             WRAP_SETTINGS_SPECIFICATION,
                             nlohmann::json::array());
    parser.set_accepts_trailing_command(true);
    std::vector<std::string> command;
    try {
      command = parser.parse(argc, argv, settings);
    } catch(const UsageError& e) {
      print_err("{}", e.what());
      parser.usage();
      return 2;
    }
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings.get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("wrap");

    WrapperClient::Options options;
    options.host = settings.get<std::string>("host");
    int port = settings.get<int>("port");
    options.port = port == 0 ? daemon_port() : static_cast<uint16_t>(port);
    options.name = settings.get<std::string>("name");
    options.session_id = settings.get<std::string>("session_id");
    if(command.empty()) {
      options.command = default_shell();
    } else {
      options.command = command.front();
      options.args.assign(command.begin() + 1, command.end());
    }
    if(auto size = terminal_size(STDIN_FILENO)) {
      options.cols = size->first;
      options.rows = size->second;
    }

    asio::io_context io;
    auto work = asio::make_work_guard(io);
    std::thread io_thread;

    auto client = std::make_shared<WrapperClient>(io, options, logger);
    int exit_code = 1;
    {
      RawTerminal raw(STDIN_FILENO);
      asio::signal_set winch(io, SIGWINCH);
      watch_window_size(winch, client);
      client->start();
      io_thread = std::thread([&io]{ io.run(); });

      std::atomic<bool> done{false};
      std::thread input_thread([&]{
        char buf[4096];
        struct pollfd pfd{STDIN_FILENO, POLLIN, 0};
        while(!done) {
          int ready = ::poll(&pfd, 1, 100);
          if(ready <= 0) continue;
          auto n = ::read(STDIN_FILENO, buf, sizeof(buf));
          if(n <= 0) break;
          client->write_local_input(std::string_view(buf, static_cast<std::size_t>(n)));
        }
      });

      exit_code = client->wait();
      done = true;
      input_thread.join();
      std::error_code ec;
      winch.cancel(ec);
    }

    work.reset();
    io.stop();
    io_thread.join();
    return exit_code;
  } catch(std::exception& e) {
    init(false);
    Logger logger("ttyhub-wrap");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
