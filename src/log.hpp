#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

// Debug/Info lines go to stdout and Warn/Error to stderr, timestamped.
// Print and PrintErr are bare text for command line output.
enum class LogChannel { Debug, Info, Warn, Error, Print, PrintErr };

const char* log_channel_name(LogChannel channel);
spdlog::level::level_enum log_channel_level(LogChannel channel);

// Configures the process-wide sinks. When log_file is non-empty, every
// timestamped line is also appended to a size-rotated file.
void init(bool verbose = false, const std::string& log_file = std::string());
// When false nothing reaches the process sinks; listeners still see it.
void set_log_passthrough(bool enabled);
bool log_passthrough();

// Bypasses listeners. scope prefixes the line as "[scope] ".
void emit_log_line(LogChannel channel, const std::string& scope, const std::string& message);

using LogListenerHandle = std::size_t;

// A named source of log lines. Every line is offered to the listeners first;
// a line none of them claims (returns true for) goes to the process sinks.
class Logger {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);

  void submit(LogChannel channel, const std::string& message);

  template<typename... Args>
  void write(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    submit(channel, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Info, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Warn, fmt, std::forward<Args>(args)...);
  }
  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Error, fmt, std::forward<Args>(args)...);
  }

private:
  struct Binding {
    void* user_data = nullptr;
    Listener callback;
  };

  bool offer_to_listeners(const std::string& channel,
                          spdlog::level::level_enum level,
                          const std::string& message);

  std::string name_;
  std::mutex listener_mutex_;
  std::map<LogListenerHandle, Binding> listeners_;
  LogListenerHandle next_handle_ = 1;
};

// Through logger when there is one, otherwise straight to the sinks.
template<typename... Args>
void log_to(Logger* logger, LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  auto message = fmt::format(fmt, std::forward<Args>(args)...);
  if(logger) {
    logger->submit(channel, message);
  } else {
    emit_log_line(channel, std::string(), message);
  }
}

template<typename... Args>
void print_out(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(nullptr, LogChannel::Print, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  log_to(nullptr, LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
}
