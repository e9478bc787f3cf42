#include "log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <vector>

namespace {

constexpr std::size_t kLogFileMaxBytes = 5 * 1024 * 1024;
constexpr std::size_t kLogFileCount = 3;
constexpr const char* kTimestampPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

struct DefaultLoggers {
  std::shared_ptr<spdlog::logger> info;
  std::shared_ptr<spdlog::logger> error;
  std::shared_ptr<spdlog::logger> print;
  std::shared_ptr<spdlog::logger> print_err;
  spdlog::sink_ptr file_sink;
  std::string file_path;
};

DefaultLoggers g_loggers;
std::mutex g_init_mutex;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const char* name, spdlog::sink_ptr sink) {
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  spdlog::register_logger(logger);
  return logger;
}

void create_loggers_locked() {
  if(g_loggers.info) return;

  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern(kTimestampPattern);

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern(kTimestampPattern);

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_loggers.info = make_logger("ttyhub.info", std::move(info_sink));
  g_loggers.error = make_logger("ttyhub.error", std::move(error_sink));
  g_loggers.print = make_logger("ttyhub.print", std::move(plain_out_sink));
  g_loggers.print_err = make_logger("ttyhub.print_err", std::move(plain_err_sink));

  g_loggers.info->flush_on(spdlog::level::warn);
  g_loggers.error->flush_on(spdlog::level::err);
  g_loggers.print->flush_on(spdlog::level::info);
  g_loggers.print_err->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  std::lock_guard<std::mutex> lock(g_init_mutex);
  create_loggers_locked();
}

// Attaches (or replaces) the rotating file sink on the timestamped loggers.
void attach_file_sink_locked(const std::string& path) {
  if(path == g_loggers.file_path) return;
  for(auto* logger : {g_loggers.info.get(), g_loggers.error.get()}) {
    auto& sinks = logger->sinks();
    if(g_loggers.file_sink) {
      sinks.erase(std::remove(sinks.begin(), sinks.end(), g_loggers.file_sink), sinks.end());
    }
  }
  g_loggers.file_sink.reset();
  g_loggers.file_path = path;
  if(path.empty()) return;

  try {
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, kLogFileMaxBytes, kLogFileCount);
    sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    g_loggers.file_sink = sink;
    g_loggers.info->sinks().push_back(sink);
    g_loggers.error->sinks().push_back(sink);
  } catch(const spdlog::spdlog_ex& e) {
    g_loggers.file_path.clear();
    g_loggers.error->error("Unable to open log file {}: {}", path, e.what());
  }
}

} // namespace

const char* log_channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return "debug";
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum log_channel_level(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Info:
    case LogChannel::Print: return spdlog::level::info;
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
  }
  return spdlog::level::info;
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose, const std::string& log_file) {
  std::lock_guard<std::mutex> lock(g_init_mutex);
  create_loggers_locked();
  attach_file_sink_locked(log_file);

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_loggers.info->set_level(level);
  g_loggers.error->set_level(spdlog::level::info);
  g_loggers.print->set_level(spdlog::level::info);
  g_loggers.print_err->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_loggers.info);
  spdlog::set_level(level);
}

void emit_log_line(LogChannel channel, const std::string& scope, const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = nullptr;
  switch(channel) {
    case LogChannel::Print: sink = g_loggers.print.get(); break;
    case LogChannel::PrintErr: sink = g_loggers.print_err.get(); break;
    case LogChannel::Warn:
    case LogChannel::Error: sink = g_loggers.error.get(); break;
    case LogChannel::Debug:
    case LogChannel::Info: sink = g_loggers.info.get(); break;
  }
  if(!sink) return;
  if(scope.empty()) {
    sink->log(log_channel_level(channel), message);
  } else {
    sink->log(log_channel_level(channel), fmt::format("[{}] {}", scope, message));
  }
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto handle = next_handle_++;
  listeners_.emplace(handle, Binding{user_data, std::move(listener)});
  return handle;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::submit(LogChannel channel, const std::string& message) {
  const std::string channel_name = name_.empty()
    ? std::string(log_channel_name(channel))
    : name_ + ":" + log_channel_name(channel);
  if(offer_to_listeners(channel_name, log_channel_level(channel), message)) return;
  emit_log_line(channel, name_, message);
}

bool Logger::offer_to_listeners(const std::string& channel,
                                spdlog::level::level_enum level,
                                const std::string& message) {
  std::vector<Binding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) snapshot.push_back(entry.second);
  }
  bool claimed = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback(binding.user_data, channel, level, message)) claimed = true;
    } catch(const std::exception& e) {
      emit_log_line(LogChannel::Error, channel, fmt::format("log listener threw: {}", e.what()));
    }
  }
  return claimed;
}
