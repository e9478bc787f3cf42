#pragma once

#include "log.hpp"
#include "settings_manager.hpp"

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

class ChangeWatcher;
class FileOperations;
class Hub;
class PolicyStore;
class PushSender;
class SessionRegistry;

// Owns the event loop, the listening socket and every long lived component.
class HubEngine {
public:
  struct Options {
    std::filesystem::path state_dir = default_state_dir();
    // SIGINT/SIGTERM stop the engine, SIGHUP reloads the sandbox policy.
    bool handle_signals = false;
    std::chrono::seconds purge_interval{30};
    // Defaults to ExpoPushSender.
    std::shared_ptr<PushSender> push_sender;
  };

  HubEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~HubEngine();

  void start();
  void run();
  void start_background();
  void stop();

  // Re-reads the settings file and publishes a new sandbox policy.
  void reload_policy();

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<Hub> hub() const { return hub_; }

  struct Stats {
    std::size_t connections = 0;
    std::size_t clients = 0;
    std::size_t live_sessions = 0;
    std::size_t recent_sessions = 0;
    std::size_t watched_directories = 0;
  };

  Stats stats() const;

  uint16_t listen_port() const { return listen_port_; }
  const std::string& device_id() const { return device_id_; }
  const std::filesystem::path& state_dir() const { return options_.state_dir; }

private:
  using tcp = asio::ip::tcp;

  void start_accept();
  void schedule_purge();
  void wait_for_signal();
  void ensure_state_dir() const;
  std::string load_device_id();
  void write_state_files();
  void remove_state_files();

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<asio::thread_pool> workers_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::unique_ptr<asio::steady_timer> purge_timer_;
  std::unique_ptr<asio::signal_set> signals_;
  std::shared_ptr<PolicyStore> policy_;
  std::shared_ptr<FileOperations> files_;
  std::shared_ptr<ChangeWatcher> watcher_;
  std::shared_ptr<SessionRegistry> sessions_;
  std::shared_ptr<Hub> hub_;
  bool started_ = false;
  std::string device_id_;
  std::string listen_ip_;
  uint16_t listen_port_ = 0;
};
