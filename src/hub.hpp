#pragma once

#include "connection.hpp"
#include "log.hpp"
#include "push_notifier.hpp"
#include "rate_limiter.hpp"
#include "session_registry.hpp"

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

class ChangeWatcher;
class FileOperations;
struct ChangeEvent;

struct HubOptions {
  std::string auth_token;
  bool require_auth = false;
  std::string device_id;
  std::string device_name;
  double rate_limit_rps = 100;
  double rate_limit_burst = 50;
  std::size_t max_message_bytes = 96 * 1024 * 1024;
  std::vector<std::string> spawn_allowed_commands;
  bool push_enabled = true;
  // where the live session list is mirrored; empty disables it
  std::filesystem::path sessions_file;
};

// Routes messages between wrappers, remote clients, sessions and the
// filesystem. Protocol handling runs on the io thread; filesystem work runs
// on the worker pool and its replies are posted back.
class Hub : public ConnectionHandler, public std::enable_shared_from_this<Hub> {
public:
  Hub(asio::io_context& io,
      asio::thread_pool& workers,
      HubOptions options,
      std::shared_ptr<SessionRegistry> sessions,
      std::shared_ptr<FileOperations> files,
      std::shared_ptr<ChangeWatcher> watcher,
      std::shared_ptr<PushSender> push,
      std::shared_ptr<Logger> logger);

  // Hooks the change watcher up; call once after construction.
  void start();
  void accept(asio::ip::tcp::socket socket);
  // Closes every connection and stops spawned processes.
  void shutdown();

  void set_listen_port(uint16_t port) { listen_port_ = port; }
  uint16_t listen_port() const { return listen_port_; }

  void on_message(const std::shared_ptr<Connection>& conn, const nlohmann::json& message) override;
  void on_invalid_message(const std::shared_ptr<Connection>& conn, const std::string& reason) override;
  void on_closed(const std::shared_ptr<Connection>& conn) override;

  std::size_t connection_count() const;
  std::size_t identified_client_count() const;
  std::vector<PushToken> push_tokens() const;
  std::shared_ptr<SessionRegistry> sessions() const { return sessions_; }

private:
  enum class Kind { Undetermined, Wrapper, Client };

  struct ClientState {
    ClientState(std::shared_ptr<Connection> c, double rps, double burst)
      : conn(std::move(c)), limiter(rps, burst) {}

    std::shared_ptr<Connection> conn;
    Kind kind = Kind::Undetermined;
    bool identified = false;
    bool authenticated = false;
    // session id to the generation of the subscribe that added it
    std::map<std::string, uint64_t> subscriptions;
    std::set<std::string> watched;
    std::string wrapper_session;
    RateLimiter limiter;
  };

  using json = nlohmann::json;
  using ConnPtr = std::shared_ptr<Connection>;

  ClientState* find_state(uint64_t conn_id);

  // hub.cpp
  void handle_wrapper_message(const ConnPtr& conn, ClientState& st, const std::string& type, const json& msg);
  void handle_register_pty(const ConnPtr& conn, ClientState& st, const json& msg);
  void handle_hello(const ConnPtr& conn, ClientState& st, const json& msg);
  void handle_client_message(const ConnPtr& conn, ClientState& st, const std::string& type, const json& msg);
  void handle_subscribe(const ConnPtr& conn, ClientState& st, const json& msg);
  void handle_unsubscribe(ClientState& st, const std::string& session_id);
  void handle_send_input(const ConnPtr& conn, const json& msg);
  void handle_pty_resize(ClientState& st, const json& msg);
  void handle_rename(const ConnPtr& conn, const json& msg);
  void handle_tool_approval(const json& msg);
  void handle_spawn(const ConnPtr& conn, const json& msg);
  void handle_history(const ConnPtr& conn, const json& msg);

  void on_session_output(const std::shared_ptr<Session>& session, const std::string& bytes);
  void publish_transition(const std::string& session_id, const WaitTransition& transition);
  void end_session(const std::string& session_id, int exit_code);
  // Drops a viewer, restoring the owner's native size when it was the last.
  void release_viewer(const std::string& session_id, uint64_t conn_id);
  void deliver_output(uint64_t conn_id, const std::string& session_id, uint64_t generation, const json& message);

  void broadcast(const json& message);
  void broadcast_sessions();
  void send_wait_states(const ConnPtr& conn);
  void notify_push(const std::shared_ptr<Session>& session, const WaitEvent& event);

  // hub_filesystem.cpp
  bool handle_filesystem_request(const ConnPtr& conn, ClientState& st, const std::string& type, const json& msg);
  template<typename Fn>
  void run_on_worker(const ConnPtr& conn,
                     const std::string& request_id,
                     const std::string& operation,
                     const std::string& path,
                     Fn fn);
  void handle_watch(const ConnPtr& conn, ClientState& st, const json& msg);
  void handle_unwatch(const ConnPtr& conn, ClientState& st, const json& msg);
  void handle_upload(const ConnPtr& conn, const json& msg);
  void on_file_change(const ChangeEvent& event);
  void deliver_file_change(const std::string& path, const json& message);

  asio::io_context& io_;
  asio::thread_pool& workers_;
  HubOptions options_;
  std::shared_ptr<SessionRegistry> sessions_;
  std::shared_ptr<FileOperations> files_;
  std::shared_ptr<ChangeWatcher> watcher_;
  std::shared_ptr<PushSender> push_;
  std::shared_ptr<Logger> logger_;
  uint16_t listen_port_ = 0;

  // Only the io thread changes clients_, and it does so under m_; io thread
  // code reads it without locking.
  mutable std::mutex m_;
  std::map<uint64_t, ClientState> clients_;
  uint64_t next_subscription_ = 0;

  mutable std::mutex push_mutex_;
  std::vector<PushToken> push_tokens_;
};
