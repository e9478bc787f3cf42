#include "hub.hpp"

#include "change_watcher.hpp"
#include "file_operations.hpp"
#include "protocol.hpp"
#include "pty_process.hpp"
#include "sandbox_policy.hpp"
#include "utils.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace {

std::string join_lines(const std::vector<std::string>& lines) {
  std::string out;
  for(const auto& line : lines) {
    if(!out.empty()) out += '\n';
    out += line;
  }
  return out;
}

json waiting_message(const Session& session, const WaitState& wait) {
  return make_waiting_for_input(session.id(),
                                wait.since,
                                join_lines(wait.event.context),
                                wait_type_name(wait.event.wait_type),
                                cli_type_name(session.cli_type()));
}

} // namespace

Hub::Hub(asio::io_context& io,
         asio::thread_pool& workers,
         HubOptions options,
         std::shared_ptr<SessionRegistry> sessions,
         std::shared_ptr<FileOperations> files,
         std::shared_ptr<ChangeWatcher> watcher,
         std::shared_ptr<PushSender> push,
         std::shared_ptr<Logger> logger)
  : io_(io),
    workers_(workers),
    options_(std::move(options)),
    sessions_(std::move(sessions)),
    files_(std::move(files)),
    watcher_(std::move(watcher)),
    push_(std::move(push)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("hub")) {}

void Hub::start() {
  if(!watcher_) return;
  std::weak_ptr<Hub> weak = weak_from_this();
  watcher_->add_listener([weak](const ChangeEvent& event){
    if(auto self = weak.lock()) self->on_file_change(event);
  });
}

void Hub::accept(asio::ip::tcp::socket socket) {
  auto conn = Connection::adopt(io_, std::move(socket), weak_from_this(), options_.max_message_bytes);
  {
    std::lock_guard lg(m_);
    clients_.try_emplace(conn->id(), conn, options_.rate_limit_rps, options_.rate_limit_burst);
  }
  logger_->debug("connection {} from {}", conn->id(), conn->remote_address());
  conn->start();
}

void Hub::shutdown() {
  std::vector<ConnPtr> conns;
  for(auto& kv : clients_) conns.push_back(kv.second.conn);
  for(auto& conn : conns) conn->close();
  {
    std::lock_guard lg(m_);
    clients_.clear();
  }
  for(auto& session : sessions_->live()) {
    session->terminate_process();
  }
}

Hub::ClientState* Hub::find_state(uint64_t conn_id) {
  auto it = clients_.find(conn_id);
  return it == clients_.end() ? nullptr : &it->second;
}

std::size_t Hub::connection_count() const {
  std::lock_guard lg(m_);
  return clients_.size();
}

std::size_t Hub::identified_client_count() const {
  std::lock_guard lg(m_);
  return static_cast<std::size_t>(std::count_if(clients_.begin(), clients_.end(),
    [](const auto& kv){ return kv.second.identified; }));
}

std::vector<PushToken> Hub::push_tokens() const {
  std::lock_guard lg(push_mutex_);
  return push_tokens_;
}

void Hub::on_invalid_message(const ConnPtr& conn, const std::string& reason) {
  logger_->debug("invalid message from {}: {}", conn->remote_address(), reason);
  conn->async_send_json(make_error(error_code::kInvalidMessage, reason));
}

void Hub::on_message(const ConnPtr& conn, const json& message) {
  ClientState* st = find_state(conn->id());
  if(!st) return;
  const std::string type = message["type"].get<std::string>();

  if(st->kind == Kind::Undetermined) {
    Kind kind = type == "register_pty" ? Kind::Wrapper : Kind::Client;
    if(kind == Kind::Wrapper && !conn->is_loopback()) {
      logger_->warn("rejecting register_pty from non-local address {}", conn->remote_address());
      conn->async_send_json(make_error(error_code::kForbidden, "register_pty is only accepted from localhost"));
      conn->close_after_flush();
      return;
    }
    {
      std::lock_guard lg(m_);
      st->kind = kind;
    }
  }

  try {
    if(st->kind == Kind::Wrapper) {
      handle_wrapper_message(conn, *st, type, message);
    } else if(!st->identified && type != "hello") {
      conn->async_send_json(make_error(error_code::kHelloRequired, "send hello before '" + type + "'"));
    } else {
      handle_client_message(conn, *st, type, message);
    }
  } catch(const json::exception& e) {
    on_invalid_message(conn, e.what());
  } catch(const std::exception& e) {
    logger_->error("{} from {} failed: {}", type, conn->remote_address(), e.what());
    conn->async_send_json(make_error("internal_error", e.what()));
  }
}

void Hub::on_closed(const ConnPtr& conn) {
  ClientState* st = find_state(conn->id());
  if(!st) return;
  auto subscriptions = st->subscriptions;
  auto watched = st->watched;
  auto wrapper_session = st->wrapper_session;
  {
    std::lock_guard lg(m_);
    clients_.erase(conn->id());
  }
  logger_->debug("connection {} closed", conn->id());

  for(const auto& sub : subscriptions) release_viewer(sub.first, conn->id());
  for(const auto& path : watched) {
    if(watcher_) watcher_->unwatch(path);
  }
  if(!wrapper_session.empty()) {
    logger_->info("wrapper for session {} disconnected", wrapper_session);
    end_session(wrapper_session, -1);
  }
}

// ---- wrappers --------------------------------------------------------------

void Hub::handle_register_pty(const ConnPtr& conn, ClientState& st, const json& msg) {
  if(!st.wrapper_session.empty()) {
    conn->async_send_json(make_error(error_code::kSessionExists, "connection already owns a session"));
    return;
  }
  std::shared_ptr<Session> session;
  try {
    session = sessions_->create(msg.value("session_id", std::string()),
                                msg.value("name", std::string("Terminal")),
                                msg.value("command", std::string("shell")),
                                msg.value("project_path", std::string()));
  } catch(const std::runtime_error& e) {
    conn->async_send_json(make_error(error_code::kSessionExists, e.what()));
    return;
  }

  std::weak_ptr<Connection> weak = conn;
  session->set_sinks(
    [weak](const std::string& bytes){
      auto c = weak.lock();
      if(!c) return false;
      c->async_send_json(make_input(bytes));
      return true;
    },
    [weak](uint16_t cols, uint16_t rows){
      if(auto c = weak.lock()) c->async_send_json(make_resize(cols, rows));
    });
  {
    std::lock_guard lg(m_);
    st.wrapper_session = session->id();
  }
  logger_->info("registered session {} '{}' ({})", session->id(), session->name(), session->command());
  conn->async_send_json(make_registered(session->id()));
  broadcast_sessions();
}

void Hub::handle_wrapper_message(const ConnPtr& conn, ClientState& st, const std::string& type, const json& msg) {
  if(type == "register_pty") {
    handle_register_pty(conn, st, msg);
  } else if(type == "pty_output") {
    std::string bytes;
    if(!base64_decode(msg.at("data").get<std::string>(), bytes)) {
      on_invalid_message(conn, "pty_output data is not base64");
      return;
    }
    if(auto session = sessions_->find_live(st.wrapper_session)) {
      on_session_output(session, bytes);
    }
  } else if(type == "session_ended") {
    auto id = st.wrapper_session;
    {
      std::lock_guard lg(m_);
      st.wrapper_session.clear();
    }
    if(!id.empty()) end_session(id, msg.value("exit_code", 0));
  } else if(type == "ping") {
    conn->async_send_json(make_pong());
  } else {
    conn->async_send_json(make_error(error_code::kUnknownType, "unsupported wrapper message '" + type + "'"));
  }
}

// ---- clients ---------------------------------------------------------------

void Hub::handle_hello(const ConnPtr& conn, ClientState& st, const json& msg) {
  std::string token;
  if(msg.contains("auth_token") && msg["auth_token"].is_string()) {
    token = msg["auth_token"].get<std::string>();
  }
  bool matches = options_.auth_token.empty() || token == options_.auth_token;
  if(!matches && options_.require_auth) {
    logger_->warn("client {} failed authentication", conn->remote_address());
    conn->async_send_json(make_welcome(false, options_.device_id, options_.device_name));
    conn->async_send_json(make_error(error_code::kUnauthorized, "invalid auth token"));
    conn->close_after_flush();
    return;
  }
  if(!matches) {
    logger_->warn("client {} sent a mismatched auth token", conn->remote_address());
  }
  {
    std::lock_guard lg(m_);
    st.identified = true;
    st.authenticated = matches;
  }
  logger_->info("client {} connected (version {})", conn->remote_address(),
                msg.value("client_version", std::string("unknown")));
  conn->async_send_json(make_welcome(matches, options_.device_id, options_.device_name));
  conn->async_send_json(make_sessions(sessions_->list_json(listen_port_)));
  send_wait_states(conn);
}

void Hub::handle_client_message(const ConnPtr& conn, ClientState& st, const std::string& type, const json& msg) {
  if(handle_filesystem_request(conn, st, type, msg)) return;

  if(type == "hello") {
    handle_hello(conn, st, msg);
  } else if(type == "ping") {
    conn->async_send_json(make_pong());
  } else if(type == "get_sessions") {
    conn->async_send_json(make_sessions(sessions_->list_json(listen_port_)));
  } else if(type == "subscribe") {
    handle_subscribe(conn, st, msg);
  } else if(type == "unsubscribe") {
    handle_unsubscribe(st, msg.at("session_id").get<std::string>());
  } else if(type == "send_input") {
    handle_send_input(conn, msg);
  } else if(type == "pty_resize") {
    handle_pty_resize(st, msg);
  } else if(type == "rename_session") {
    handle_rename(conn, msg);
  } else if(type == "get_session_history") {
    handle_history(conn, msg);
  } else if(type == "tool_approval") {
    handle_tool_approval(msg);
  } else if(type == "register_push_token") {
    PushToken token{msg.at("token").get<std::string>(),
                    msg.value("token_type", std::string("expo")),
                    msg.value("platform", std::string())};
    {
      std::lock_guard lg(push_mutex_);
      push_tokens_.erase(std::remove_if(push_tokens_.begin(), push_tokens_.end(),
                                        [&](const PushToken& t){ return t.token == token.token; }),
                         push_tokens_.end());
      push_tokens_.push_back(token);
    }
    logger_->info("Registered push token ({}/{})", token.token_type, token.platform);
  } else if(type == "unregister_push_token") {
    auto value = msg.at("token").get<std::string>();
    std::size_t removed = 0;
    {
      std::lock_guard lg(push_mutex_);
      auto before = push_tokens_.size();
      push_tokens_.erase(std::remove_if(push_tokens_.begin(), push_tokens_.end(),
                                        [&](const PushToken& t){ return t.token == value; }),
                         push_tokens_.end());
      removed = before - push_tokens_.size();
    }
    logger_->info("Unregistered push token (removed {})", removed);
  } else if(type == "spawn_session") {
    handle_spawn(conn, msg);
  } else {
    conn->async_send_json(make_error(error_code::kUnknownType, "unsupported message '" + type + "'"));
  }
}

void Hub::handle_subscribe(const ConnPtr& conn, ClientState& st, const json& msg) {
  auto id = msg.at("session_id").get<std::string>();
  auto session = sessions_->find_live(id);
  if(!session) {
    conn->async_send_json(make_error(error_code::kSessionNotFound, "no session " + id));
    return;
  }
  const uint64_t conn_id = conn->id();
  const uint64_t generation = ++next_subscription_;
  std::weak_ptr<Hub> weak = weak_from_this();
  asio::io_context& io = io_;
  auto history = session->subscribe(conn_id, [weak, &io, conn_id, id, generation](const std::string& bytes){
    asio::post(io, [weak, conn_id, id, generation, message = make_pty_bytes(id, bytes)]{
      if(auto self = weak.lock()) self->deliver_output(conn_id, id, generation, message);
    });
  });
  {
    std::lock_guard lg(m_);
    st.subscriptions[id] = generation;
  }
  logger_->debug("connection {} subscribed to {}", conn_id, id);
  conn->async_send_json(make_session_history(id, history, history.size()));
}

void Hub::handle_unsubscribe(ClientState& st, const std::string& session_id) {
  {
    std::lock_guard lg(m_);
    if(st.subscriptions.erase(session_id) == 0) return;
  }
  release_viewer(session_id, st.conn->id());
}

void Hub::release_viewer(const std::string& session_id, uint64_t conn_id) {
  auto session = sessions_->find(session_id);
  if(!session) return;
  if(session->unsubscribe(conn_id) == 0 && session->alive()) {
    logger_->debug("last viewer left {}, restoring terminal size", session_id);
    session->resize(0, 0);
  }
}

void Hub::deliver_output(uint64_t conn_id, const std::string& session_id, uint64_t generation,
                         const json& message) {
  ClientState* st = find_state(conn_id);
  if(!st) return;
  // chunks queued for an earlier subscription are already in the history replay
  auto it = st->subscriptions.find(session_id);
  if(it == st->subscriptions.end() || it->second != generation) return;
  st->conn->async_send_json(message);
}

void Hub::handle_send_input(const ConnPtr& conn, const json& msg) {
  auto id = msg.at("session_id").get<std::string>();
  auto session = sessions_->find_live(id);
  if(!session) {
    conn->async_send_json(make_error(error_code::kSessionNotFound, "no session " + id));
    return;
  }
  std::string bytes;
  if(msg.contains("data") && msg["data"].is_string()) {
    if(!base64_decode(msg["data"].get<std::string>(), bytes)) {
      on_invalid_message(conn, "send_input data is not base64");
      return;
    }
  } else {
    bytes = msg.at("text").get<std::string>();
  }
  if(auto transition = session->note_input()) {
    publish_transition(id, *transition);
  }
  if(!session->send_input(bytes)) {
    logger_->warn("input to {} refused ({} bytes)", id, bytes.size());
    conn->async_send_json(make_error(error_code::kInputFailed, "session " + id + " is not accepting input"));
  }
}

void Hub::handle_pty_resize(ClientState& st, const json& msg) {
  auto id = msg.at("session_id").get<std::string>();
  auto cols = msg.value("cols", 0);
  auto rows = msg.value("rows", 0);
  bool restore = cols == 0 && rows == 0;
  if(!restore && !st.subscriptions.count(id)) {
    logger_->debug("Ignoring PTY resize for {} (not a viewer)", id);
    return;
  }
  if(cols < 0 || rows < 0 || cols > 65535 || rows > 65535) return;
  if(auto session = sessions_->find_live(id)) {
    session->resize(static_cast<uint16_t>(cols), static_cast<uint16_t>(rows));
  }
}

void Hub::handle_rename(const ConnPtr& conn, const json& msg) {
  auto id = msg.at("session_id").get<std::string>();
  auto new_name = msg.at("new_name").get<std::string>();
  if(!sessions_->rename(id, new_name)) {
    conn->async_send_json(make_error(error_code::kSessionNotFound, "no session " + id));
    return;
  }
  logger_->info("session {} renamed to '{}'", id, new_name);
  broadcast(make_session_renamed(id, new_name));
  broadcast_sessions();
}

void Hub::handle_history(const ConnPtr& conn, const json& msg) {
  auto id = msg.at("session_id").get<std::string>();
  std::optional<std::size_t> max_bytes;
  if(msg.contains("max_bytes") && msg["max_bytes"].is_number_unsigned()) {
    max_bytes = msg["max_bytes"].get<std::size_t>();
  }
  auto session = sessions_->find(id);
  if(!session) {
    conn->async_send_json(make_session_history(id, std::string(), 0));
    return;
  }
  auto [bytes, total] = session->history(max_bytes);
  conn->async_send_json(make_session_history(id, bytes, total));
}

void Hub::handle_tool_approval(const json& msg) {
  auto id = msg.at("session_id").get<std::string>();
  auto response = msg.at("response").get<std::string>();
  auto session = sessions_->find_live(id);
  if(!session) {
    logger_->warn("Tool approval for unknown session {}", id);
    return;
  }
  auto input = approval_input_for(session->approval_model(), response);
  if(!input) {
    logger_->warn("Tool approval ignored (no applicable approval model) for session {}", id);
    return;
  }
  if(!session->send_input(*input)) {
    logger_->warn("approval input to {} refused", id);
    return;
  }
  session->note_input();
  broadcast(make_waiting_cleared(id, now_rfc3339()));
}

void Hub::handle_spawn(const ConnPtr& conn, const json& msg) {
  SpawnRequest request;
  request.command = msg.at("command").get<std::string>();
  request.args = msg.value("args", std::vector<std::string>());
  request.name = msg.value("name", std::string());
  request.working_dir = msg.value("working_dir", std::string());

  std::string error;
  if(!validate_spawn_request(request, options_.spawn_allowed_commands, &files_->validator(), error)) {
    logger_->warn("spawn of '{}' rejected: {}", request.command, error);
    conn->async_send_json(make_spawn_result(false, std::nullopt, error));
    return;
  }
  std::string working_dir = request.working_dir.empty() ? home_directory().string() : request.working_dir;
  std::string name = request.name.empty()
    ? std::filesystem::path(request.command).filename().string()
    : request.name;

  std::unique_ptr<PtyProcess> process;
  try {
    process = PtyProcess::spawn(request.command, request.args, working_dir, 80, 24, logger_);
  } catch(const std::system_error& e) {
    logger_->warn("spawn of '{}' failed: {}", request.command, e.what());
    conn->async_send_json(make_spawn_result(false, std::nullopt, std::string(e.what())));
    return;
  }
  auto session = sessions_->create(std::string(), name, request.command, working_dir);

  PtyProcess* raw = process.get();
  session->set_sinks(
    [raw](const std::string& bytes){ return raw->write_input(bytes); },
    [raw](uint16_t cols, uint16_t rows){ raw->resize(cols, rows); });

  std::weak_ptr<Hub> weak_hub = weak_from_this();
  std::weak_ptr<Session> weak_session = session;
  const std::string id = session->id();
  asio::io_context& io = io_;
  process->start(
    [weak_hub, weak_session](std::string chunk){
      auto self = weak_hub.lock();
      auto s = weak_session.lock();
      if(self && s) self->on_session_output(s, chunk);
    },
    [weak_hub, &io, id](int exit_code){
      asio::post(io, [weak_hub, id, exit_code]{
        if(auto self = weak_hub.lock()) self->end_session(id, exit_code);
      });
    });
  session->attach_process(std::move(process));

  logger_->info("spawned session {} '{}' in {}", id, name, working_dir);
  conn->async_send_json(make_spawn_result(true, id, std::nullopt));
  broadcast_sessions();
}

// ---- sessions --------------------------------------------------------------

void Hub::on_session_output(const std::shared_ptr<Session>& session, const std::string& bytes) {
  auto transition = session->handle_output(bytes);
  if(!transition) return;
  std::weak_ptr<Hub> weak = weak_from_this();
  asio::post(io_, [weak, id = session->id(), t = *transition]{
    if(auto self = weak.lock()) self->publish_transition(id, t);
  });
}

void Hub::publish_transition(const std::string& session_id, const WaitTransition& transition) {
  switch(transition.kind) {
    case WaitTransition::Kind::Waiting: {
      auto session = sessions_->find_live(session_id);
      if(!session || !transition.event) return;
      WaitState wait{*transition.event, now_rfc3339()};
      auto current = session->wait_state();
      if(current && current->event.prompt_hash == wait.event.prompt_hash) wait.since = current->since;
      logger_->info("session {} waiting for input ({})", session_id, wait_type_name(wait.event.wait_type));
      broadcast(waiting_message(*session, wait));
      notify_push(session, wait.event);
      break;
    }
    case WaitTransition::Kind::Cleared:
      broadcast(make_waiting_cleared(session_id, now_rfc3339()));
      break;
    case WaitTransition::Kind::Ended:
      break;
  }
}

void Hub::end_session(const std::string& session_id, int exit_code) {
  auto session = sessions_->find_live(session_id);
  if(!session) return;
  bool was_waiting = session->wait_state().has_value();
  sessions_->end(session_id, exit_code);

  for(auto& kv : clients_) {
    bool dropped = false;
    {
      std::lock_guard lg(m_);
      dropped = kv.second.subscriptions.erase(session_id) > 0;
      if(kv.second.wrapper_session == session_id) kv.second.wrapper_session.clear();
    }
    if(dropped) session->unsubscribe(kv.first);
  }

  logger_->info("session {} ended with {}", session_id, exit_code);
  if(was_waiting) broadcast(make_waiting_cleared(session_id, now_rfc3339()));
  broadcast(make_session_ended(session_id, exit_code));
  broadcast_sessions();
}

void Hub::broadcast(const json& message) {
  for(auto& kv : clients_) {
    if(kv.second.kind == Kind::Client && kv.second.identified) {
      kv.second.conn->async_send_json(message);
    }
  }
}

void Hub::broadcast_sessions() {
  broadcast(make_sessions(sessions_->list_json(listen_port_)));
  if(!options_.sessions_file.empty() && !sessions_->persist(options_.sessions_file, listen_port_)) {
    logger_->warn("Unable to write {}", options_.sessions_file.string());
  }
}

void Hub::send_wait_states(const ConnPtr& conn) {
  for(const auto& session : sessions_->live()) {
    if(auto wait = session->wait_state()) {
      conn->async_send_json(waiting_message(*session, *wait));
    }
  }
}

void Hub::notify_push(const std::shared_ptr<Session>& session, const WaitEvent& event) {
  if(!options_.push_enabled || !push_) return;
  auto tokens = push_tokens();
  if(tokens.empty()) return;
  auto [title, body] = build_notification_text(session->cli_type(), session->name(), event);
  asio::post(workers_, [push = push_, logger = logger_, tokens, title = title, body = body, id = session->id()]{
    try {
      push->send(tokens, title, body, id);
    } catch(const std::exception& e) {
      logger->warn("push notification for {} failed: {}", id, e.what());
    }
  });
}
