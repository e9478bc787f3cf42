#include "session_registry.hpp"

#include "pty_process.hpp"
#include "utils.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

Session::Session(std::string id,
                 std::string name,
                 std::string command,
                 std::string project_path,
                 std::size_t scrollback_bytes)
  : id_(std::move(id)),
    command_(std::move(command)),
    project_path_(std::move(project_path)),
    started_at_(now_rfc3339()),
    scrollback_limit_(scrollback_bytes),
    name_(std::move(name)),
    detector_(command_) {}

Session::~Session() {
  output_.clear();
}

std::string Session::name() const {
  std::lock_guard lg(m_);
  return name_;
}

void Session::set_name(std::string name) {
  std::lock_guard lg(m_);
  name_ = std::move(name);
}

bool Session::alive() const {
  std::lock_guard lg(m_);
  return alive_;
}

std::optional<int> Session::exit_code() const {
  std::lock_guard lg(m_);
  return exit_code_;
}

std::optional<std::chrono::steady_clock::time_point> Session::ended_at() const {
  std::lock_guard lg(m_);
  return ended_at_;
}

CliType Session::cli_type() const {
  std::lock_guard lg(m_);
  return detector_.cli_type();
}

ApprovalModel Session::approval_model() const {
  std::lock_guard lg(m_);
  return detector_.approval_model();
}

std::optional<WaitState> Session::wait_state() const {
  std::lock_guard lg(m_);
  return wait_;
}

std::optional<WaitTransition> Session::handle_output(const std::string& bytes) {
  std::lock_guard lg(m_);
  if(!alive_) return std::nullopt;

  scrollback_ += bytes;
  if(scrollback_.size() > scrollback_limit_) {
    scrollback_.erase(0, scrollback_.size() - scrollback_limit_);
  }

  auto transition = detector_.feed(bytes);
  if(transition) {
    if(transition->kind == WaitTransition::Kind::Waiting && transition->event) {
      wait_ = WaitState{*transition->event, now_rfc3339()};
    } else if(transition->kind == WaitTransition::Kind::Cleared) {
      wait_.reset();
    }
  }
  output_.publish(bytes);
  return transition;
}

std::optional<WaitTransition> Session::note_input() {
  std::lock_guard lg(m_);
  if(!alive_) return std::nullopt;
  auto transition = detector_.on_user_input();
  if(transition) wait_.reset();
  return transition;
}

WaitTransition Session::mark_ended(int exit_code) {
  std::unique_ptr<PtyProcess> finished;
  WaitTransition transition{WaitTransition::Kind::Ended, std::nullopt};
  {
    std::lock_guard lg(m_);
    alive_ = false;
    exit_code_ = exit_code;
    ended_at_ = std::chrono::steady_clock::now();
    wait_.reset();
    input_sink_ = nullptr;
    resize_sink_ = nullptr;
    finished = std::move(process_);
    transition = detector_.on_exit();
  }
  // joins the reader, which has already delivered the exit
  finished.reset();
  return transition;
}

std::string Session::subscribe(uint64_t viewer_id, BroadcastChannel<std::string>::Callback callback) {
  std::lock_guard lg(m_);
  output_.subscribe(viewer_id, std::move(callback));
  return scrollback_;
}

std::size_t Session::unsubscribe(uint64_t viewer_id) {
  std::lock_guard lg(m_);
  output_.unsubscribe(viewer_id);
  return output_.subscriber_count();
}

bool Session::is_subscribed(uint64_t viewer_id) const {
  return output_.is_subscribed(viewer_id);
}

std::size_t Session::viewer_count() const {
  return output_.subscriber_count();
}

std::pair<std::string, std::size_t> Session::history(std::optional<std::size_t> max_bytes) const {
  std::lock_guard lg(m_);
  std::size_t total = scrollback_.size();
  std::size_t take = std::min(total, max_bytes.value_or(scrollback_limit_));
  return {scrollback_.substr(total - take), total};
}

void Session::set_sinks(InputSink input, ResizeSink resize) {
  std::lock_guard lg(m_);
  input_sink_ = std::move(input);
  resize_sink_ = std::move(resize);
}

bool Session::send_input(const std::string& bytes) {
  InputSink sink;
  {
    std::lock_guard lg(m_);
    if(!alive_) return false;
    sink = input_sink_;
  }
  if(!sink) return false;
  return sink(bytes);
}

bool Session::resize(uint16_t cols, uint16_t rows) {
  ResizeSink sink;
  {
    std::lock_guard lg(m_);
    if(!alive_) return false;
    sink = resize_sink_;
  }
  if(!sink) return false;
  sink(cols, rows);
  return true;
}

void Session::attach_process(std::unique_ptr<PtyProcess> process) {
  std::lock_guard lg(m_);
  process_ = std::move(process);
}

void Session::terminate_process() {
  PtyProcess* process = nullptr;
  {
    std::lock_guard lg(m_);
    process = process_.get();
  }
  // the exit handler takes the session lock, so signal without holding it
  if(process) process->terminate();
}

nlohmann::json Session::to_json(uint16_t port) const {
  std::lock_guard lg(m_);
  return {
    {"session_id", id_},
    {"name", name_},
    {"command", command_},
    {"project_path", project_path_},
    {"ws_port", port},
    {"started_at", started_at_},
    {"cli_type", cli_type_name(detector_.cli_type())},
    {"approval_model", approval_model_name(detector_.approval_model())}
  };
}

SessionRegistry::SessionRegistry(std::size_t scrollback_bytes, std::chrono::seconds retention)
  : scrollback_bytes_(scrollback_bytes), retention_(retention) {}

std::shared_ptr<Session> SessionRegistry::create(std::string id,
                                                 std::string name,
                                                 std::string command,
                                                 std::string project_path) {
  std::lock_guard lg(m_);
  if(id.empty()) {
    do {
      id = random_hex(8);
    } while(live_.count(id) || recent_.count(id));
  } else if(live_.count(id)) {
    throw std::runtime_error("session " + id + " is already registered");
  }
  recent_.erase(id);
  auto session = std::make_shared<Session>(id, std::move(name), std::move(command),
                                           std::move(project_path), scrollback_bytes_);
  live_[id] = session;
  return session;
}

std::shared_ptr<Session> SessionRegistry::find(const std::string& id) const {
  std::lock_guard lg(m_);
  auto it = live_.find(id);
  if(it != live_.end()) return it->second;
  auto rit = recent_.find(id);
  return rit == recent_.end() ? nullptr : rit->second;
}

std::shared_ptr<Session> SessionRegistry::find_live(const std::string& id) const {
  std::lock_guard lg(m_);
  auto it = live_.find(id);
  return it == live_.end() ? nullptr : it->second;
}

std::shared_ptr<Session> SessionRegistry::end(const std::string& id, int exit_code) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard lg(m_);
    auto it = live_.find(id);
    if(it == live_.end()) return nullptr;
    session = it->second;
    live_.erase(it);
    recent_[id] = session;
  }
  session->mark_ended(exit_code);
  return session;
}

bool SessionRegistry::rename(const std::string& id, const std::string& new_name) {
  auto session = find_live(id);
  if(!session) return false;
  session->set_name(new_name);
  return true;
}

std::vector<std::shared_ptr<Session>> SessionRegistry::live() const {
  std::lock_guard lg(m_);
  std::vector<std::shared_ptr<Session>> out;
  out.reserve(live_.size());
  for(const auto& kv : live_) out.push_back(kv.second);
  return out;
}

std::size_t SessionRegistry::live_count() const {
  std::lock_guard lg(m_);
  return live_.size();
}

std::size_t SessionRegistry::recent_count() const {
  std::lock_guard lg(m_);
  return recent_.size();
}

std::size_t SessionRegistry::purge_expired(std::chrono::steady_clock::time_point now) {
  std::vector<std::shared_ptr<Session>> dropped;
  {
    std::lock_guard lg(m_);
    for(auto it = recent_.begin(); it != recent_.end(); ) {
      auto ended = it->second->ended_at();
      if(ended && now - *ended >= retention_) {
        dropped.push_back(it->second);
        it = recent_.erase(it);
      } else {
        ++it;
      }
    }
  }
  return dropped.size();
}

nlohmann::json SessionRegistry::list_json(uint16_t port) const {
  auto sessions = nlohmann::json::array();
  for(const auto& session : live()) {
    sessions.push_back(session->to_json(port));
  }
  return sessions;
}

bool SessionRegistry::persist(const fs::path& file, uint16_t port) const {
  std::error_code ec;
  fs::create_directories(file.parent_path(), ec);
  auto tmp = file;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if(!out) return false;
    out << list_json(port).dump(2);
    if(!out) return false;
  }
  fs::rename(tmp, file, ec);
  return !ec;
}
