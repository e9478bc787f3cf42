#include "wrapper_client.hpp"

#include "protocol.hpp"
#include "utils.hpp"

#include <sys/ioctl.h>

#include <cerrno>

std::optional<std::pair<uint16_t, uint16_t>> terminal_size(int fd) {
  struct winsize ws{};
  if(::ioctl(fd, TIOCGWINSZ, &ws) != 0 || ws.ws_col == 0 || ws.ws_row == 0) {
    return std::nullopt;
  }
  return std::make_pair(static_cast<uint16_t>(ws.ws_col), static_cast<uint16_t>(ws.ws_row));
}

WrapperClient::WrapperClient(asio::io_context& io, Options options, std::shared_ptr<Logger> logger)
  : io_(io),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("wrap")),
    session_id_(options_.session_id),
    local_cols_(options_.cols),
    local_rows_(options_.rows) {
  if(options_.name.empty()) {
    options_.name = std::filesystem::path(options_.command).filename().string();
  }
}

WrapperClient::~WrapperClient() = default;

void WrapperClient::start() {
  process_ = PtyProcess::spawn(options_.command, options_.args, options_.working_dir,
                               options_.cols, options_.rows, logger_);
  std::weak_ptr<WrapperClient> weak = weak_from_this();
  process_->start(
    [weak](std::string chunk){
      if(auto self = weak.lock()) self->handle_output(std::move(chunk));
    },
    [weak, &io = io_](int exit_code){
      asio::post(io, [weak, exit_code]{
        if(auto self = weak.lock()) self->handle_exit(exit_code);
      });
    });
  connect();
}

void WrapperClient::connect() {
  std::weak_ptr<WrapperClient> weak = weak_from_this();
  auto host = options_.host;
  auto port = options_.port;
  Connection::connect_to(io_, host, port, weak, options_.max_message_bytes,
    [weak, host, port](std::error_code ec, std::shared_ptr<Connection> conn){
      auto self = weak.lock();
      if(!self) return;
      if(ec) {
        self->logger_->warn("Hub not reachable at {}:{} ({}), running locally only", host, port, ec.message());
        self->mark_hub_done();
        return;
      }
      self->conn_ = conn;
      conn->async_send_json(make_register_pty(self->options_.session_id,
                                              self->options_.name,
                                              self->options_.command,
                                              self->options_.working_dir.string()));
    });
}

void WrapperClient::mirror(std::string_view bytes) {
  if(options_.mirror_fd < 0) return;
  while(!bytes.empty()) {
    auto n = ::write(options_.mirror_fd, bytes.data(), bytes.size());
    if(n < 0) {
      if(errno == EINTR) continue;
      logger_->debug("local mirror write failed: {}", std::error_code(errno, std::generic_category()).message());
      return;
    }
    bytes.remove_prefix(static_cast<std::size_t>(n));
  }
}

// Runs on the PTY reader thread.
void WrapperClient::handle_output(std::string chunk) {
  mirror(chunk);
  std::weak_ptr<WrapperClient> weak = weak_from_this();
  asio::post(io_, [weak, chunk = std::move(chunk)]{
    if(auto self = weak.lock()) self->forward_output(chunk);
  });
}

void WrapperClient::forward_output(const std::string& chunk) {
  if(conn_ && registered()) {
    conn_->async_send_json(make_pty_output(chunk));
    return;
  }
  pending_output_ += chunk;
  if(pending_output_.size() > kPendingOutputLimit) {
    pending_output_.erase(0, pending_output_.size() - kPendingOutputLimit);
  }
}

void WrapperClient::handle_exit(int exit_code) {
  logger_->debug("{} exited with {}", options_.command, exit_code);
  if(!conn_) {
    mark_hub_done();
    return;
  }
  conn_->async_send_json(make_wrapper_ended(exit_code));
  conn_->close_after_flush();
}

void WrapperClient::mark_hub_done() {
  std::lock_guard lg(m_);
  hub_done_ = true;
  cv_.notify_all();
}

void WrapperClient::on_message(const std::shared_ptr<Connection>& conn, const nlohmann::json& message) {
  const auto type = message["type"].get<std::string>();
  if(type == "registered") {
    {
      std::lock_guard lg(m_);
      session_id_ = message.at("session_id").get<std::string>();
      registered_ = true;
    }
    cv_.notify_all();
    logger_->debug("registered as session {}", session_id());
    if(!pending_output_.empty()) {
      conn->async_send_json(make_pty_output(pending_output_));
      pending_output_.clear();
    }
  } else if(type == "input") {
    std::string bytes;
    if(!base64_decode(message.at("data").get<std::string>(), bytes)) {
      logger_->warn("hub sent input that is not base64");
      return;
    }
    if(!process_->write_input(bytes)) {
      logger_->warn("remote input dropped ({} bytes)", bytes.size());
    }
  } else if(type == "resize") {
    auto cols = message.at("cols").get<uint16_t>();
    auto rows = message.at("rows").get<uint16_t>();
    if(cols == 0 && rows == 0) {
      std::lock_guard lg(m_);
      cols = local_cols_;
      rows = local_rows_;
    }
    process_->resize(cols, rows);
  } else if(type == "error") {
    logger_->warn("hub error {}: {}", message.value("code", std::string()), message.value("message", std::string()));
  } else if(type != "pong") {
    logger_->debug("ignoring hub message '{}'", type);
  }
}

void WrapperClient::on_invalid_message(const std::shared_ptr<Connection>&, const std::string& reason) {
  logger_->warn("invalid message from hub: {}", reason);
}

void WrapperClient::on_closed(const std::shared_ptr<Connection>& conn) {
  if(conn_ == conn) conn_.reset();
  {
    std::lock_guard lg(m_);
    registered_ = false;
    hub_done_ = true;
  }
  cv_.notify_all();
  logger_->debug("hub connection closed");
}

int WrapperClient::wait() {
  int exit_code = process_->wait_for_exit().get();
  std::unique_lock lock(m_);
  if(!cv_.wait_for(lock, std::chrono::seconds(2), [this]{ return hub_done_; })) {
    logger_->debug("hub did not acknowledge the exit in time");
  }
  return exit_code;
}

bool WrapperClient::wait_until_registered(std::chrono::milliseconds timeout) {
  std::unique_lock lock(m_);
  return cv_.wait_for(lock, timeout, [this]{ return registered_ || hub_done_; }) && registered_;
}

void WrapperClient::write_local_input(std::string_view bytes) {
  if(!process_) return;
  if(!process_->write_input(bytes)) {
    logger_->debug("local input dropped ({} bytes)", bytes.size());
  }
}

void WrapperClient::set_local_size(uint16_t cols, uint16_t rows) {
  {
    std::lock_guard lg(m_);
    local_cols_ = cols;
    local_rows_ = rows;
  }
  if(process_) process_->resize(cols, rows);
}

std::string WrapperClient::session_id() const {
  std::lock_guard lg(m_);
  return session_id_;
}

bool WrapperClient::registered() const {
  std::lock_guard lg(m_);
  return registered_;
}
