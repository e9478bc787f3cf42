#include "hub_engine.hpp"

#include "change_watcher.hpp"
#include "file_operations.hpp"
#include "hub.hpp"
#include "path_validator.hpp"
#include "push_notifier.hpp"
#include "sandbox_policy.hpp"
#include "session_registry.hpp"
#include "utils.hpp"

#include <unistd.h>

#include <csignal>
#include <fstream>
#include <future>
#include <stdexcept>

HubEngine::HubEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("hub")) {
  if(options_.state_dir.empty()) {
    options_.state_dir = default_state_dir();
  }
  if(options_.purge_interval.count() <= 0) {
    options_.purge_interval = std::chrono::seconds(30);
  }
}

HubEngine::~HubEngine() {
  stop();
}

void HubEngine::ensure_state_dir() const {
  std::error_code ec;
  std::filesystem::create_directories(options_.state_dir, ec);
  if(ec) {
    logger_->warn("Unable to create {}: {}", options_.state_dir.string(), ec.message());
  }
}

std::string HubEngine::load_device_id() {
  auto configured = settings_->get<std::string>("device_id");
  if(!configured.empty()) return configured;

  auto file = options_.state_dir / "device_id";
  std::ifstream in(file);
  std::string id;
  if(in && std::getline(in, id) && !id.empty()) return id;

  id = random_hex(16);
  std::ofstream out(file, std::ios::trunc);
  if(out) {
    out << id << "\n";
  } else {
    logger_->warn("Unable to write {}", file.string());
  }
  return id;
}

void HubEngine::start() {
  if(started_) return;
  started_ = true;

  ensure_state_dir();
  if(settings_->settings_path().empty()) {
    settings_->set_settings_path(options_.state_dir / "settings.json");
  }

  init(settings_->get<bool>("verbose"), settings_->get<std::string>("log_file"));

  listen_ip_ = settings_->get<std::string>("listen_ip");
  listen_port_ = static_cast<uint16_t>(settings_->get<int>("listen_port"));
  device_id_ = load_device_id();

  HubOptions hub_options;
  hub_options.auth_token = settings_->get<std::string>("auth_token");
  hub_options.require_auth = settings_->get<bool>("require_auth");
  hub_options.device_id = device_id_;
  hub_options.device_name = settings_->get<std::string>("device_name");
  if(hub_options.device_name.empty()) hub_options.device_name = local_hostname();
  hub_options.rate_limit_rps = settings_->get<int>("rate_limit_rps");
  hub_options.rate_limit_burst = settings_->get<int>("rate_limit_burst");
  hub_options.max_message_bytes =
    static_cast<std::size_t>(settings_->get<int>("max_message_bytes"));
  hub_options.spawn_allowed_commands = settings_->get_strings("spawn_allowed_commands");
  hub_options.push_enabled = settings_->get<bool>("push_enabled");
  hub_options.sessions_file = options_.state_dir / "sessions.json";

  auto scrollback = settings_->get<int>("scrollback_bytes");
  auto retention = settings_->get<int>("session_retention_seconds");
  auto debounce = settings_->get<int>("watch_debounce_ms");
  auto worker_count = settings_->get<int>("worker_threads");

  policy_ = std::make_shared<PolicyStore>(SandboxPolicy::from_settings(*settings_));
  files_ = std::make_shared<FileOperations>(std::make_shared<PathValidator>(policy_));
  watcher_ = std::make_shared<ChangeWatcher>(std::chrono::milliseconds(debounce),
                                             std::make_shared<Logger>("watcher"));
  sessions_ = std::make_shared<SessionRegistry>(static_cast<std::size_t>(scrollback),
                                                std::chrono::seconds(retention));
  auto push = options_.push_sender ? options_.push_sender : std::make_shared<ExpoPushSender>(logger_);
  workers_ = std::make_unique<asio::thread_pool>(static_cast<std::size_t>(worker_count));

  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(listen_ip_);
  } catch(const std::exception& e) {
    logger_->error("Invalid listen_ip '{}': {}", listen_ip_, e.what());
    throw;
  }

  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  tcp::endpoint endpoint(listen_address, listen_port_);
  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen();

  if(listen_port_ == 0) {
    listen_port_ = acceptor_->local_endpoint().port();
  }

  hub_ = std::make_shared<Hub>(io_, *workers_, hub_options, sessions_, files_, watcher_, push, logger_);
  hub_->set_listen_port(listen_port_);
  hub_->start();
  watcher_->start();

  start_accept();

  purge_timer_ = std::make_unique<asio::steady_timer>(io_);
  schedule_purge();

  if(options_.handle_signals) {
    signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM, SIGHUP);
    wait_for_signal();
  }

  write_state_files();
  logger_->info("ttyhub {} listening on {}:{} (device {})",
                device_id_.substr(0, 8), listen_ip_, listen_port_, hub_options.device_name);
}

void HubEngine::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec != asio::error::operation_aborted) {
          logger_->error("Accept error: {}", ec.message());
        }
      } else if(hub_) {
        hub_->accept(std::move(socket));
      }
      if(started_) {
        start_accept();
      }
    });
}

void HubEngine::schedule_purge() {
  if(!purge_timer_) return;
  purge_timer_->expires_after(options_.purge_interval);
  purge_timer_->async_wait([this](const std::error_code& ec){
    if(ec || !started_) return;
    if(auto purged = sessions_->purge_expired()) {
      logger_->debug("Purged {} ended sessions", purged);
    }
    schedule_purge();
  });
}

void HubEngine::wait_for_signal() {
  if(!signals_) return;
  signals_->async_wait([this](const std::error_code& ec, int signal_number){
    if(ec) return;
    if(signal_number == SIGHUP) {
      logger_->info("SIGHUP: reloading sandbox policy");
      reload_policy();
      wait_for_signal();
      return;
    }
    logger_->info("Signal {} received, shutting down", signal_number);
    stop();
  });
}

void HubEngine::reload_policy() {
  if(!policy_) return;
  if(!settings_->load()) {
    logger_->warn("Unable to reload {}", settings_->settings_path().string());
    return;
  }
  policy_->replace(SandboxPolicy::from_settings(*settings_));
}

void HubEngine::write_state_files() {
  auto write = [this](const std::filesystem::path& file, const std::string& value){
    std::ofstream out(file, std::ios::trunc);
    if(!out) {
      logger_->warn("Unable to write {}", file.string());
      return;
    }
    out << value << "\n";
  };
  write(options_.state_dir / "daemon.pid", std::to_string(::getpid()));
  write(options_.state_dir / "daemon.port", std::to_string(listen_port_));
  if(!sessions_->persist(options_.state_dir / "sessions.json", listen_port_)) {
    logger_->warn("Unable to write sessions list");
  }
}

void HubEngine::remove_state_files() {
  std::error_code ec;
  std::filesystem::remove(options_.state_dir / "daemon.pid", ec);
  std::filesystem::remove(options_.state_dir / "daemon.port", ec);
}

void HubEngine::run() {
  if(!started_) start();
  io_.run();
}

void HubEngine::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void HubEngine::stop() {
  if(!started_) return;
  started_ = false;

  if(purge_timer_) purge_timer_->cancel();
  if(signals_) {
    std::error_code ec;
    signals_->cancel(ec);
  }
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }

  const bool on_io_thread = io_.get_executor().running_in_this_thread();
  if(hub_) {
    if(on_io_thread || !io_thread_.joinable()) {
      hub_->shutdown();
    } else {
      auto done = std::make_shared<std::promise<void>>();
      auto finished = done->get_future();
      asio::post(io_, [hub = hub_, done]{
        hub->shutdown();
        done->set_value();
      });
      if(finished.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
        logger_->warn("Timed out closing connections");
      }
    }
  }
  if(watcher_) watcher_->stop();
  if(workers_) {
    workers_->stop();
    workers_->join();
  }
  remove_state_files();
  logger_->info("ttyhub stopped");

  io_.stop();
  if(on_io_thread) return;
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  io_.restart();
}

HubEngine::Stats HubEngine::stats() const {
  Stats s;
  if(hub_) {
    s.connections = hub_->connection_count();
    s.clients = hub_->identified_client_count();
  }
  if(sessions_) {
    s.live_sessions = sessions_->live_count();
    s.recent_sessions = sessions_->recent_count();
  }
  if(watcher_) {
    s.watched_directories = watcher_->watch_count();
  }
  return s;
}
