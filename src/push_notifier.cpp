#include "push_notifier.hpp"

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <istream>
#include <system_error>

using json = nlohmann::json;
using asio::ip::tcp;

ExpoPushSender::ExpoPushSender(std::shared_ptr<Logger> logger, std::chrono::seconds timeout)
  : logger_(logger ? std::move(logger) : std::make_shared<Logger>("push")),
    timeout_(timeout) {}

json ExpoPushSender::build_payload(const std::vector<PushToken>& tokens,
                                   const std::string& title,
                                   const std::string& body,
                                   const std::string& session_id) {
  json messages = json::array();
  for(const auto& t : tokens) {
    if(t.token_type != "expo") continue;
    messages.push_back({
      {"to", t.token},
      {"title", title},
      {"body", body},
      {"data", {
        {"sessionId", session_id},
        {"session_id", session_id},
        {"type", "waiting_for_input"}
      }},
      {"sound", "default"},
      {"priority", "high"}
    });
  }
  return messages;
}

void ExpoPushSender::send(const std::vector<PushToken>& tokens,
                          const std::string& title,
                          const std::string& body,
                          const std::string& session_id) {
  auto payload = build_payload(tokens, title, body, session_id);
  if(payload.empty()) return;
  try {
    auto status = post(payload.dump());
    if(status.find(" 200") == std::string::npos) {
      logger_->warn("Push notification failed: {}", status);
    } else {
      logger_->debug("Push notification sent to {} devices", payload.size());
    }
  } catch(const std::system_error& e) {
    logger_->warn("Failed to send push notification: {}", e.what());
  }
}

std::string ExpoPushSender::post(const std::string& payload) {
  asio::io_context io;
  asio::ssl::context ctx(asio::ssl::context::tls_client);
  ctx.set_default_verify_paths();
  ctx.set_verify_mode(asio::ssl::verify_peer);

  asio::ssl::stream<tcp::socket> stream(io, ctx);
  if(!SSL_set_tlsext_host_name(stream.native_handle(), const_cast<char*>(kHost))) {
    throw std::system_error(static_cast<int>(ERR_get_error()), asio::error::get_ssl_category(), "sni");
  }
  stream.set_verify_callback(asio::ssl::host_name_verification(kHost));

  std::string request =
    std::string("POST ") + kPath + " HTTP/1.1\r\n"
    "Host: " + kHost + "\r\n"
    "Accept: application/json\r\n"
    "Content-Type: application/json\r\n"
    "Content-Length: " + std::to_string(payload.size()) + "\r\n"
    "Connection: close\r\n\r\n" + payload;

  tcp::resolver resolver(io);
  asio::streambuf response_buf;
  std::error_code result;
  std::string status_line;
  bool done = false;

  resolver.async_resolve(kHost, "443",
    [&](std::error_code ec, tcp::resolver::results_type endpoints){
      if(ec) { result = ec; return; }
      asio::async_connect(stream.lowest_layer(), endpoints,
        [&](std::error_code ec, const tcp::endpoint&){
          if(ec) { result = ec; return; }
          stream.async_handshake(asio::ssl::stream_base::client, [&](std::error_code ec){
            if(ec) { result = ec; return; }
            asio::async_write(stream, asio::buffer(request), [&](std::error_code ec, std::size_t){
              if(ec) { result = ec; return; }
              asio::async_read_until(stream, response_buf, "\r\n", [&](std::error_code ec, std::size_t){
                if(ec) { result = ec; return; }
                std::istream is(&response_buf);
                std::getline(is, status_line);
                if(!status_line.empty() && status_line.back() == '\r') status_line.pop_back();
                done = true;
              });
            });
          });
        });
    });

  io.run_for(timeout_);
  if(!done && !result) result = asio::error::timed_out;
  if(result) throw std::system_error(result, "push request");
  return status_line;
}
