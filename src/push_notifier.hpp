#pragma once

#include "log.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

struct PushToken {
  std::string token;
  std::string token_type;  // expo, apns or fcm
  std::string platform;
};

class PushSender {
public:
  virtual ~PushSender() = default;

  // Blocking; the hub calls it from the worker pool.
  virtual void send(const std::vector<PushToken>& tokens,
                    const std::string& title,
                    const std::string& body,
                    const std::string& session_id) = 0;
};

// Posts to the Expo push service over HTTPS. Only expo tokens are sent.
class ExpoPushSender : public PushSender {
public:
  static constexpr const char* kHost = "exp.host";
  static constexpr const char* kPath = "/--/api/v2/push/send";

  explicit ExpoPushSender(std::shared_ptr<Logger> logger = nullptr,
                          std::chrono::seconds timeout = std::chrono::seconds(10));

  void send(const std::vector<PushToken>& tokens,
            const std::string& title,
            const std::string& body,
            const std::string& session_id) override;

  // The request body, or an empty array when no expo token is present.
  static nlohmann::json build_payload(const std::vector<PushToken>& tokens,
                                      const std::string& title,
                                      const std::string& body,
                                      const std::string& session_id);

private:
  // Returns the HTTP status line. Throws std::system_error on transport errors.
  std::string post(const std::string& payload);

  std::shared_ptr<Logger> logger_;
  std::chrono::seconds timeout_;
};
