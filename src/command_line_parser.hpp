#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "settings_manager.hpp"

// Bad command line; the caller prints what() followed by usage().
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Maps argv onto settings: --key value, --key=value, -alias value, and
// positional values in the order given by argv_spec. Bool settings take an
// optional literal (--require_auth, --require_auth false).
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "ttyhub",
                    std::string summary = "terminal session hub",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","listen_port"}},
                      {{"index",1},{"key","listen_ip"}}
                    }));

  // Everything after "--", or after the last positional setting, is
  // returned verbatim instead of being rejected.
  void set_accepts_trailing_command(bool accepts) { accepts_trailing_command_ = accepts; }

  // Throws UsageError.
  std::vector<std::string> parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage() const;

private:
  struct Positional {
    std::size_t index = 0;
    std::string key;
  };

  void load_positionals(const nlohmann::json& argv_spec);
  // Consumes the option at args[i] (and its value). Returns false when a
  // short token names no setting so it can be read as a positional.
  bool consume_option(const std::vector<std::string>& args,
                      std::size_t& i,
                      SettingsManager& settings) const;
  static void store(SettingsManager& settings,
                    const std::string& key,
                    const std::string& value,
                    const std::string& shown_as);
  static bool looks_like_option(const std::string& token);
  static std::string option_line(const nlohmann::json& entry);

  std::string process_name_;
  std::string summary_;
  bool accepts_trailing_command_ = false;
  nlohmann::json settings_spec_;
  std::vector<Positional> positionals_;
};
