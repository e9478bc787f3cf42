#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

inline const nlohmann::json DEFAULT_DENIED_PATTERNS = nlohmann::json::array({
  "**/.ssh/*", "**/*.pem", "**/*.key", "**/id_rsa*", "**/.gnupg/*", "**/.aws/credentials",
  "**/.env", "**/.env.*", "**/secrets.*", "**/*.secret", "**/token*", "**/.npmrc", "**/.pypirc"
});

inline const nlohmann::json DEFAULT_READ_ONLY_PATTERNS = nlohmann::json::array({
  "/etc/**", "/usr/**", "/bin/**", "/sbin/**"
});

// One row per setting. Types are bool, int, string and strings; int rows may
// carry an inclusive min/max that every store is checked against. Rows with
// persistent=false are command line only and never written to disk.
// An empty allowed_roots list means the user's home directory.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","listen_port"},         {"aliases", {"lp","port"}},      {"type","int"},    {"default",9847},  {"min",0}, {"max",65535}, {"description","TCP port to listen on (0 picks a free port)"}},
  {{"key","listen_ip"},           {"aliases", {"li"}},             {"type","string"}, {"default","0.0.0.0"}, {"description","Interface/IP to bind"}},
  {{"key","auth_token"},          {"aliases", {"token"}},          {"type","string"}, {"default",""},    {"description","Shared secret expected in client hello"}},
  {{"key","require_auth"},        {"aliases", {"ra"}},             {"type","bool"},   {"default",false}, {"description","Disconnect clients whose hello token does not match"}},
  {{"key","device_id"},           {"aliases", {"id"}},             {"type","string"}, {"default",""},    {"description","Stable identifier reported in welcome"}},
  {{"key","device_name"},         {"aliases", {"name"}},           {"type","string"}, {"default",""},    {"description","Display name reported in welcome (default hostname)"}},
  {{"key","allowed_roots"},       {"aliases", {"roots"}},          {"type","strings"},{"default",nlohmann::json::array()}, {"description","Directories remote clients may access"}},
  {{"key","denied_patterns"},     {"aliases", {"deny"}},           {"type","strings"},{"default",DEFAULT_DENIED_PATTERNS}, {"description","Glob patterns that are never readable or writable"}},
  {{"key","read_only_patterns"},  {"aliases", {"ro"}},             {"type","strings"},{"default",DEFAULT_READ_ONLY_PATTERNS}, {"description","Glob patterns that may be read but not written"}},
  {{"key","max_read_size"},       {"aliases", {"mrs"}},            {"type","int"},    {"default",50 * 1024 * 1024}, {"min",1}, {"max",1 << 30}, {"description","Largest file read_file will return (bytes)"}},
  {{"key","max_write_size"},      {"aliases", {"mws"}},            {"type","int"},    {"default",50 * 1024 * 1024}, {"min",1}, {"max",1 << 30}, {"description","Largest payload write_file will accept (bytes)"}},
  {{"key","follow_symlinks"},     {"aliases", {"fs"}},             {"type","bool"},   {"default",false}, {"description","Let search walk into symlinked directories inside the allowed roots"}},
  {{"key","max_list_entries"},    {"aliases", {"mle"}},            {"type","int"},    {"default",10000}, {"min",1}, {"max",1000000}, {"description","Directory listing entry cap"}},
  {{"key","max_search_results"},  {"aliases", {"msr"}},            {"type","int"},    {"default",1000},  {"min",1}, {"max",1000000}, {"description","Search result cap"}},
  {{"key","rate_limit_rps"},      {"aliases", {"rps"}},            {"type","int"},    {"default",100},   {"min",1}, {"max",1000000}, {"description","Filesystem requests per second per connection"}},
  {{"key","rate_limit_burst"},    {"aliases", {"burst"}},          {"type","int"},    {"default",50},    {"min",1}, {"max",1000000}, {"description","Filesystem request burst per connection"}},
  {{"key","scrollback_bytes"},    {"aliases", {"scrollback"}},     {"type","int"},    {"default",64 * 1024}, {"min",1024}, {"max",64 * 1024 * 1024}, {"description","Recent output retained per session"}},
  {{"key","max_message_bytes"},   {"aliases", {"mmb"}},            {"type","int"},    {"default",96 * 1024 * 1024}, {"min",1024}, {"max",1 << 30}, {"description","Largest accepted protocol message"}},
  {{"key","session_retention_seconds"}, {"aliases", {"retention"}}, {"type","int"},   {"default",600},   {"min",0}, {"max",7 * 24 * 3600}, {"description","How long ended sessions stay listed"}},
  {{"key","watch_debounce_ms"},   {"aliases", {"debounce"}},       {"type","int"},    {"default",250},   {"min",10}, {"max",60000}, {"description","Change watcher coalescing window"}},
  {{"key","worker_threads"},      {"aliases", {"workers"}},        {"type","int"},    {"default",4},     {"min",1}, {"max",256}, {"description","Filesystem worker pool size"}},
  {{"key","spawn_allowed_commands"}, {"aliases", {"allow_cmd"}},   {"type","strings"},{"default",nlohmann::json::array()}, {"description","Extra command names remote clients may spawn"}},
  {{"key","push_enabled"},        {"aliases", {"push"}},           {"type","bool"},   {"default",true},  {"description","Send push notifications on wait states"}},
  {{"key","log_file"},            {"aliases", {"log"}},            {"type","string"}, {"default",""},    {"description","Also write logs to this rotating file"}},
  {{"key","verbose"},             {"aliases", {"v"}},              {"type","bool"},   {"default",false}, {"description","Enable verbose logging"}},
  {{"key","config"},              {"aliases", {"c"}},              {"type","string"}, {"default",""},    {"description","Settings file to load instead of ~/.ttyhub/settings.json"}, {"persistent", false}},
  {{"key","help"},                {"aliases", {"h","?"}},          {"type","bool"},   {"default",false}, {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},        {"type","bool"},   {"default",false}, {"description","Persist current settings to disk"}, {"persistent", false}}
});

// ~/.ttyhub, or ./.ttyhub when HOME is unset.
inline std::filesystem::path default_state_dir() {
  const char* home = std::getenv("HOME");
  if(home && *home) return std::filesystem::path(home) / ".ttyhub";
  return std::filesystem::current_path() / ".ttyhub";
}

// Typed key/value store described by a specification table. Values arrive
// from the settings file, the command line (text) or tests (JSON) and are
// checked against the row before they are kept.
class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;
  std::vector<std::string> get_strings(const std::string& key) const;
  bool has(const std::string& key) const { return values_.contains(key); }

  bool set_from_string(const std::string& key, const std::string& text, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // Canonical key for a key or alias, case-insensitive.
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  static bool is_bool_literal(const std::string& text);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path) { path_override_ = path; }

  bool load() { return load_from_file(settings_path()); }
  bool save() const { return save_to_file(settings_path()); }
  // Unknown keys are skipped; invalid values are reported and skipped.
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

private:
  struct Row {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json fallback;
    std::optional<long long> min;
    std::optional<long long> max;
    bool persistent = true;
  };

  static std::vector<Row> read_rows(const nlohmann::json& specification);
  static std::string lowercase(std::string text);
  static std::string trimmed(const std::string& text);

  const Row* find_row(const std::string& token) const;
  std::optional<nlohmann::json> coerce(const Row& row, const nlohmann::json& value, std::string& error) const;
  std::optional<nlohmann::json> parse_text(const Row& row, const std::string& text, std::string& error) const;
  bool store(const Row& row, const nlohmann::json& value, std::string& error);

  std::vector<Row> rows_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path path_override_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::Row> SettingsManager::read_rows(const nlohmann::json& specification) {
  std::vector<Row> rows;
  for(const auto& entry : specification) {
    Row row;
    row.key = entry.at("key").get<std::string>();
    for(const auto& alias : entry.value("aliases", std::vector<std::string>())) {
      row.aliases.push_back(lowercase(alias));
    }
    row.type = entry.at("type").get<std::string>();
    if(row.type != "bool" && row.type != "int" && row.type != "string" && row.type != "strings") {
      throw std::invalid_argument("setting '" + row.key + "' has unsupported type " + row.type);
    }
    row.fallback = entry.at("default");
    if(entry.contains("min")) row.min = entry.at("min").get<long long>();
    if(entry.contains("max")) row.max = entry.at("max").get<long long>();
    row.persistent = entry.value("persistent", true);
    rows.push_back(std::move(row));
  }
  return rows;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : rows_(read_rows(specification)) {
  for(const auto& row : rows_) values_[row.key] = row.fallback;
}

inline std::string SettingsManager::lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return text;
}

inline std::string SettingsManager::trimmed(const std::string& text) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  auto begin = std::find_if(text.begin(), text.end(), not_space);
  auto end = std::find_if(text.rbegin(), text.rend(), not_space).base();
  return begin < end ? std::string(begin, end) : std::string();
}

inline bool SettingsManager::is_bool_literal(const std::string& text) {
  static const std::vector<std::string> literals = {"true", "false", "on", "off", "yes", "no", "1", "0"};
  return std::find(literals.begin(), literals.end(), lowercase(trimmed(text))) != literals.end();
}

inline const SettingsManager::Row* SettingsManager::find_row(const std::string& token) const {
  const std::string wanted = lowercase(token);
  for(const auto& row : rows_) {
    if(lowercase(row.key) == wanted ||
       std::find(row.aliases.begin(), row.aliases.end(), wanted) != row.aliases.end()) {
      return &row;
    }
  }
  return nullptr;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* row = find_row(token)) return row->key;
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* row = find_row(key);
  return row && row->type == "bool";
}

inline std::optional<nlohmann::json> SettingsManager::coerce(const Row& row,
                                                             const nlohmann::json& value,
                                                             std::string& error) const {
  if(row.type == "bool") {
    if(value.is_boolean()) return value;
    if(value.is_number_integer()) return nlohmann::json(value.get<long long>() != 0);
    error = "expected true or false";
    return std::nullopt;
  }
  if(row.type == "int") {
    if(!value.is_number_integer()) {
      error = "expected an integer";
      return std::nullopt;
    }
    auto n = value.get<long long>();
    if((row.min && n < *row.min) || (row.max && n > *row.max)) {
      error = "must be between " + std::to_string(row.min.value_or(n)) + " and " +
              std::to_string(row.max.value_or(n));
      return std::nullopt;
    }
    return nlohmann::json(static_cast<int>(n));
  }
  if(row.type == "string") {
    if(value.is_string()) return value;
    error = "expected a string";
    return std::nullopt;
  }
  // strings: a lone string is a one element list
  if(value.is_string()) return nlohmann::json::array({value});
  if(value.is_array() && std::all_of(value.begin(), value.end(),
                                     [](const nlohmann::json& v){ return v.is_string(); })) {
    return value;
  }
  error = "expected a list of strings";
  return std::nullopt;
}

inline std::optional<nlohmann::json> SettingsManager::parse_text(const Row& row,
                                                                 const std::string& text,
                                                                 std::string& error) const {
  const std::string clean = trimmed(text);
  if(row.type == "bool") {
    if(!is_bool_literal(clean)) {
      error = "expected true|false|on|off|yes|no";
      return std::nullopt;
    }
    const auto v = lowercase(clean);
    return nlohmann::json(v == "true" || v == "on" || v == "yes" || v == "1");
  }
  if(row.type == "int") {
    std::size_t used = 0;
    try {
      long long n = std::stoll(clean, &used);
      if(used == clean.size()) return nlohmann::json(n);
    } catch(const std::exception&) {
      // reported below
    }
    error = "expected an integer";
    return std::nullopt;
  }
  if(row.type == "string") return nlohmann::json(clean);

  // strings: a JSON array, or a comma separated list
  if(!clean.empty() && clean.front() == '[') {
    auto parsed = nlohmann::json::parse(clean, nullptr, false);
    if(parsed.is_discarded()) {
      error = "malformed JSON list";
      return std::nullopt;
    }
    return parsed;
  }
  auto items = nlohmann::json::array();
  std::stringstream ss(clean);
  std::string item;
  while(std::getline(ss, item, ',')) {
    item = trimmed(item);
    if(!item.empty()) items.push_back(item);
  }
  return items;
}

inline bool SettingsManager::store(const Row& row, const nlohmann::json& value, std::string& error) {
  auto checked = coerce(row, value, error);
  if(!checked) return false;
  values_[row.key] = std::move(*checked);
  return true;
}

inline bool SettingsManager::set_from_string(const std::string& key, const std::string& text, std::string& error) {
  error.clear();
  const auto* row = find_row(key);
  if(!row) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_text(*row, text, error);
  return parsed && store(*row, *parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key, const nlohmann::json& value, std::string& error) {
  error.clear();
  const auto* row = find_row(key);
  if(!row) {
    error = "unknown setting";
    return false;
  }
  return store(*row, value, error);
}

inline std::filesystem::path SettingsManager::settings_path() const {
  return path_override_.empty() ? default_state_dir() / "settings.json" : path_override_;
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  auto doc = nlohmann::json::parse(in, nullptr, false);
  if(doc.is_discarded() || !doc.is_object()) {
    print_err("Failed to parse {}: not a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* row = find_row(item.key());
    if(!row || !row->persistent) continue;
    std::string error;
    if(!store(*row, item.value(), error)) {
      print_err("Ignoring {} in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err("Unable to write {}", path.string());
    return false;
  }
  auto doc = nlohmann::json::object();
  for(const auto& row : rows_) {
    if(row.persistent) doc[row.key] = values_.at(row.key);
  }
  out << doc.dump(2) << "\n";
  return static_cast<bool>(out);
}

inline std::vector<std::string> SettingsManager::get_strings(const std::string& key) const {
  if(!has(key)) throw std::out_of_range("Unknown setting: " + key);
  const auto& value = values_.at(key);
  if(value.is_string()) return {value.get<std::string>()};
  return value.get<std::vector<std::string>>();
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) throw std::out_of_range("Unknown setting: " + key);
  return values_.at(key).get<T>();
}
