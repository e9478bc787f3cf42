#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

enum class FsErrorKind {
  NotFound,
  PermissionDenied,
  PathTraversal,
  SymlinkEscape,
  NotADirectory,
  NotAFile,
  AlreadyExists,
  NotEmpty,
  FileTooLarge,
  InvalidEncoding,
  IoError,
  RateLimited
};

const char* fs_error_code(FsErrorKind kind);

// Every filesystem operation reports failure by throwing FsError. The hub
// converts it into an operation_error payload via to_json().
class FsError : public std::runtime_error {
public:
  FsError(FsErrorKind kind, std::string path, std::string message);

  static FsError not_found(const std::string& path);
  static FsError permission_denied(const std::string& path, const std::string& reason);
  static FsError path_traversal(const std::string& attempted_path);
  static FsError symlink_escape(const std::string& path);
  static FsError not_a_directory(const std::string& path);
  static FsError not_a_file(const std::string& path);
  static FsError already_exists(const std::string& path);
  static FsError not_empty(const std::string& path);
  static FsError file_too_large(const std::string& path, uint64_t size, uint64_t max_size);
  static FsError invalid_encoding(const std::string& path);
  static FsError io_error(const std::string& message);
  static FsError rate_limited(uint64_t retry_after_ms);

  // Maps an OS error raised after validation. ENOENT becomes NotFound,
  // everything else an IoError carrying only the system message.
  static FsError from_error_code(const std::error_code& ec, const std::string& path);

  FsErrorKind kind() const { return kind_; }
  const std::string& path() const { return path_; }
  uint64_t size() const { return size_; }
  uint64_t max_size() const { return max_size_; }
  uint64_t retry_after_ms() const { return retry_after_ms_; }

  nlohmann::json to_json() const;

private:
  FsErrorKind kind_;
  std::string path_;
  uint64_t size_ = 0;
  uint64_t max_size_ = 0;
  uint64_t retry_after_ms_ = 0;
  std::string reason_;
};
