#include "fs_error.hpp"

const char* fs_error_code(FsErrorKind kind) {
  switch(kind) {
    case FsErrorKind::NotFound:         return "not_found";
    case FsErrorKind::PermissionDenied: return "permission_denied";
    case FsErrorKind::PathTraversal:    return "path_traversal";
    case FsErrorKind::SymlinkEscape:    return "symlink_escape";
    case FsErrorKind::NotADirectory:    return "not_a_directory";
    case FsErrorKind::NotAFile:         return "not_a_file";
    case FsErrorKind::AlreadyExists:    return "already_exists";
    case FsErrorKind::NotEmpty:         return "not_empty";
    case FsErrorKind::FileTooLarge:     return "file_too_large";
    case FsErrorKind::InvalidEncoding:  return "invalid_encoding";
    case FsErrorKind::IoError:          return "io_error";
    case FsErrorKind::RateLimited:      return "rate_limited";
  }
  return "io_error";
}

FsError::FsError(FsErrorKind kind, std::string path, std::string message)
  : std::runtime_error(std::move(message)),
    kind_(kind),
    path_(std::move(path)) {}

FsError FsError::not_found(const std::string& path) {
  return FsError(FsErrorKind::NotFound, path, "Not found: " + path);
}

FsError FsError::permission_denied(const std::string& path, const std::string& reason) {
  FsError e(FsErrorKind::PermissionDenied, path, "Permission denied: " + path + " (" + reason + ")");
  e.reason_ = reason;
  return e;
}

FsError FsError::path_traversal(const std::string& attempted_path) {
  return FsError(FsErrorKind::PathTraversal, attempted_path, "Path traversal rejected: " + attempted_path);
}

FsError FsError::symlink_escape(const std::string& path) {
  FsError e(FsErrorKind::SymlinkEscape, path, "Symlink escapes allowed directories: " + path);
  e.reason_ = "symlink target outside allowed directories";
  return e;
}

FsError FsError::not_a_directory(const std::string& path) {
  return FsError(FsErrorKind::NotADirectory, path, "Not a directory: " + path);
}

FsError FsError::not_a_file(const std::string& path) {
  return FsError(FsErrorKind::NotAFile, path, "Not a file: " + path);
}

FsError FsError::already_exists(const std::string& path) {
  return FsError(FsErrorKind::AlreadyExists, path, "Already exists: " + path);
}

FsError FsError::not_empty(const std::string& path) {
  return FsError(FsErrorKind::NotEmpty, path, "Directory not empty: " + path);
}

FsError FsError::file_too_large(const std::string& path, uint64_t size, uint64_t max_size) {
  FsError e(FsErrorKind::FileTooLarge, path,
            "File too large: " + path + " (" + std::to_string(size) + " > " + std::to_string(max_size) + " bytes)");
  e.size_ = size;
  e.max_size_ = max_size;
  return e;
}

FsError FsError::invalid_encoding(const std::string& path) {
  return FsError(FsErrorKind::InvalidEncoding, path, "Invalid encoding: " + path);
}

FsError FsError::io_error(const std::string& message) {
  return FsError(FsErrorKind::IoError, std::string(), message);
}

FsError FsError::rate_limited(uint64_t retry_after_ms) {
  FsError e(FsErrorKind::RateLimited, std::string(),
            "Rate limited, retry after " + std::to_string(retry_after_ms) + " ms");
  e.retry_after_ms_ = retry_after_ms;
  return e;
}

FsError FsError::from_error_code(const std::error_code& ec, const std::string& path) {
  if(ec == std::errc::no_such_file_or_directory) return not_found(path);
  if(ec == std::errc::not_a_directory) return not_a_directory(path);
  if(ec == std::errc::directory_not_empty) return not_empty(path);
  if(ec == std::errc::file_exists) return already_exists(path);
  if(ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
    return permission_denied(path, ec.message());
  }
  return io_error(ec.message());
}

nlohmann::json FsError::to_json() const {
  nlohmann::json j;
  j["code"] = fs_error_code(kind_);
  j["message"] = what();
  switch(kind_) {
    case FsErrorKind::PathTraversal:
      j["attempted_path"] = path_;
      break;
    case FsErrorKind::PermissionDenied:
    case FsErrorKind::SymlinkEscape:
      j["path"] = path_;
      j["reason"] = reason_;
      break;
    case FsErrorKind::FileTooLarge:
      j["path"] = path_;
      j["size"] = size_;
      j["max_size"] = max_size_;
      break;
    case FsErrorKind::RateLimited:
      j["retry_after_ms"] = retry_after_ms_;
      break;
    case FsErrorKind::IoError:
      break;
    default:
      j["path"] = path_;
      break;
  }
  return j;
}
