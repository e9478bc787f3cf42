#pragma once
#include "file_operations.hpp"
#include "file_search.hpp"
#include "fs_error.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

// protocol.hpp
inline constexpr const char* kServerVersion = "1.0.0";

// Error codes carried by {"type":"error"}.
namespace error_code {
inline constexpr const char* kInvalidMessage = "invalid_message";
inline constexpr const char* kHelloRequired = "hello_required";
inline constexpr const char* kUnauthorized = "unauthorized";
inline constexpr const char* kForbidden = "forbidden";
inline constexpr const char* kSessionNotFound = "session_not_found";
inline constexpr const char* kSessionExists = "session_exists";
inline constexpr const char* kUnknownType = "unknown_type";
inline constexpr const char* kInputFailed = "input_failed";
} // namespace error_code

// hub -> client
json make_welcome(bool authenticated, const std::string& device_id, const std::string& device_name);
json make_error(const std::string& code, const std::string& message);
json make_pong();
json make_sessions(const json& sessions_array);
json make_pty_bytes(const std::string& session_id, const std::string& bytes);
json make_session_ended(const std::string& session_id, int exit_code);
json make_session_renamed(const std::string& session_id, const std::string& new_name);
json make_session_history(const std::string& session_id, const std::string& bytes, std::size_t total_bytes);
json make_waiting_for_input(const std::string& session_id,
                            const std::string& timestamp,
                            const std::string& prompt_content,
                            const std::string& wait_type,
                            const std::string& cli_type);
json make_waiting_cleared(const std::string& session_id, const std::string& timestamp);
json make_spawn_result(bool success,
                       const std::optional<std::string>& session_id,
                       const std::optional<std::string>& error);

json make_directory_listing(const std::string& request_id, const DirectoryListing& listing);
json make_file_content(const std::string& request_id, const FileContent& content);
json make_file_info(const std::string& request_id, const std::string& path, const FileEntry& entry);
json make_file_chunk(const std::string& request_id, const FileChunk& chunk);
json make_search_results(const std::string& request_id, const std::string& query, const SearchResults& results);
json make_operation_success(const std::string& request_id,
                            const std::string& operation,
                            const std::string& path,
                            const std::optional<std::string>& message = std::nullopt);
json make_operation_error(const std::string& request_id,
                          const std::string& operation,
                          const std::string& path,
                          const FsError& error);
json make_file_changed(const std::string& path,
                       const std::string& change_type,
                       const std::optional<FileEntry>& new_entry,
                       const std::optional<std::string>& old_path = std::nullopt);
json make_home_directory(const std::string& request_id, const std::string& path);
json make_allowed_roots(const std::string& request_id, const std::vector<std::string>& roots);

// hub <-> wrapper
json make_register_pty(const std::string& session_id,
                       const std::string& name,
                       const std::string& command,
                       const std::string& project_path);
json make_registered(const std::string& session_id);
json make_pty_output(const std::string& bytes);
json make_wrapper_ended(int exit_code);
json make_input(const std::string& bytes);
json make_resize(uint16_t cols, uint16_t rows);
