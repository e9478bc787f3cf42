#include "protocol.hpp"

#include "utils.hpp"

json make_welcome(bool authenticated, const std::string& device_id, const std::string& device_name) {
  json j;
  j["type"] = "welcome";
  j["server_version"] = kServerVersion;
  j["authenticated"] = authenticated;
  if(!device_id.empty()) j["device_id"] = device_id;
  if(!device_name.empty()) j["device_name"] = device_name;
  return j;
}

json make_error(const std::string& code, const std::string& message) {
  return {{"type", "error"}, {"code", code}, {"message", message}};
}

json make_pong() {
  return {{"type", "pong"}};
}

json make_sessions(const json& sessions_array) {
  json j;
  j["type"] = "sessions";
  j["sessions"] = sessions_array;
  return j;
}

json make_pty_bytes(const std::string& session_id, const std::string& bytes) {
  return {{"type", "pty_bytes"}, {"session_id", session_id}, {"data", base64_encode(bytes)}};
}

json make_session_ended(const std::string& session_id, int exit_code) {
  return {{"type", "session_ended"}, {"session_id", session_id}, {"exit_code", exit_code}};
}

json make_session_renamed(const std::string& session_id, const std::string& new_name) {
  return {{"type", "session_renamed"}, {"session_id", session_id}, {"new_name", new_name}};
}

json make_session_history(const std::string& session_id, const std::string& bytes, std::size_t total_bytes) {
  return {
    {"type", "session_history"},
    {"session_id", session_id},
    {"data", base64_encode(bytes)},
    {"total_bytes", total_bytes}
  };
}

json make_waiting_for_input(const std::string& session_id,
                            const std::string& timestamp,
                            const std::string& prompt_content,
                            const std::string& wait_type,
                            const std::string& cli_type) {
  return {
    {"type", "waiting_for_input"},
    {"session_id", session_id},
    {"timestamp", timestamp},
    {"prompt_content", prompt_content},
    {"wait_type", wait_type},
    {"cli_type", cli_type}
  };
}

json make_waiting_cleared(const std::string& session_id, const std::string& timestamp) {
  return {{"type", "waiting_cleared"}, {"session_id", session_id}, {"timestamp", timestamp}};
}

json make_spawn_result(bool success,
                       const std::optional<std::string>& session_id,
                       const std::optional<std::string>& error) {
  json j;
  j["type"] = "spawn_result";
  j["success"] = success;
  if(session_id) j["session_id"] = *session_id;
  if(error) j["error"] = *error;
  return j;
}

json make_directory_listing(const std::string& request_id, const DirectoryListing& listing) {
  json entries = json::array();
  for(const auto& e : listing.entries) entries.push_back(e.to_json());
  return {
    {"type", "directory_listing"},
    {"request_id", request_id},
    {"path", listing.path},
    {"entries", std::move(entries)},
    {"total_count", listing.total_count},
    {"truncated", listing.truncated}
  };
}

json make_file_content(const std::string& request_id, const FileContent& content) {
  json j = {
    {"type", "file_content"},
    {"request_id", request_id},
    {"path", content.path},
    {"content", content.content},
    {"encoding", encoding_name(content.encoding)},
    {"mime_type", content.mime_type},
    {"size", content.size},
    {"modified", content.modified_ms}
  };
  if(content.truncated_at) j["truncated_at"] = *content.truncated_at;
  return j;
}

json make_file_info(const std::string& request_id, const std::string& path, const FileEntry& entry) {
  return {{"type", "file_info"}, {"request_id", request_id}, {"path", path}, {"entry", entry.to_json()}};
}

json make_file_chunk(const std::string& request_id, const FileChunk& chunk) {
  return {
    {"type", "file_chunk"},
    {"request_id", request_id},
    {"path", chunk.path},
    {"chunk_index", chunk.chunk_index},
    {"total_chunks", chunk.total_chunks},
    {"total_size", chunk.total_size},
    {"data", chunk.data},
    {"checksum", chunk.checksum},
    {"is_last", chunk.is_last}
  };
}

json make_search_results(const std::string& request_id, const std::string& query, const SearchResults& results) {
  json matches = json::array();
  for(const auto& m : results.matches) matches.push_back(m.to_json());
  return {
    {"type", "search_results"},
    {"request_id", request_id},
    {"query", query},
    {"path", results.path},
    {"matches", std::move(matches)},
    {"truncated", results.truncated}
  };
}

json make_operation_success(const std::string& request_id,
                            const std::string& operation,
                            const std::string& path,
                            const std::optional<std::string>& message) {
  json j = {
    {"type", "operation_success"},
    {"request_id", request_id},
    {"operation", operation},
    {"path", path}
  };
  if(message) j["message"] = *message;
  return j;
}

json make_operation_error(const std::string& request_id,
                          const std::string& operation,
                          const std::string& path,
                          const FsError& error) {
  return {
    {"type", "operation_error"},
    {"request_id", request_id},
    {"operation", operation},
    {"path", path},
    {"error", error.to_json()}
  };
}

json make_file_changed(const std::string& path,
                       const std::string& change_type,
                       const std::optional<FileEntry>& new_entry,
                       const std::optional<std::string>& old_path) {
  json j = {{"type", "file_changed"}, {"path", path}, {"change_type", change_type}};
  if(new_entry) j["new_entry"] = new_entry->to_json();
  if(old_path) j["old_path"] = *old_path;
  return j;
}

json make_home_directory(const std::string& request_id, const std::string& path) {
  return {{"type", "home_directory"}, {"request_id", request_id}, {"path", path}};
}

json make_allowed_roots(const std::string& request_id, const std::vector<std::string>& roots) {
  return {{"type", "allowed_roots"}, {"request_id", request_id}, {"roots", roots}};
}

json make_register_pty(const std::string& session_id,
                       const std::string& name,
                       const std::string& command,
                       const std::string& project_path) {
  json j;
  j["type"] = "register_pty";
  if(!session_id.empty()) j["session_id"] = session_id;
  j["name"] = name;
  j["command"] = command;
  j["project_path"] = project_path;
  return j;
}

json make_registered(const std::string& session_id) {
  return {{"type", "registered"}, {"session_id", session_id}};
}

json make_pty_output(const std::string& bytes) {
  return {{"type", "pty_output"}, {"data", base64_encode(bytes)}};
}

json make_wrapper_ended(int exit_code) {
  return {{"type", "session_ended"}, {"exit_code", exit_code}};
}

json make_input(const std::string& bytes) {
  return {{"type", "input"}, {"data", base64_encode(bytes)}};
}

json make_resize(uint16_t cols, uint16_t rows) {
  return {{"type", "resize"}, {"cols", cols}, {"rows", rows}};
}
