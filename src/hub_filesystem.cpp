#include "hub.hpp"

#include "change_watcher.hpp"
#include "file_operations.hpp"
#include "file_search.hpp"
#include "mime.hpp"
#include "protocol.hpp"
#include "sandbox_policy.hpp"
#include "upload_path.hpp"

#include <set>

namespace fs = std::filesystem;

namespace {

const std::set<std::string>& filesystem_request_types() {
  static const std::set<std::string> types = {
    "list_directory", "read_file", "read_file_chunk", "write_file",
    "create_directory", "delete_path", "rename_path", "copy_path",
    "get_file_info", "search_files", "upload_file",
    "watch_directory", "unwatch_directory",
    "get_home_directory", "get_allowed_roots"
  };
  return types;
}

// The path an operation_error for this request reports.
std::string subject_path(const std::string& type, const nlohmann::json& msg) {
  if(type == "rename_path") return msg.value("old_path", std::string());
  if(type == "copy_path") return msg.value("source", std::string());
  if(type == "upload_file") return msg.value("session_id", std::string());
  return msg.value("path", std::string());
}

template<typename T>
std::optional<T> optional_field(const nlohmann::json& msg, const char* key) {
  auto it = msg.find(key);
  if(it == msg.end() || it->is_null()) return std::nullopt;
  return it->get<T>();
}

} // namespace

template<typename Fn>
void Hub::run_on_worker(const ConnPtr& conn,
                        const std::string& request_id,
                        const std::string& operation,
                        const std::string& path,
                        Fn fn) {
  std::weak_ptr<Connection> weak = conn;
  asio::post(workers_, [weak, logger = logger_, request_id, operation, path, fn = std::move(fn)]() mutable {
    json reply;
    try {
      reply = fn();
    } catch(const FsError& e) {
      reply = make_operation_error(request_id, operation, path, e);
    } catch(const std::exception& e) {
      logger->error("{} failed: {}", operation, e.what());
      reply = make_operation_error(request_id, operation, path, FsError::io_error("internal error"));
    }
    auto conn = weak.lock();
    if(conn && conn->is_open()) conn->async_send_json(reply);
  });
}

bool Hub::handle_filesystem_request(const ConnPtr& conn, ClientState& st, const std::string& type, const json& msg) {
  if(!filesystem_request_types().count(type)) return false;

  const auto request_id = msg.at("request_id").get<std::string>();
  const auto path = subject_path(type, msg);

  if(auto retry_after = st.limiter.allow()) {
    logger_->debug("rate limited {} from {}", type, conn->remote_address());
    conn->async_send_json(make_operation_error(request_id, type, path, FsError::rate_limited(*retry_after)));
    return true;
  }

  auto files = files_;
  if(type == "list_directory") {
    bool include_hidden = msg.value("include_hidden", false);
    auto sort_by = sort_field_from_string(optional_field<std::string>(msg, "sort_by").value_or("name"));
    auto order = sort_order_from_string(optional_field<std::string>(msg, "sort_order").value_or("asc"));
    run_on_worker(conn, request_id, type, path, [=]{
      return make_directory_listing(request_id, files->list_directory(path, include_hidden, sort_by, order));
    });
  } else if(type == "read_file") {
    auto offset = optional_field<uint64_t>(msg, "offset").value_or(0);
    auto length = optional_field<uint64_t>(msg, "length");
    auto encoding = encoding_from_string(optional_field<std::string>(msg, "encoding").value_or("utf8"));
    run_on_worker(conn, request_id, type, path, [=]{
      return make_file_content(request_id, files->read_file(path, offset, length, encoding));
    });
  } else if(type == "read_file_chunk") {
    auto index = msg.at("chunk_index").get<uint64_t>();
    auto chunk_size = optional_field<uint64_t>(msg, "chunk_size").value_or(FileOperations::kDefaultChunkSize);
    run_on_worker(conn, request_id, type, path, [=]{
      return make_file_chunk(request_id, files->read_file_chunk(path, index, chunk_size));
    });
  } else if(type == "write_file") {
    auto content = msg.at("content").get<std::string>();
    auto encoding = encoding_from_string(optional_field<std::string>(msg, "encoding").value_or("utf8"));
    bool create_parents = msg.value("create_parents", false);
    run_on_worker(conn, request_id, type, path, [=]{
      files->write_file(path, content, encoding, create_parents);
      return make_operation_success(request_id, type, path, std::nullopt);
    });
  } else if(type == "create_directory") {
    bool recursive = msg.value("recursive", false);
    run_on_worker(conn, request_id, type, path, [=]{
      files->create_directory(path, recursive);
      return make_operation_success(request_id, type, path, std::nullopt);
    });
  } else if(type == "delete_path") {
    bool recursive = msg.value("recursive", false);
    run_on_worker(conn, request_id, type, path, [=]{
      files->delete_path(path, recursive);
      return make_operation_success(request_id, type, path, std::nullopt);
    });
  } else if(type == "rename_path") {
    auto new_path = msg.at("new_path").get<std::string>();
    run_on_worker(conn, request_id, type, path, [=]{
      files->rename_path(path, new_path);
      return make_operation_success(request_id, type, path, std::string("renamed to ") + new_path);
    });
  } else if(type == "copy_path") {
    auto destination = msg.at("destination").get<std::string>();
    bool recursive = msg.value("recursive", false);
    run_on_worker(conn, request_id, type, path, [=]{
      files->copy_path(path, destination, recursive);
      return make_operation_success(request_id, type, path, std::string("copied to ") + destination);
    });
  } else if(type == "get_file_info") {
    run_on_worker(conn, request_id, type, path, [=]{
      return make_file_info(request_id, path, files->get_file_info(path));
    });
  } else if(type == "search_files") {
    auto pattern = msg.at("pattern").get<std::string>();
    auto content_pattern = optional_field<std::string>(msg, "content_pattern");
    auto max_depth = optional_field<uint32_t>(msg, "max_depth");
    auto max_results = optional_field<std::size_t>(msg, "max_results");
    run_on_worker(conn, request_id, type, path, [=]{
      FileSearch search(*files);
      return make_search_results(request_id, pattern,
                                 search.search_files(path, pattern, content_pattern, max_depth, max_results));
    });
  } else if(type == "upload_file") {
    handle_upload(conn, msg);
  } else if(type == "watch_directory") {
    handle_watch(conn, st, msg);
  } else if(type == "unwatch_directory") {
    handle_unwatch(conn, st, msg);
  } else if(type == "get_home_directory") {
    conn->async_send_json(make_home_directory(request_id, home_directory().string()));
  } else if(type == "get_allowed_roots") {
    std::vector<std::string> roots;
    for(const auto& root : files_->validator().policy()->allowed_roots) roots.push_back(root.string());
    conn->async_send_json(make_allowed_roots(request_id, roots));
  }
  return true;
}

void Hub::handle_upload(const ConnPtr& conn, const json& msg) {
  const auto request_id = msg.at("request_id").get<std::string>();
  const auto session_id = msg.at("session_id").get<std::string>();
  auto file_name = msg.at("file_name").get<std::string>();
  auto content = msg.at("content_base64").get<std::string>();
  auto mime_type = optional_field<std::string>(msg, "mime_type");

  auto session = sessions_->find(session_id);
  if(!session) {
    conn->async_send_json(make_operation_error(request_id, "upload_file", session_id,
                                               FsError::not_found("session:" + session_id)));
    return;
  }
  const std::string project = session->project_path();
  auto files = files_;
  logger_->debug("upload '{}' ({} base64 bytes) into {}", file_name, content.size(), project);
  run_on_worker(conn, request_id, "upload_file", project, [=]{
    auto name = sanitize_upload_file_name(file_name);
    auto destination = build_upload_destination(project, name).string();
    files->write_file(destination, content, FileEncoding::Base64, true);
    return make_operation_success(request_id, "upload_file", destination,
                                  mime_type.value_or(mime_from_extension(name)));
  });
}

void Hub::handle_watch(const ConnPtr& conn, ClientState& st, const json& msg) {
  const auto request_id = msg.at("request_id").get<std::string>();
  const auto raw = msg.at("path").get<std::string>();
  try {
    auto dir = files_->validator().validate_existing(raw);
    if(!fs::is_directory(dir)) throw FsError::not_a_directory(raw);
    auto key = dir.string();
    if(!st.watched.count(key)) {
      watcher_->watch(dir);
      std::lock_guard lg(m_);
      st.watched.insert(key);
    }
    conn->async_send_json(make_operation_success(request_id, "watch_directory", raw, std::nullopt));
  } catch(const FsError& e) {
    conn->async_send_json(make_operation_error(request_id, "watch_directory", raw, e));
  }
}

void Hub::handle_unwatch(const ConnPtr& conn, ClientState& st, const json& msg) {
  const auto request_id = msg.at("request_id").get<std::string>();
  const auto raw = msg.at("path").get<std::string>();
  // the directory may be gone already; fall back to the lexical form
  std::string key = fs::path(raw).lexically_normal().string();
  try {
    key = files_->validator().validate_existing(raw).string();
  } catch(const FsError& e) {
    logger_->debug("unwatch of {} without validation: {}", raw, e.what());
  }
  bool removed = false;
  {
    std::lock_guard lg(m_);
    removed = st.watched.erase(key) > 0;
  }
  if(removed) watcher_->unwatch(key);
  conn->async_send_json(make_operation_success(request_id, "unwatch_directory", raw, std::nullopt));
}

// Runs on the watcher thread.
void Hub::on_file_change(const ChangeEvent& event) {
  auto policy = files_->validator().policy();
  if(policy->is_denied(event.path)) return;

  std::optional<FileEntry> entry;
  if(event.kind == ChangeKind::Created || event.kind == ChangeKind::Modified) {
    try {
      entry = FileOperations::make_entry(event.path);
    } catch(const FsError& e) {
      logger_->debug("{} vanished before it could be described: {}", event.path, e.what());
    }
  }
  auto message = make_file_changed(event.path, change_kind_name(event.kind), entry, event.from);
  std::weak_ptr<Hub> weak = weak_from_this();
  asio::post(io_, [weak, path = event.path, message = std::move(message)]{
    if(auto self = weak.lock()) self->deliver_file_change(path, message);
  });
}

void Hub::deliver_file_change(const std::string& path, const json& message) {
  const std::string parent = fs::path(path).parent_path().string();
  for(auto& kv : clients_) {
    const auto& watched = kv.second.watched;
    if(watched.count(path) || watched.count(parent)) {
      kv.second.conn->async_send_json(message);
    }
  }
}
