#pragma once

#include "fs_error.hpp"
#include "path_validator.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class SortField { Name, Size, Modified, Type };
enum class SortOrder { Asc, Desc };
enum class FileEncoding { Utf8, Base64 };

SortField sort_field_from_string(const std::string& value);
SortOrder sort_order_from_string(const std::string& value);
FileEncoding encoding_from_string(const std::string& value);
const char* encoding_name(FileEncoding encoding);

struct FileEntry {
  std::string name;
  std::string path;
  bool is_directory = false;
  bool is_symlink = false;
  bool is_hidden = false;
  uint64_t size = 0;
  uint64_t modified_ms = 0;
  std::optional<uint64_t> created_ms;
  std::optional<std::string> mime_type;
  std::string permissions;
  std::optional<std::string> symlink_target;

  nlohmann::json to_json() const;
};

struct DirectoryListing {
  std::string path;
  std::vector<FileEntry> entries;
  std::size_t total_count = 0;
  bool truncated = false;
};

struct FileContent {
  std::string path;
  std::string content;
  FileEncoding encoding = FileEncoding::Utf8;
  std::string mime_type;
  uint64_t size = 0;
  uint64_t modified_ms = 0;
  std::optional<uint64_t> truncated_at;
};

struct FileChunk {
  std::string path;
  uint64_t chunk_index = 0;
  uint64_t total_chunks = 0;
  uint64_t total_size = 0;
  std::string data;      // base64
  std::string checksum;  // sha256 hex of the raw chunk
  bool is_last = false;
};

class FileOperations {
public:
  static constexpr uint64_t kDefaultChunkSize = 256 * 1024;

  explicit FileOperations(std::shared_ptr<PathValidator> validator);

  const PathValidator& validator() const { return *validator_; }

  DirectoryListing list_directory(const std::string& path,
                                  bool include_hidden,
                                  SortField sort_by = SortField::Name,
                                  SortOrder order = SortOrder::Asc) const;

  FileContent read_file(const std::string& path,
                        uint64_t offset = 0,
                        std::optional<uint64_t> length = std::nullopt,
                        FileEncoding encoding = FileEncoding::Utf8) const;

  FileChunk read_file_chunk(const std::string& path,
                            uint64_t chunk_index,
                            uint64_t chunk_size = kDefaultChunkSize) const;

  // The mutating operations return the canonical path they acted on.
  std::string write_file(const std::string& path,
                         const std::string& content,
                         FileEncoding encoding,
                         bool create_parents) const;
  std::string create_directory(const std::string& path, bool recursive) const;
  std::string delete_path(const std::string& path, bool recursive) const;
  std::string rename_path(const std::string& from, const std::string& to) const;
  std::string copy_path(const std::string& from, const std::string& to, bool recursive) const;

  FileEntry get_file_info(const std::string& path) const;

  // Throws FsError::not_found when the entry vanished.
  static FileEntry make_entry(const std::filesystem::path& path);
  static void sort_entries(std::vector<FileEntry>& entries, SortField field, SortOrder order);

private:
  // Like validate_existing, but a trailing symlink is kept as the link itself
  // so delete/rename/info act on the link and not on its target.
  std::filesystem::path resolve_entry(const SandboxPolicy& policy, const std::string& path) const;
  void ensure_writable(const SandboxPolicy& policy,
                       const std::filesystem::path& target,
                       const std::string& raw) const;

  std::shared_ptr<PathValidator> validator_;
};
