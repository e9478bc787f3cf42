#include "file_operations.hpp"

#include "mime.hpp"
#include "utils.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kMimeSniffBytes = 64;

uint64_t timespec_millis(const timespec& ts) {
  if(ts.tv_sec < 0) return 0;
  return static_cast<uint64_t>(ts.tv_sec) * 1000 + static_cast<uint64_t>(ts.tv_nsec / 1000000);
}

std::string permission_string(mode_t mode) {
  std::string out(9, '-');
  const mode_t bits[9] = {S_IRUSR, S_IWUSR, S_IXUSR, S_IRGRP, S_IWGRP, S_IXGRP, S_IROTH, S_IWOTH, S_IXOTH};
  const char marks[3] = {'r', 'w', 'x'};
  for(int i = 0; i < 9; ++i) {
    if(mode & bits[i]) out[static_cast<std::size_t>(i)] = marks[i % 3];
  }
  return out;
}

std::string lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

std::string extension_of(const std::string& name) {
  auto pos = name.rfind('.');
  if(pos == std::string::npos || pos == 0) return std::string();
  return lower_copy(name.substr(pos + 1));
}

std::string read_range(const fs::path& path, uint64_t offset, uint64_t count, const std::string& raw) {
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    std::error_code ec;
    if(!fs::exists(path, ec)) throw FsError::not_found(raw);
    throw FsError::io_error("unable to open file for reading");
  }
  in.seekg(static_cast<std::streamoff>(offset));
  std::string data(static_cast<std::size_t>(count), '\0');
  if(count > 0) {
    in.read(&data[0], static_cast<std::streamsize>(count));
    data.resize(static_cast<std::size_t>(in.gcount()));
  }
  return data;
}

class FdCloser {
public:
  explicit FdCloser(int fd) : fd_(fd) {}
  ~FdCloser() { if(fd_ >= 0) ::close(fd_); }
  FdCloser(const FdCloser&) = delete;
  FdCloser& operator=(const FdCloser&) = delete;
  int get() const { return fd_; }
private:
  int fd_;
};

std::string read_fd_range(int fd, uint64_t offset, uint64_t count, const std::string& raw) {
  std::string data(static_cast<std::size_t>(count), '\0');
  std::size_t done = 0;
  while(done < data.size()) {
    ssize_t n = ::pread(fd, &data[done], data.size() - done, static_cast<off_t>(offset + done));
    if(n < 0) {
      if(errno == EINTR) continue;
      throw FsError::from_error_code(std::error_code(errno, std::generic_category()), raw);
    }
    if(n == 0) break;
    done += static_cast<std::size_t>(n);
  }
  data.resize(done);
  return data;
}

uint64_t tree_size(const fs::path& root) {
  std::error_code ec;
  if(!fs::is_directory(fs::symlink_status(root, ec))) {
    auto size = fs::file_size(root, ec);
    return ec ? 0 : size;
  }
  uint64_t total = 0;
  for(fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec), end;
      !ec && it != end; it.increment(ec)) {
    std::error_code size_ec;
    if(it->is_regular_file(size_ec)) {
      auto size = it->file_size(size_ec);
      if(!size_ec) total += size;
    }
  }
  return total;
}

} // namespace

SortField sort_field_from_string(const std::string& value) {
  if(value == "size") return SortField::Size;
  if(value == "modified") return SortField::Modified;
  if(value == "type") return SortField::Type;
  return SortField::Name;
}

SortOrder sort_order_from_string(const std::string& value) {
  return value == "desc" ? SortOrder::Desc : SortOrder::Asc;
}

FileEncoding encoding_from_string(const std::string& value) {
  return value == "base64" ? FileEncoding::Base64 : FileEncoding::Utf8;
}

const char* encoding_name(FileEncoding encoding) {
  return encoding == FileEncoding::Base64 ? "base64" : "utf8";
}

nlohmann::json FileEntry::to_json() const {
  nlohmann::json j;
  j["name"] = name;
  j["path"] = path;
  j["is_directory"] = is_directory;
  j["is_symlink"] = is_symlink;
  j["is_hidden"] = is_hidden;
  j["size"] = size;
  j["modified"] = modified_ms;
  j["created"] = created_ms ? nlohmann::json(*created_ms) : nlohmann::json(nullptr);
  if(mime_type) j["mime_type"] = *mime_type;
  if(!permissions.empty()) j["permissions"] = permissions;
  if(symlink_target) j["symlink_target"] = *symlink_target;
  return j;
}

FileOperations::FileOperations(std::shared_ptr<PathValidator> validator)
  : validator_(std::move(validator)) {}

FileEntry FileOperations::make_entry(const fs::path& path) {
  struct stat lst{};
  if(::lstat(path.c_str(), &lst) != 0) {
    throw FsError::from_error_code(std::error_code(errno, std::generic_category()), path.string());
  }

  FileEntry entry;
  entry.name = path.filename().string();
  entry.path = path.string();
  entry.is_hidden = !entry.name.empty() && entry.name[0] == '.';
  entry.is_symlink = S_ISLNK(lst.st_mode);

  struct stat st = lst;
  if(entry.is_symlink) {
    std::error_code ec;
    auto target = fs::read_symlink(path, ec);
    if(!ec) entry.symlink_target = target.string();
    // dangling links are reported with the link's own metadata
    struct stat followed{};
    if(::stat(path.c_str(), &followed) == 0) st = followed;
  }

  entry.is_directory = S_ISDIR(st.st_mode);
  entry.size = entry.is_directory ? 0 : static_cast<uint64_t>(st.st_size);
  entry.modified_ms = timespec_millis(st.st_mtim);
  entry.permissions = permission_string(st.st_mode);
  if(!entry.is_directory) {
    entry.mime_type = mime_from_extension(entry.name);
  }
  return entry;
}

void FileOperations::sort_entries(std::vector<FileEntry>& entries, SortField field, SortOrder order) {
  auto compare_field = [field](const FileEntry& a, const FileEntry& b) -> int {
    switch(field) {
      case SortField::Size:
        if(a.size != b.size) return a.size < b.size ? -1 : 1;
        break;
      case SortField::Modified:
        if(a.modified_ms != b.modified_ms) return a.modified_ms < b.modified_ms ? -1 : 1;
        break;
      case SortField::Type: {
        auto ea = extension_of(a.name);
        auto eb = extension_of(b.name);
        if(ea != eb) return ea < eb ? -1 : 1;
        break;
      }
      case SortField::Name:
        break;
    }
    auto na = lower_copy(a.name);
    auto nb = lower_copy(b.name);
    if(na != nb) return na < nb ? -1 : 1;
    return a.name.compare(b.name);
  };

  std::stable_sort(entries.begin(), entries.end(),
    [&](const FileEntry& a, const FileEntry& b){
      if(a.is_directory != b.is_directory) return a.is_directory;
      int cmp = compare_field(a, b);
      return order == SortOrder::Asc ? cmp < 0 : cmp > 0;
    });
}

fs::path FileOperations::resolve_entry(const SandboxPolicy& policy, const std::string& path) const {
  fs::path input(path);
  std::error_code ec;
  if(input.is_absolute() && input.has_filename() &&
     fs::is_symlink(fs::symlink_status(input, ec))) {
    auto parent = validator_->validate_existing(policy, input.parent_path().string());
    auto link = parent / input.filename();
    if(auto pattern = policy.denied_by(link)) {
      throw FsError::permission_denied(path, "matches denied pattern " + *pattern);
    }
    return link;
  }
  return validator_->validate_existing(policy, path);
}

void FileOperations::ensure_writable(const SandboxPolicy& policy,
                                     const fs::path& target,
                                     const std::string& raw) const {
  if(!policy.is_writable(target)) {
    throw FsError::permission_denied(raw, "read-only location");
  }
}

DirectoryListing FileOperations::list_directory(const std::string& path,
                                                bool include_hidden,
                                                SortField sort_by,
                                                SortOrder order) const {
  auto policy = validator_->policy();
  auto dir = validator_->validate_existing(*policy, path);

  std::error_code ec;
  if(!fs::is_directory(dir, ec)) {
    throw FsError::not_a_directory(path);
  }

  DirectoryListing listing;
  listing.path = dir.string();

  fs::directory_iterator it(dir, ec);
  if(ec) throw FsError::from_error_code(ec, path);
  for(fs::directory_iterator end; it != end; it.increment(ec)) {
    if(ec) break;
    const auto& entry_path = it->path();
    const auto name = entry_path.filename().string();
    if(!include_hidden && !name.empty() && name[0] == '.') continue;
    if(policy->is_denied(entry_path)) continue;
    try {
      listing.entries.push_back(make_entry(entry_path));
    } catch(const FsError& e) {
      // removed between readdir and stat
      if(e.kind() != FsErrorKind::NotFound) throw;
    }
  }
  if(ec) throw FsError::from_error_code(ec, path);

  sort_entries(listing.entries, sort_by, order);
  listing.total_count = listing.entries.size();
  if(listing.entries.size() > policy->max_list_entries) {
    listing.entries.resize(policy->max_list_entries);
    listing.truncated = true;
  }
  return listing;
}

FileContent FileOperations::read_file(const std::string& path,
                                      uint64_t offset,
                                      std::optional<uint64_t> length,
                                      FileEncoding encoding) const {
  auto policy = validator_->policy();
  auto target = validator_->validate_existing(*policy, path);

  // size and bytes come from one open file, so a concurrent replace is seen whole or not at all
  FdCloser file(::open(target.c_str(), O_RDONLY | O_CLOEXEC));
  if(file.get() < 0) {
    throw FsError::from_error_code(std::error_code(errno, std::generic_category()), path);
  }
  struct stat st{};
  if(::fstat(file.get(), &st) != 0) {
    throw FsError::from_error_code(std::error_code(errno, std::generic_category()), path);
  }
  if(S_ISDIR(st.st_mode)) throw FsError::not_a_file(path);

  const auto size = static_cast<uint64_t>(st.st_size);
  if(size > policy->max_read_size) {
    throw FsError::file_too_large(path, size, policy->max_read_size);
  }
  if(offset > size) {
    throw FsError::io_error("offset " + std::to_string(offset) + " is beyond end of file");
  }
  const uint64_t remaining = size - offset;
  const uint64_t wanted = length ? std::min(*length, remaining) : remaining;

  auto data = read_fd_range(file.get(), offset, wanted, path);

  FileContent out;
  out.path = target.string();
  out.size = size;
  out.modified_ms = timespec_millis(st.st_mtim);
  out.mime_type = detect_mime_type(std::string_view(data).substr(0, kMimeSniffBytes),
                                   target.filename().string());
  if(length && data.size() < *length) {
    out.truncated_at = data.size();
  }

  std::string_view text(data);
  if(offset == 0 && text.size() >= 3 && text.compare(0, 3, "\xEF\xBB\xBF") == 0) {
    text.remove_prefix(3);
  }
  if(encoding == FileEncoding::Utf8 && is_valid_utf8(text)) {
    out.encoding = FileEncoding::Utf8;
    out.content = std::string(text);
  } else {
    out.encoding = FileEncoding::Base64;
    out.content = base64_encode(data);
  }
  return out;
}

FileChunk FileOperations::read_file_chunk(const std::string& path,
                                          uint64_t chunk_index,
                                          uint64_t chunk_size) const {
  auto policy = validator_->policy();
  if(chunk_size == 0) {
    throw FsError::io_error("chunk_size must be greater than zero");
  }
  if(chunk_size > policy->max_read_size) {
    throw FsError::file_too_large(path, chunk_size, policy->max_read_size);
  }
  auto target = validator_->validate_existing(*policy, path);

  std::error_code ec;
  if(fs::is_directory(target, ec)) throw FsError::not_a_file(path);
  const uint64_t size = fs::file_size(target, ec);
  if(ec) throw FsError::from_error_code(ec, path);
  if(size > policy->max_read_size) {
    throw FsError::file_too_large(path, size, policy->max_read_size);
  }

  const uint64_t total_chunks = size == 0 ? 1 : (size + chunk_size - 1) / chunk_size;
  if(chunk_index >= total_chunks) {
    throw FsError::not_found(path + "#chunk" + std::to_string(chunk_index));
  }
  const uint64_t offset = chunk_index * chunk_size;
  auto raw = read_range(target, offset, std::min(chunk_size, size - offset), path);

  FileChunk chunk;
  chunk.path = target.string();
  chunk.chunk_index = chunk_index;
  chunk.total_chunks = total_chunks;
  chunk.total_size = size;
  chunk.checksum = sha256_hex(raw);
  chunk.data = base64_encode(raw);
  chunk.is_last = chunk_index + 1 == total_chunks;
  return chunk;
}

std::string FileOperations::write_file(const std::string& path,
                                       const std::string& content,
                                       FileEncoding encoding,
                                       bool create_parents) const {
  auto policy = validator_->policy();
  auto target = validator_->resolve_new(*policy, path, create_parents);
  ensure_writable(*policy, target, path);

  std::error_code ec;
  auto existing = fs::status(target, ec);
  if(fs::is_directory(existing)) throw FsError::not_a_file(path);

  std::string decoded;
  const std::string* bytes = &content;
  if(encoding == FileEncoding::Base64) {
    if(!base64_decode(content, decoded)) throw FsError::invalid_encoding(path);
    bytes = &decoded;
  }
  if(bytes->size() > policy->max_write_size) {
    throw FsError::file_too_large(path, bytes->size(), policy->max_write_size);
  }

  if(create_parents) {
    fs::create_directories(target.parent_path(), ec);
    if(ec) throw FsError::from_error_code(ec, target.parent_path().string());
  }

  // Readers see either the previous file or the complete new one.
  auto temp = target.parent_path() / (target.filename().string() + ".tmp-" + random_hex(16));
  {
    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if(!out) {
      throw FsError::io_error("unable to create temporary file");
    }
    out.write(bytes->data(), static_cast<std::streamsize>(bytes->size()));
    out.flush();
    if(!out) {
      out.close();
      fs::remove(temp, ec);
      throw FsError::io_error("write failed");
    }
  }
  if(fs::exists(existing)) {
    fs::permissions(temp, existing.permissions(), ec);
  }
  fs::rename(temp, target, ec);
  if(ec) {
    std::error_code cleanup;
    fs::remove(temp, cleanup);
    throw FsError::from_error_code(ec, path);
  }
  return target.string();
}

std::string FileOperations::create_directory(const std::string& path, bool recursive) const {
  auto policy = validator_->policy();
  auto target = validator_->resolve_new(*policy, path, recursive);
  ensure_writable(*policy, target, path);

  std::error_code ec;
  if(fs::exists(fs::symlink_status(target, ec))) throw FsError::already_exists(path);
  if(recursive) {
    fs::create_directories(target, ec);
  } else {
    fs::create_directory(target, ec);
  }
  if(ec) throw FsError::from_error_code(ec, path);
  return target.string();
}

std::string FileOperations::delete_path(const std::string& path, bool recursive) const {
  auto policy = validator_->policy();
  auto target = resolve_entry(*policy, path);
  ensure_writable(*policy, target, path);
  for(const auto& root : policy->canonical_roots) {
    if(target == root) throw FsError::permission_denied(path, "cannot delete an allowed root");
  }

  std::error_code ec;
  auto st = fs::symlink_status(target, ec);
  if(ec || !fs::exists(st)) throw FsError::not_found(path);

  if(fs::is_directory(st)) {
    if(!recursive) {
      if(!fs::is_empty(target, ec)) throw FsError::not_empty(path);
      fs::remove(target, ec);
    } else {
      fs::remove_all(target, ec);
    }
  } else {
    fs::remove(target, ec);
  }
  if(ec) throw FsError::from_error_code(ec, path);
  return target.string();
}

std::string FileOperations::rename_path(const std::string& from, const std::string& to) const {
  auto policy = validator_->policy();
  auto source = resolve_entry(*policy, from);
  auto destination = validator_->resolve_new(*policy, to, false);
  ensure_writable(*policy, source, from);
  ensure_writable(*policy, destination, to);

  std::error_code ec;
  if(fs::exists(fs::symlink_status(destination, ec))) throw FsError::already_exists(to);
  if(path_is_within(destination, source)) {
    throw FsError::io_error("cannot move a directory into itself");
  }
  fs::rename(source, destination, ec);
  if(ec == std::errc::no_such_file_or_directory) throw FsError::not_found(from);
  if(ec) throw FsError::from_error_code(ec, to);
  return destination.string();
}

std::string FileOperations::copy_path(const std::string& from, const std::string& to, bool recursive) const {
  auto policy = validator_->policy();
  auto source = validator_->validate_existing(*policy, from);
  auto destination = validator_->resolve_new(*policy, to, false);
  ensure_writable(*policy, destination, to);

  std::error_code ec;
  if(fs::exists(fs::symlink_status(destination, ec))) throw FsError::already_exists(to);

  const bool is_dir = fs::is_directory(source, ec);
  if(is_dir && !recursive) {
    throw FsError::io_error("source is a directory; recursive copy required");
  }
  if(is_dir && path_is_within(destination, source)) {
    throw FsError::io_error("cannot copy a directory into itself");
  }
  const uint64_t total = tree_size(source);
  if(total > policy->max_write_size) {
    throw FsError::file_too_large(from, total, policy->max_write_size);
  }

  if(!is_dir) {
    fs::copy_file(source, destination, fs::copy_options::none, ec);
    if(ec) throw FsError::from_error_code(ec, to);
    return destination.string();
  }

  fs::create_directory(destination, source, ec);
  if(ec) throw FsError::from_error_code(ec, to);
  fs::recursive_directory_iterator it(source, fs::directory_options::none, ec);
  if(ec) throw FsError::from_error_code(ec, from);
  for(fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if(ec) break;
    const auto& entry = it->path();
    if(policy->is_denied(entry)) {
      if(it->is_directory(ec)) it.disable_recursion_pending();
      continue;
    }
    auto rel = entry.lexically_relative(source);
    auto out = destination / rel;
    auto st = it->symlink_status(ec);
    if(fs::is_symlink(st)) {
      fs::copy_symlink(entry, out, ec);
    } else if(fs::is_directory(st)) {
      fs::create_directory(out, entry, ec);
    } else if(fs::is_regular_file(st)) {
      fs::copy_file(entry, out, fs::copy_options::none, ec);
    }
    if(ec) break;
  }
  if(ec) throw FsError::from_error_code(ec, to);
  return destination.string();
}

FileEntry FileOperations::get_file_info(const std::string& path) const {
  auto policy = validator_->policy();
  auto target = resolve_entry(*policy, path);
  return make_entry(target);
}
