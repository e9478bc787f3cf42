#include "file_operations.hpp"
#include "file_search.hpp"
#include "fs_error.hpp"
#include "log.hpp"
#include "mime.hpp"
#include "path_validator.hpp"
#include "rate_limiter.hpp"
#include "sandbox_policy.hpp"
#include "test_runner_utils.hpp"
#include "upload_path.hpp"
#include "utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

using ttyhub::test::TempDir;
using ttyhub::test::expect;

struct TestContext {
  ttyhub::test::LogCapture& logs;
  bool verbose = false;
};

struct Sandbox {
  std::shared_ptr<PolicyStore> store;
  std::shared_ptr<PathValidator> validator;
  std::shared_ptr<FileOperations> ops;
};

Sandbox make_sandbox(const TempDir& dir, const std::function<void(SandboxPolicy&)>& tweak = nullptr) {
  SandboxPolicy policy = SandboxPolicy::defaults();
  policy.set_roots({dir.path()});
  if(tweak) tweak(policy);
  Sandbox sb;
  sb.store = std::make_shared<PolicyStore>(std::move(policy));
  sb.validator = std::make_shared<PathValidator>(sb.store);
  sb.ops = std::make_shared<FileOperations>(sb.validator);
  return sb;
}

template<typename Fn>
bool throws_kind(Fn fn, FsErrorKind kind) {
  try {
    fn();
  } catch(const FsError& e) {
    return e.kind() == kind;
  }
  return false;
}

std::vector<std::string> entry_names(const DirectoryListing& listing) {
  std::vector<std::string> names;
  for(const auto& e : listing.entries) names.push_back(e.name);
  return names;
}

bool test_validator_rejects_traversal(TestContext& ctx) {
  TempDir dir("traversal");
  auto sb = make_sandbox(dir);
  bool ok = true;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.validator->validate_existing("relative/file.txt"); },
                                       FsErrorKind::PathTraversal), "relative path") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.validator->validate_existing(dir / "a/../b"); },
                                       FsErrorKind::PathTraversal), "dot-dot component") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.validator->validate_existing(""); },
                                       FsErrorKind::PathTraversal), "empty path") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.validator->resolve_new(dir / "x/../../etc", true); },
                                       FsErrorKind::PathTraversal), "dot-dot in new path") && ok;
  try {
    sb.validator->validate_existing("../escape");
    ok = false;
  } catch(const FsError& e) {
    auto j = e.to_json();
    ok = expect(ctx.verbose, j["code"] == "path_traversal", "traversal code") && ok;
    ok = expect(ctx.verbose, j["attempted_path"] == "../escape", "attempted_path") && ok;
  }
  return ok;
}

bool test_validator_outside_roots(TestContext& ctx) {
  TempDir dir("roots");
  TempDir other("elsewhere");
  other.write("note.txt", "x");
  auto sb = make_sandbox(dir);
  bool ok = true;
  try {
    sb.validator->validate_existing(other / "note.txt");
    ok = false;
  } catch(const FsError& e) {
    ok = expect(ctx.verbose, e.kind() == FsErrorKind::PermissionDenied, "outside root kind") && ok;
    ok = expect(ctx.verbose, e.to_json()["reason"] == "outside allowed directories", "outside reason") && ok;
  }
  ok = expect(ctx.verbose, throws_kind([&]{ sb.validator->validate_existing(dir / "missing.txt"); },
                                       FsErrorKind::NotFound), "missing file") && ok;
  ok = expect(ctx.verbose, sb.validator->validate_existing(dir.str()) == dir.path(), "root itself is allowed") && ok;

  // a trailing separator resolves to the same directory
  ok = expect(ctx.verbose, sb.validator->validate_existing(dir.str() + "/") == dir.path(), "trailing slash") && ok;
  return ok;
}

bool test_deny_patterns_override_roots(TestContext& ctx) {
  TempDir dir("deny");
  dir.write(".env", "KEY=1");
  dir.write("keys/server.pem", "-----BEGIN-----");
  dir.write("keys/readme.txt", "public");
  dir.write("secrets.txt", "hunter2");
  fs::create_symlink(dir.path() / "secrets.txt", dir.path() / "alias.txt");
  auto sb = make_sandbox(dir);

  bool ok = true;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.validator->validate_existing(dir / ".env"); },
                                       FsErrorKind::PermissionDenied), ".env denied") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->read_file(dir / "keys/server.pem"); },
                                       FsErrorKind::PermissionDenied), "pem denied") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->read_file(dir / "alias.txt"); },
                                       FsErrorKind::PermissionDenied), "symlink to denied file") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->write_file(dir / "keys/new.pem", "x", FileEncoding::Utf8, false); },
                                       FsErrorKind::PermissionDenied), "new denied file") && ok;

  auto listing = sb.ops->list_directory(dir / "keys", true);
  ok = expect(ctx.verbose, entry_names(listing) == std::vector<std::string>{"readme.txt"}, "denied entries hidden") && ok;
  auto top = sb.ops->list_directory(dir.str(), true);
  auto names = entry_names(top);
  ok = expect(ctx.verbose, std::find(names.begin(), names.end(), ".env") == names.end(), ".env not listed") && ok;
  return ok;
}

bool test_symlink_escape(TestContext& ctx) {
  TempDir dir("links");
  TempDir outside("target");
  outside.write("data.txt", "outside");
  fs::create_directory_symlink(outside.path(), dir.path() / "jump");
  auto sb = make_sandbox(dir);

  bool ok = true;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.validator->validate_existing(dir / "jump/data.txt"); },
                                       FsErrorKind::SymlinkEscape), "escape rejected") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->write_file(dir / "jump/new.txt", "x", FileEncoding::Utf8, false); },
                                       FsErrorKind::SymlinkEscape), "write through escape rejected") && ok;

  // following links never reaches past the roots
  auto policy = *sb.store->snapshot();
  policy.follow_symlinks = true;
  sb.store->replace(policy);
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->read_file(dir / "jump/data.txt"); },
                                       FsErrorKind::SymlinkEscape), "escape rejected when following") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.validator->resolve_new(dir / "jump/new.txt", false); },
                                       FsErrorKind::SymlinkEscape), "new path through escape rejected") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->write_file(dir / "jump/new.txt", "x", FileEncoding::Utf8, false); },
                                       FsErrorKind::SymlinkEscape), "write through escape rejected when following") && ok;
  ok = expect(ctx.verbose, !fs::exists(outside.path() / "new.txt"), "nothing written outside") && ok;

  // the link itself can be inspected and removed without touching the target
  auto info = sb.ops->get_file_info(dir / "jump");
  ok = expect(ctx.verbose, info.is_symlink && info.symlink_target.has_value(), "link info") && ok;
  sb.ops->delete_path(dir / "jump", false);
  ok = expect(ctx.verbose, !fs::exists(dir.path() / "jump") && fs::exists(outside.path() / "data.txt"),
              "delete removes only the link") && ok;
  return ok;
}

bool test_search_follows_links(TestContext& ctx) {
  TempDir dir("follow");
  TempDir outside("follow_out");
  dir.write("data/found.txt", "in");
  outside.write("hidden.txt", "out");
  fs::create_directories(dir.path() / "view");
  fs::create_directory_symlink(dir.path() / "data", dir.path() / "view/link");
  fs::create_directory_symlink(outside.path(), dir.path() / "view/out");
  fs::create_directory_symlink(dir.path() / "view", dir.path() / "view/loop");

  auto sb = make_sandbox(dir);
  FileSearch search(*sb.ops);
  bool ok = true;
  auto plain = search.search_files(dir / "view", "*.txt");
  ok = expect(ctx.verbose, plain.matches.empty(), "links not walked by default") && ok;

  auto policy = *sb.store->snapshot();
  policy.follow_symlinks = true;
  sb.store->replace(policy);
  auto followed = search.search_files(dir / "view", "*.txt");
  ok = expect(ctx.verbose, followed.matches.size() == 1, "one match through the link") && ok;
  ok = expect(ctx.verbose, !followed.matches.empty() &&
                           followed.matches[0].path == (dir.path() / "data/found.txt").string(),
              "canonical path reported") && ok;
  return ok;
}

bool test_resolve_new_parents(TestContext& ctx) {
  TempDir dir("resolve");
  dir.write("plain.txt", "x");
  auto sb = make_sandbox(dir);
  bool ok = true;
  ok = expect(ctx.verbose, sb.validator->resolve_new(dir / "new.txt", false) == dir.path() / "new.txt",
              "single missing level") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.validator->resolve_new(dir / "a/b/c.txt", false); },
                                       FsErrorKind::NotFound), "missing parents") && ok;
  ok = expect(ctx.verbose, sb.validator->resolve_new(dir / "a/b/c.txt", true) == dir.path() / "a/b/c.txt",
              "missing parents allowed") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.validator->resolve_new(dir / "plain.txt/child", true); },
                                       FsErrorKind::NotADirectory), "file ancestor") && ok;
  return ok;
}

bool test_list_directory(TestContext& ctx) {
  TempDir dir("listing");
  fs::create_directory(dir.path() / "b_dir");
  fs::create_directory(dir.path() / "a_dir");
  dir.write("z.txt", "zz");
  dir.write("C.md", "# c");
  dir.write(".hidden", "h");
  auto sb = make_sandbox(dir);

  bool ok = true;
  auto listing = sb.ops->list_directory(dir.str(), false);
  ok = expect(ctx.verbose, entry_names(listing) == std::vector<std::string>{"a_dir", "b_dir", "C.md", "z.txt"},
              "directories first, then case-insensitive names") && ok;
  ok = expect(ctx.verbose, listing.total_count == 4 && !listing.truncated, "count") && ok;
  ok = expect(ctx.verbose, listing.path == dir.str(), "canonical path") && ok;

  auto with_hidden = sb.ops->list_directory(dir.str(), true);
  ok = expect(ctx.verbose, with_hidden.total_count == 5, "hidden included") && ok;

  auto desc = sb.ops->list_directory(dir.str(), false, SortField::Name, SortOrder::Desc);
  ok = expect(ctx.verbose, entry_names(desc) == std::vector<std::string>{"b_dir", "a_dir", "z.txt", "C.md"},
              "descending keeps directories first") && ok;

  auto by_size = sb.ops->list_directory(dir.str(), false, SortField::Size, SortOrder::Asc);
  ok = expect(ctx.verbose, by_size.entries[2].name == "z.txt" && by_size.entries[3].name == "C.md", "size order") && ok;

  auto policy = *sb.store->snapshot();
  policy.max_list_entries = 2;
  sb.store->replace(policy);
  auto capped = sb.ops->list_directory(dir.str(), false);
  ok = expect(ctx.verbose, capped.entries.size() == 2 && capped.truncated && capped.total_count == 4, "truncated") && ok;

  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->list_directory(dir / "z.txt", false); },
                                       FsErrorKind::NotADirectory), "listing a file") && ok;

  auto entry = listing.entries[3];
  ok = expect(ctx.verbose, entry.size == 2 && entry.mime_type == std::string("text/plain") &&
                           entry.permissions.size() == 9, "entry metadata") && ok;
  return ok;
}

bool test_read_file(TestContext& ctx) {
  TempDir dir("reading");
  dir.write("bom.txt", "\xEF\xBB\xBFhello");
  dir.write("hello.txt", "hello world");
  dir.write("blob.bin", std::string("\xff\xfe\x00\x01", 4));
  dir.write("image.dat", std::string("\x89PNG\r\n\x1a\n\0\0", 10));
  auto sb = make_sandbox(dir);

  bool ok = true;
  auto bom = sb.ops->read_file(dir / "bom.txt");
  ok = expect(ctx.verbose, bom.content == "hello" && bom.encoding == FileEncoding::Utf8, "bom stripped") && ok;

  auto blob = sb.ops->read_file(dir / "blob.bin");
  ok = expect(ctx.verbose, blob.encoding == FileEncoding::Base64 &&
                           blob.content == base64_encode(std::string("\xff\xfe\x00\x01", 4)), "binary falls back to base64") && ok;

  auto forced = sb.ops->read_file(dir / "hello.txt", 0, std::nullopt, FileEncoding::Base64);
  ok = expect(ctx.verbose, forced.encoding == FileEncoding::Base64 && forced.content == base64_encode("hello world"),
              "base64 on request") && ok;

  auto slice = sb.ops->read_file(dir / "hello.txt", 6, 5);
  ok = expect(ctx.verbose, slice.content == "world" && !slice.truncated_at && slice.size == 11, "range") && ok;

  auto tail = sb.ops->read_file(dir / "hello.txt", 6, 100);
  ok = expect(ctx.verbose, tail.content == "world" && tail.truncated_at == std::optional<uint64_t>(5), "short read") && ok;

  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->read_file(dir / "hello.txt", 100); },
                                       FsErrorKind::IoError), "offset past end") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->read_file(dir.str()); },
                                       FsErrorKind::NotAFile), "directory") && ok;

  auto png = sb.ops->read_file(dir / "image.dat");
  ok = expect(ctx.verbose, png.mime_type == "image/png", "magic number sniffing") && ok;

  auto policy = *sb.store->snapshot();
  policy.max_read_size = 4;
  sb.store->replace(policy);
  try {
    sb.ops->read_file(dir / "hello.txt");
    ok = false;
  } catch(const FsError& e) {
    auto j = e.to_json();
    ok = expect(ctx.verbose, j["code"] == "file_too_large" && j["size"] == 11 && j["max_size"] == 4, "too large") && ok;
  }
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->read_file(dir / "hello.txt", 0, 4); },
                                       FsErrorKind::FileTooLarge), "short range of an oversized file") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->read_file_chunk(dir / "hello.txt", 0, 2); },
                                       FsErrorKind::FileTooLarge), "chunks of an oversized file") && ok;
  return ok;
}

bool test_read_file_chunk(TestContext& ctx) {
  TempDir dir("chunks");
  dir.write("digits.txt", "0123456789");
  dir.write("empty.txt", "");
  auto sb = make_sandbox(dir);

  bool ok = true;
  auto first = sb.ops->read_file_chunk(dir / "digits.txt", 0, 4);
  ok = expect(ctx.verbose, first.total_chunks == 3 && first.total_size == 10 && !first.is_last, "first chunk") && ok;
  std::string decoded;
  ok = expect(ctx.verbose, base64_decode(first.data, decoded) && decoded == "0123", "first chunk data") && ok;

  auto last = sb.ops->read_file_chunk(dir / "digits.txt", 2, 4);
  ok = expect(ctx.verbose, base64_decode(last.data, decoded) && decoded == "89" && last.is_last, "last chunk") && ok;
  ok = expect(ctx.verbose, last.checksum == sha256_hex("89"), "checksum of raw bytes") && ok;

  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->read_file_chunk(dir / "digits.txt", 3, 4); },
                                       FsErrorKind::NotFound), "index past end") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->read_file_chunk(dir / "digits.txt", 0, 0); },
                                       FsErrorKind::IoError), "zero chunk size") && ok;

  auto empty = sb.ops->read_file_chunk(dir / "empty.txt", 0, 4);
  ok = expect(ctx.verbose, empty.total_chunks == 1 && empty.is_last && empty.data.empty(), "empty file is one chunk") && ok;
  return ok;
}

bool test_write_file(TestContext& ctx) {
  TempDir dir("writing");
  fs::create_directory(dir.path() / "folder");
  auto sb = make_sandbox(dir, [&](SandboxPolicy& p){
    p.read_only_patterns.push_back(dir.str() + "/ro/*");
  });

  bool ok = true;
  auto written = sb.ops->write_file(dir / "out.txt", "first", FileEncoding::Utf8, false);
  ok = expect(ctx.verbose, written == dir / "out.txt" && dir.read("out.txt") == "first", "create") && ok;
  sb.ops->write_file(dir / "out.txt", base64_encode("second"), FileEncoding::Base64, false);
  ok = expect(ctx.verbose, dir.read("out.txt") == "second", "overwrite from base64") && ok;

  bool leftovers = false;
  for(const auto& e : fs::directory_iterator(dir.path())) {
    if(e.path().filename().string().find(".tmp-") != std::string::npos) leftovers = true;
  }
  ok = expect(ctx.verbose, !leftovers, "no temporary files left behind") && ok;

  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->write_file(dir / "bad.bin", "!!!", FileEncoding::Base64, false); },
                                       FsErrorKind::InvalidEncoding), "bad base64") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->write_file(dir / "folder", "x", FileEncoding::Utf8, false); },
                                       FsErrorKind::NotAFile), "directory target") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->write_file(dir / "deep/er/file.txt", "x", FileEncoding::Utf8, false); },
                                       FsErrorKind::NotFound), "missing parents") && ok;
  sb.ops->write_file(dir / "deep/er/file.txt", "x", FileEncoding::Utf8, true);
  ok = expect(ctx.verbose, dir.read("deep/er/file.txt") == "x", "create_parents") && ok;

  fs::create_directory(dir.path() / "ro");
  try {
    sb.ops->write_file(dir / "ro/locked.txt", "x", FileEncoding::Utf8, false);
    ok = false;
  } catch(const FsError& e) {
    ok = expect(ctx.verbose, e.kind() == FsErrorKind::PermissionDenied &&
                             e.to_json()["reason"] == "read-only location", "read-only pattern") && ok;
  }

  auto policy = *sb.store->snapshot();
  policy.max_write_size = 3;
  sb.store->replace(policy);
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->write_file(dir / "big.txt", "abcd", FileEncoding::Utf8, false); },
                                       FsErrorKind::FileTooLarge), "write limit") && ok;
  return ok;
}

bool test_write_is_atomic_for_readers(TestContext& ctx) {
  TempDir dir("atomic");
  const std::string old_text(40000, 'a');
  const std::string new_text(70000, 'b');
  dir.write("doc.txt", old_text);
  auto sb = make_sandbox(dir);
  const auto target = dir / "doc.txt";

  std::atomic<bool> done{false};
  std::thread writer([&]{
    for(int i = 0; i < 200; ++i) {
      sb.ops->write_file(target, i % 2 ? old_text : new_text, FileEncoding::Utf8, false);
    }
    done = true;
  });

  std::size_t reads = 0;
  std::size_t torn = 0;
  while(!done || reads == 0) {
    auto content = sb.ops->read_file(target).content;
    if(content != old_text && content != new_text) ++torn;
    ++reads;
  }
  writer.join();

  bool ok = true;
  ok = expect(ctx.verbose, torn == 0, "every read sees the old or the new content in full") && ok;
  ok = expect(ctx.verbose, dir.read("doc.txt") == old_text, "last write wins") && ok;
  return ok;
}

bool test_project_notes_round_trip(TestContext& ctx) {
  TempDir dir("notes");
  auto sb = make_sandbox(dir);
  const auto project = dir / "project";

  bool ok = true;
  sb.ops->create_directory(project, false);
  sb.ops->write_file(project + "/notes.txt", "hello", FileEncoding::Utf8, false);

  auto listing = sb.ops->list_directory(project, false);
  ok = expect(ctx.verbose, listing.entries.size() == 1, "one entry") && ok;
  if(listing.entries.size() == 1) {
    const auto& entry = listing.entries[0];
    ok = expect(ctx.verbose, entry.name == "notes.txt" && entry.size == 5 && !entry.is_directory, "entry fields") && ok;
  }

  sb.ops->rename_path(project + "/notes.txt", project + "/notes2.txt");
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->read_file(project + "/notes.txt"); },
                                       FsErrorKind::NotFound), "old name gone") && ok;
  auto moved = sb.ops->read_file(project + "/notes2.txt");
  ok = expect(ctx.verbose, moved.content == "hello" && moved.encoding == FileEncoding::Utf8, "content kept") && ok;
  return ok;
}

bool test_create_and_delete(TestContext& ctx) {
  TempDir dir("mutations");
  auto sb = make_sandbox(dir);
  bool ok = true;

  sb.ops->create_directory(dir / "made", false);
  ok = expect(ctx.verbose, fs::is_directory(dir.path() / "made"), "create_directory") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->create_directory(dir / "made", false); },
                                       FsErrorKind::AlreadyExists), "existing directory") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->create_directory(dir / "x/y/z", false); },
                                       FsErrorKind::NotFound), "nested without recursive") && ok;
  sb.ops->create_directory(dir / "x/y/z", true);
  ok = expect(ctx.verbose, fs::is_directory(dir.path() / "x/y/z"), "recursive create") && ok;

  dir.write("x/file.txt", "data");
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->delete_path(dir / "x", false); },
                                       FsErrorKind::NotEmpty), "non-empty directory") && ok;
  sb.ops->delete_path(dir / "made", false);
  ok = expect(ctx.verbose, !fs::exists(dir.path() / "made"), "empty directory removed") && ok;
  sb.ops->delete_path(dir / "x", true);
  ok = expect(ctx.verbose, !fs::exists(dir.path() / "x"), "recursive delete") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->delete_path(dir / "x", true); },
                                       FsErrorKind::NotFound), "already gone") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->delete_path(dir.str(), true); },
                                       FsErrorKind::PermissionDenied), "allowed root is protected") && ok;
  return ok;
}

bool test_rename_and_copy(TestContext& ctx) {
  TempDir dir("moves");
  dir.write("a.txt", "alpha");
  dir.write("b.txt", "beta");
  dir.write("tree/one.txt", "1");
  dir.write("tree/sub/two.txt", "2");
  dir.write("tree/.env", "SECRET=1");
  auto sb = make_sandbox(dir);
  bool ok = true;

  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->rename_path(dir / "a.txt", dir / "b.txt"); },
                                       FsErrorKind::AlreadyExists), "rename onto existing") && ok;
  sb.ops->rename_path(dir / "a.txt", dir / "c.txt");
  ok = expect(ctx.verbose, !fs::exists(dir.path() / "a.txt") && dir.read("c.txt") == "alpha", "rename") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->rename_path(dir / "a.txt", dir / "d.txt"); },
                                       FsErrorKind::NotFound), "rename missing source") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->rename_path(dir / "tree", dir / "tree/inner"); },
                                       FsErrorKind::IoError), "move into itself") && ok;

  sb.ops->copy_path(dir / "b.txt", dir / "b_copy.txt", false);
  ok = expect(ctx.verbose, dir.read("b_copy.txt") == "beta" && dir.read("b.txt") == "beta", "file copy") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->copy_path(dir / "tree", dir / "tree2", false); },
                                       FsErrorKind::IoError), "directory copy needs recursive") && ok;
  sb.ops->copy_path(dir / "tree", dir / "tree2", true);
  ok = expect(ctx.verbose, dir.read("tree2/sub/two.txt") == "2" && dir.read("tree2/one.txt") == "1", "recursive copy") && ok;
  ok = expect(ctx.verbose, !fs::exists(dir.path() / "tree2/.env"), "denied entries are not copied") && ok;
  ok = expect(ctx.verbose, throws_kind([&]{ sb.ops->copy_path(dir / "b.txt", dir / "c.txt", false); },
                                       FsErrorKind::AlreadyExists), "copy onto existing") && ok;
  return ok;
}

bool test_search(TestContext& ctx) {
  TempDir dir("search");
  fs::create_directory(dir.path() / ".git");
  dir.write(".git/config.cpp", "int needle;");
  dir.write(".gitignore", "build/\n*.log\n");
  dir.write("src/main.cpp", "// entry\nint needle = 1;\n");
  dir.write("src/util.cpp", "int helper;\n");
  dir.write("src/debug.log", "needle");
  dir.write("build/out.cpp", "int needle;");
  dir.write("docs/README.md", "docs");
  auto sb = make_sandbox(dir);
  FileSearch search(*sb.ops);
  bool ok = true;

  auto cpp = search.search_files(dir.str(), "*.cpp");
  std::vector<std::string> names;
  for(const auto& m : cpp.matches) names.push_back(m.entry.name);
  std::sort(names.begin(), names.end());
  ok = expect(ctx.verbose, names == std::vector<std::string>{"main.cpp", "util.cpp"},
              "glob skips .git and ignored directories") && ok;

  auto word = search.search_files(dir.str(), "MAIN");
  ok = expect(ctx.verbose, word.matches.size() == 1 && word.matches[0].path == dir / "src/main.cpp",
              "bare word is a case-insensitive substring") && ok;

  auto logs = search.search_files(dir.str(), "debug");
  ok = expect(ctx.verbose, logs.matches.empty(), "gitignored file pattern") && ok;

  auto content = search.search_files(dir.str(), "*.cpp", std::string("needle"));
  ok = expect(ctx.verbose, content.matches.size() == 1, "content filter") && ok;
  if(content.matches.size() == 1) {
    const auto& m = content.matches[0].content_matches;
    ok = expect(ctx.verbose, m.size() == 1 && m[0].line_number == 2 && m[0].match_start == 4 && m[0].match_end == 10,
                "content match position") && ok;
  }

  auto capped = search.search_files(dir.str(), "*", std::nullopt, std::nullopt, 1);
  ok = expect(ctx.verbose, capped.matches.size() == 1 && capped.truncated, "max_results") && ok;

  auto shallow = search.search_files(dir.str(), "main", std::nullopt, 1);
  ok = expect(ctx.verbose, shallow.matches.empty(), "max_depth") && ok;

  ok = expect(ctx.verbose, throws_kind([&]{ search.search_files(dir / "src/main.cpp", "x"); },
                                       FsErrorKind::NotADirectory), "search root must be a directory") && ok;
  return ok;
}

bool test_ignore_rules(TestContext& ctx) {
  IgnoreRules rules;
  fs::path base("/project");
  rules.add_rule(base, "# comment");
  rules.add_rule(base, "*.log");
  rules.add_rule(base, "!keep.log");
  rules.add_rule(base, "/dist");
  rules.add_rule(base, "cache/");
  bool ok = true;
  ok = expect(ctx.verbose, rules.is_ignored("/project/a/b.log", false), "unanchored glob") && ok;
  ok = expect(ctx.verbose, !rules.is_ignored("/project/keep.log", false), "negation") && ok;
  ok = expect(ctx.verbose, rules.is_ignored("/project/dist", true), "anchored") && ok;
  ok = expect(ctx.verbose, !rules.is_ignored("/project/src/dist", true), "anchored only at base") && ok;
  ok = expect(ctx.verbose, rules.is_ignored("/project/src/cache", true), "directory rule") && ok;
  ok = expect(ctx.verbose, !rules.is_ignored("/project/src/cache", false), "directory rule skips files") && ok;
  ok = expect(ctx.verbose, !rules.is_ignored("/other/x.log", false), "outside base") && ok;
  return ok;
}

bool test_upload_names(TestContext& ctx) {
  bool ok = true;
  ok = expect(ctx.verbose, sanitize_upload_file_name(" folder/..\\bad:name?.txt ") == "folder_.._bad_name_.txt",
              "separators and wildcards") && ok;
  ok = expect(ctx.verbose, sanitize_upload_file_name("con.txt") == "con.txt_file", "reserved device name") && ok;
  ok = expect(ctx.verbose, sanitize_upload_file_name("   ") == kUploadPlaceholderName, "blank") && ok;
  ok = expect(ctx.verbose, sanitize_upload_file_name("...") == kUploadPlaceholderName, "only dots") && ok;
  ok = expect(ctx.verbose, sanitize_upload_file_name("my  photo.png") == "my_photo.png", "whitespace run") && ok;

  auto long_name = sanitize_upload_file_name("averyveryverylongfilename_for_upload.txt");
  ok = expect(ctx.verbose, long_name.size() <= kMaxUploadFileNameBytes &&
                           long_name.size() > 4 &&
                           long_name.compare(long_name.size() - 4, 4, ".txt") == 0, "truncation keeps extension") && ok;

  // 2024-01-02T03:04:05Z
  auto when = std::chrono::system_clock::from_time_t(1704164645);
  auto dest = build_upload_destination("/work/project", "shot.png", when);
  auto name = dest.filename().string();
  ok = expect(ctx.verbose, dest.parent_path() == fs::path("/work/project/.ttyhub/uploads"), "uploads directory") && ok;
  ok = expect(ctx.verbose, name.size() == 25 + 8 && name.compare(0, 16, "20240102-030405-") == 0 &&
                           name.compare(24, 9, "-shot.png") == 0, "timestamped name") && ok;
  return ok;
}

bool test_rate_limiter(TestContext& ctx) {
  using namespace std::chrono_literals;
  bool ok = true;
  RateLimiter limiter(10, 2);
  auto t0 = RateLimiter::Clock::now();
  ok = expect(ctx.verbose, !limiter.allow(t0) && !limiter.allow(t0), "burst") && ok;
  auto retry = limiter.allow(t0);
  ok = expect(ctx.verbose, retry && *retry >= 1 && *retry <= 100, "retry hint") && ok;
  ok = expect(ctx.verbose, !limiter.allow(t0 + 150ms), "refill") && ok;

  RateLimiter clamped(0, 0);
  auto t1 = RateLimiter::Clock::now();
  ok = expect(ctx.verbose, !clamped.allow(t1), "clamped burst of one") && ok;
  auto wait = clamped.allow(t1);
  ok = expect(ctx.verbose, wait && *wait <= 1000 && *wait >= 999, "clamped rate of one per second") && ok;

  auto j = FsError::rate_limited(250).to_json();
  ok = expect(ctx.verbose, j["code"] == "rate_limited" && j["retry_after_ms"] == 250, "rate_limited payload") && ok;
  return ok;
}

bool test_mime_types(TestContext& ctx) {
  bool ok = true;
  ok = expect(ctx.verbose, mime_from_extension("main.CPP") == "text/x-c++", "extension is case-insensitive") && ok;
  ok = expect(ctx.verbose, mime_from_extension("Makefile") == "text/x-makefile", "well known names") && ok;
  ok = expect(ctx.verbose, mime_from_extension("blob") == "application/octet-stream", "unknown") && ok;
  ok = expect(ctx.verbose, detect_mime_type("%PDF-1.7", "x.txt") == "application/pdf", "magic wins") && ok;
  ok = expect(ctx.verbose, is_text_mime("application/json") && !is_text_mime("image/png"), "text classification") && ok;
  return ok;
}

struct TestCase {
  const char* name;
  std::function<bool(TestContext&)> fn;
};

} // namespace

int main(int argc, char** argv) {
  bool verbose = (std::getenv("TTYHUB_TEST_VERBOSE") != nullptr);
  for(int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if(arg == "-v" || arg == "--verbose") {
      verbose = true;
    }
  }

  bool show_logs = (std::getenv("TTYHUB_TEST_LOGS") != nullptr) || verbose;
  const bool suppress_logs = !show_logs;
  if(suppress_logs) {
    set_log_passthrough(false);
  }
  ttyhub::test::LogCapture logs;
  TestContext ctx{logs, verbose};
  std::vector<TestCase> tests = {
    {"validator_rejects_traversal", test_validator_rejects_traversal},
    {"validator_outside_roots", test_validator_outside_roots},
    {"deny_patterns_override_roots", test_deny_patterns_override_roots},
    {"symlink_escape", test_symlink_escape},
    {"search_follows_links", test_search_follows_links},
    {"resolve_new_parents", test_resolve_new_parents},
    {"list_directory", test_list_directory},
    {"read_file", test_read_file},
    {"read_file_chunk", test_read_file_chunk},
    {"write_file", test_write_file},
    {"write_is_atomic_for_readers", test_write_is_atomic_for_readers},
    {"project_notes_round_trip", test_project_notes_round_trip},
    {"create_and_delete", test_create_and_delete},
    {"rename_and_copy", test_rename_and_copy},
    {"search", test_search},
    {"ignore_rules", test_ignore_rules},
    {"upload_names", test_upload_names},
    {"rate_limiter", test_rate_limiter},
    {"mime_types", test_mime_types}
  };

  std::size_t failures = 0;
  std::cout << "Running " << tests.size() << " filesystem tests: " << std::flush;

  for(std::size_t idx = 0; idx < tests.size(); ++idx) {
    const auto& test = tests[idx];
    logs.clear();
    bool passed = false;
    try {
      passed = test.fn(ctx);
    } catch(const std::exception& e) {
      passed = false;
      std::cerr << "Exception in test " << test.name << ": " << e.what() << "\n";
    }
    if(passed) {
      std::cout << '.' << std::flush;
    } else {
      std::cout << 'F' << " (" << test.name << ")\n";
      failures++;
      for(const auto& line : logs.snapshot()) {
        std::cout << "    " << line << "\n";
      }
      if(idx + 1 < tests.size()) {
        std::cout << "Running " << tests.size() << " filesystem tests: " << std::flush;
      }
    }
  }
  std::cout << "\n";
  if(suppress_logs) {
    set_log_passthrough(true);
  }
  if(failures == 0) {
    std::cout << "PASS (" << tests.size() << " tests)\n";
    return 0;
  }
  std::cout << "FAIL (" << failures << "/" << tests.size() << " failed)\n";
  return 1;
}
