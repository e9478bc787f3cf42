#include "path_validator.hpp"

#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace {

bool has_parent_component(const fs::path& path) {
  for(const auto& part : path) {
    if(part == "..") return true;
  }
  return false;
}

// Canonical targets of every symlink met while walking down the path.
std::vector<fs::path> symlink_targets_along(const fs::path& lexical) {
  std::vector<fs::path> targets;
  fs::path current;
  for(const auto& part : lexical) {
    current /= part;
    std::error_code ec;
    auto st = fs::symlink_status(current, ec);
    if(ec || !fs::exists(st)) break;
    if(fs::is_symlink(st)) {
      auto target = fs::canonical(current, ec);
      if(!ec) targets.push_back(std::move(target));
    }
  }
  return targets;
}

[[noreturn]] void throw_canonicalize_error(const std::error_code& ec, const std::string& raw) {
  if(ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
    throw FsError::not_found(raw);
  }
  if(ec == std::errc::too_many_symbolic_link_levels) {
    throw FsError::symlink_escape(raw);
  }
  throw FsError::from_error_code(ec, raw);
}

} // namespace

PathValidator::PathValidator(std::shared_ptr<PolicyStore> store)
  : store_(std::move(store)) {}

fs::path PathValidator::lexical_form(const std::string& raw) {
  if(raw.empty() || raw.find('\0') != std::string::npos) {
    throw FsError::path_traversal(raw);
  }
  fs::path input(raw);
  if(!input.is_absolute() || has_parent_component(input)) {
    throw FsError::path_traversal(raw);
  }
  auto lexical = input.lexically_normal();
  if(!lexical.has_filename() && lexical != lexical.root_path()) {
    lexical = lexical.parent_path();
  }
  return lexical;
}

void PathValidator::ensure_contained(const SandboxPolicy& policy,
                                     const fs::path& lexical,
                                     const fs::path& canonical,
                                     const std::string& raw) {
  if(policy.is_within_roots(canonical)) return;
  // a link inside the sandbox never widens it
  if(policy.is_within_roots(lexical) && !symlink_targets_along(lexical).empty()) {
    throw FsError::symlink_escape(raw);
  }
  throw FsError::permission_denied(raw, "outside allowed directories");
}

void PathValidator::ensure_not_denied(const SandboxPolicy& policy,
                                      const fs::path& lexical,
                                      const fs::path& canonical,
                                      const std::string& raw) {
  if(auto pattern = policy.denied_by(lexical)) {
    throw FsError::permission_denied(raw, "matches denied pattern " + *pattern);
  }
  if(auto pattern = policy.denied_by(canonical)) {
    throw FsError::permission_denied(raw, "matches denied pattern " + *pattern);
  }
  for(const auto& target : symlink_targets_along(lexical)) {
    if(auto pattern = policy.denied_by(target)) {
      throw FsError::permission_denied(raw, "symlink target matches denied pattern " + *pattern);
    }
  }
}

fs::path PathValidator::validate_existing(const std::string& path) const {
  auto policy = store_->snapshot();
  return validate_existing(*policy, path);
}

fs::path PathValidator::resolve_new(const std::string& path, bool allow_missing_parents) const {
  auto policy = store_->snapshot();
  return resolve_new(*policy, path, allow_missing_parents);
}

fs::path PathValidator::validate_existing(const SandboxPolicy& policy, const std::string& path) const {
  auto lexical = lexical_form(path);

  std::error_code ec;
  auto canonical = fs::canonical(lexical, ec);
  if(ec) throw_canonicalize_error(ec, path);

  ensure_contained(policy, lexical, canonical, path);
  ensure_not_denied(policy, lexical, canonical, path);
  return canonical;
}

fs::path PathValidator::resolve_new(const SandboxPolicy& policy,
                                    const std::string& path,
                                    bool allow_missing_parents) const {
  auto lexical = lexical_form(path);

  // Find the deepest ancestor that exists; everything below it is new.
  fs::path existing = lexical;
  std::vector<fs::path> missing;
  while(true) {
    std::error_code ec;
    auto st = fs::symlink_status(existing, ec);
    if(!ec && fs::exists(st)) break;
    // ENOTDIR means some ancestor is a regular file; keep climbing to report it
    if(ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
      throw FsError::from_error_code(ec, path);
    }
    if(!existing.has_relative_path()) break;
    missing.push_back(existing.filename());
    existing = existing.parent_path();
  }

  if(!missing.empty()) {
    std::error_code ec;
    if(!fs::is_directory(existing, ec)) {
      throw FsError::not_a_directory(existing.string());
    }
    if(!allow_missing_parents && missing.size() > 1) {
      throw FsError::not_found(lexical.parent_path().string());
    }
  }

  std::error_code ec;
  auto canonical_ancestor = fs::canonical(existing, ec);
  if(ec) throw_canonicalize_error(ec, path);

  ensure_contained(policy, existing, canonical_ancestor, path);
  ensure_not_denied(policy, existing, canonical_ancestor, path);

  fs::path resolved = canonical_ancestor;
  for(auto it = missing.rbegin(); it != missing.rend(); ++it) {
    resolved /= *it;
  }
  if(auto pattern = policy.denied_by(resolved)) {
    throw FsError::permission_denied(path, "matches denied pattern " + *pattern);
  }
  if(auto pattern = policy.denied_by(lexical)) {
    throw FsError::permission_denied(path, "matches denied pattern " + *pattern);
  }
  return resolved;
}
