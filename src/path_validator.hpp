#pragma once

#include "fs_error.hpp"
#include "sandbox_policy.hpp"

#include <filesystem>
#include <memory>
#include <string>

// Every filesystem request is resolved here before anything touches disk.
// Failures are thrown as FsError.
class PathValidator {
public:
  explicit PathValidator(std::shared_ptr<PolicyStore> store);

  std::shared_ptr<const SandboxPolicy> policy() const { return store_->snapshot(); }

  std::filesystem::path validate_existing(const std::string& path) const;
  std::filesystem::path resolve_new(const std::string& path, bool allow_missing_parents) const;

  // Variants used when one request performs several validations and must
  // see a single policy.
  std::filesystem::path validate_existing(const SandboxPolicy& policy, const std::string& path) const;
  std::filesystem::path resolve_new(const SandboxPolicy& policy,
                                    const std::string& path,
                                    bool allow_missing_parents) const;

private:
  static std::filesystem::path lexical_form(const std::string& raw);
  static void ensure_contained(const SandboxPolicy& policy,
                               const std::filesystem::path& lexical,
                               const std::filesystem::path& canonical,
                               const std::string& raw);
  static void ensure_not_denied(const SandboxPolicy& policy,
                                const std::filesystem::path& lexical,
                                const std::filesystem::path& canonical,
                                const std::string& raw);

  std::shared_ptr<PolicyStore> store_;
};
