#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

// Uploads land in <project>/.ttyhub/uploads/<YYYYMMDD-HHMMSS>-<8 hex>-<name>
// and are then written through write_file, which adds ".tmp-<32 hex>" while
// the data is in flight. The name is capped so that the temporary sibling
// stays within a 90 byte path component.
inline constexpr std::size_t kUploadComponentBudgetBytes = 90;
inline constexpr std::size_t kUploadPrefixBytes = 25;
inline constexpr std::size_t kUploadTempSuffixBytes = 41;
inline constexpr std::size_t kMaxUploadFileNameBytes =
  kUploadComponentBudgetBytes - kUploadPrefixBytes - kUploadTempSuffixBytes;

inline constexpr const char* kUploadPlaceholderName = "attachment.bin";

std::string sanitize_upload_file_name(std::string_view file_name);
bool is_reserved_device_name(std::string_view name);
std::string truncate_file_name_preserving_extension(std::string_view name, std::size_t max_bytes);

std::filesystem::path uploads_directory(const std::filesystem::path& project);
std::filesystem::path build_upload_destination(
  const std::filesystem::path& project,
  const std::string& sanitized_name,
  std::chrono::system_clock::time_point now = std::chrono::system_clock::now());
