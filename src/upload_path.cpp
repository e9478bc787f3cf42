#include "upload_path.hpp"

#include "utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>

namespace {

bool is_ascii_space(unsigned char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

std::string trim_spaces(std::string_view value) {
  std::size_t begin = 0;
  std::size_t end = value.size();
  while(begin < end && is_ascii_space(static_cast<unsigned char>(value[begin]))) ++begin;
  while(end > begin && is_ascii_space(static_cast<unsigned char>(value[end - 1]))) --end;
  return std::string(value.substr(begin, end - begin));
}

// Strips leading and trailing dots, then surrounding whitespace.
std::string trim_dots_and_spaces(const std::string& value) {
  auto first = value.find_first_not_of('.');
  if(first == std::string::npos) return std::string();
  auto last = value.find_last_not_of('.');
  return trim_spaces(std::string_view(value).substr(first, last - first + 1));
}

// Maps path separators, shell wildcards and control characters to '_'.
std::string replace_invalid(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for(std::size_t i = 0; i < input.size(); ++i) {
    unsigned char ch = static_cast<unsigned char>(input[i]);
    switch(ch) {
      case '/': case '\\': case ':': case '*': case '?':
      case '"': case '<': case '>': case '|':
        out.push_back('_');
        continue;
      default:
        break;
    }
    if(ch < 0x20 || ch == 0x7f) {
      if(is_ascii_space(ch)) {
        out.push_back(static_cast<char>(ch));
      } else {
        out.push_back('_');
      }
      continue;
    }
    // C1 controls, U+0080..U+009F
    if(ch == 0xc2 && i + 1 < input.size()) {
      unsigned char next = static_cast<unsigned char>(input[i + 1]);
      if(next >= 0x80 && next <= 0x9f) {
        out.push_back('_');
        ++i;
        continue;
      }
    }
    out.push_back(static_cast<char>(ch));
  }
  return out;
}

std::string join_whitespace_runs(const std::string& input) {
  std::string out;
  bool pending_gap = false;
  for(unsigned char ch : input) {
    if(is_ascii_space(ch)) {
      pending_gap = !out.empty();
      continue;
    }
    if(pending_gap) {
      out.push_back('_');
      pending_gap = false;
    }
    out.push_back(static_cast<char>(ch));
  }
  return out;
}

} // namespace

bool is_reserved_device_name(std::string_view name) {
  static const std::array<const char*, 22> reserved = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"
  };
  std::string upper = trim_spaces(name);
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::toupper(ch)); });
  return std::any_of(reserved.begin(), reserved.end(),
                     [&](const char* candidate){ return upper == candidate; });
}

std::string truncate_file_name_preserving_extension(std::string_view name, std::size_t max_bytes) {
  if(name.size() <= max_bytes) return std::string(name);

  auto dot = name.rfind('.');
  if(dot == std::string_view::npos || dot == 0 || dot + 1 == name.size()) {
    return utf8_truncate(name, max_bytes);
  }
  std::string_view stem = name.substr(0, dot);
  std::string_view ext = name.substr(dot);
  if(ext.size() >= max_bytes) {
    return utf8_truncate(name, max_bytes);
  }

  std::string short_stem = utf8_truncate(stem, max_bytes - ext.size());
  while(!short_stem.empty() && (short_stem.back() == '.' || short_stem.back() == ' ')) {
    short_stem.pop_back();
  }
  auto first = short_stem.find_first_not_of('.');
  short_stem = first == std::string::npos ? std::string() : short_stem.substr(first);
  if(short_stem.empty()) {
    return utf8_truncate(name, max_bytes);
  }
  return short_stem + std::string(ext);
}

std::string sanitize_upload_file_name(std::string_view file_name) {
  std::string candidate = trim_spaces(file_name);
  if(candidate.empty()) return kUploadPlaceholderName;

  std::string sanitized = join_whitespace_runs(replace_invalid(candidate));
  sanitized = trim_dots_and_spaces(sanitized);
  if(sanitized.empty()) return kUploadPlaceholderName;

  std::string stem = sanitized.substr(0, sanitized.find('.'));
  while(!stem.empty() && (stem.back() == ' ' || stem.back() == '.')) stem.pop_back();
  if(is_reserved_device_name(stem)) {
    sanitized += "_file";
  }

  if(sanitized.size() > kMaxUploadFileNameBytes) {
    sanitized = trim_dots_and_spaces(
      truncate_file_name_preserving_extension(sanitized, kMaxUploadFileNameBytes));
    if(sanitized.empty()) return kUploadPlaceholderName;
  }
  return sanitized;
}

std::filesystem::path uploads_directory(const std::filesystem::path& project) {
  return project / ".ttyhub" / "uploads";
}

std::filesystem::path build_upload_destination(const std::filesystem::path& project,
                                               const std::string& sanitized_name,
                                               std::chrono::system_clock::time_point now) {
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char stamp[32];
  std::strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &tm);
  return uploads_directory(project) / (std::string(stamp) + "-" + random_hex(4) + "-" + sanitized_name);
}
