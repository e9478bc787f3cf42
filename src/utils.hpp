#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

std::string base64_encode(std::string_view data);
// Returns false on malformed input. Whitespace is ignored.
bool base64_decode(std::string_view encoded, std::string& out);

// Cryptographically random lowercase hex string, 2 chars per byte.
std::string random_hex(std::size_t bytes);

std::string format_rfc3339(std::chrono::system_clock::time_point tp);
std::string now_rfc3339();

// Shell-style wildcard match where '*' also crosses '/'.
bool glob_match(const std::string& pattern, const std::string& text);

bool is_valid_utf8(std::string_view data);
// Longest prefix of at most max_bytes that ends on a code point boundary.
std::string utf8_truncate(std::string_view data, std::size_t max_bytes);

std::string local_hostname();
