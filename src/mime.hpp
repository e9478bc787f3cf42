#pragma once

#include <string>
#include <string_view>

// Magic-number sniffing first, then the extension table.
std::string detect_mime_type(std::string_view head, const std::string& filename);
std::string mime_from_extension(const std::string& filename);
bool is_text_mime(const std::string& mime);
