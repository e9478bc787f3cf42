#include "mime.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_map>

namespace {

const std::unordered_map<std::string, std::string>& extension_table() {
  static const std::unordered_map<std::string, std::string> table = {
    {"rs", "text/x-rust"}, {"py", "text/x-python"}, {"js", "application/javascript"},
    {"mjs", "application/javascript"}, {"ts", "text/typescript"}, {"tsx", "text/typescript-jsx"},
    {"jsx", "text/javascript-jsx"}, {"go", "text/x-go"}, {"java", "text/x-java"},
    {"c", "text/x-c"}, {"h", "text/x-c"},
    {"cpp", "text/x-c++"}, {"cc", "text/x-c++"}, {"cxx", "text/x-c++"}, {"hpp", "text/x-c++"},
    {"rb", "text/x-ruby"}, {"php", "text/x-php"}, {"swift", "text/x-swift"},
    {"kt", "text/x-kotlin"}, {"kts", "text/x-kotlin"}, {"scala", "text/x-scala"},
    {"sh", "text/x-shellscript"}, {"bash", "text/x-shellscript"}, {"zsh", "text/x-shellscript"},
    {"ps1", "text/x-powershell"}, {"html", "text/html"}, {"htm", "text/html"},
    {"css", "text/css"}, {"scss", "text/x-scss"}, {"sass", "text/x-scss"}, {"less", "text/x-less"},
    {"xml", "application/xml"}, {"json", "application/json"},
    {"yaml", "text/x-yaml"}, {"yml", "text/x-yaml"}, {"toml", "text/x-toml"},
    {"md", "text/markdown"}, {"markdown", "text/markdown"}, {"rst", "text/x-rst"},
    {"tex", "text/x-tex"}, {"ini", "text/x-ini"}, {"cfg", "text/x-ini"}, {"conf", "text/x-ini"},
    {"env", "text/x-env"}, {"txt", "text/plain"}, {"log", "text/x-log"}, {"csv", "text/csv"},
    {"cmake", "text/x-cmake"},
    {"svg", "image/svg+xml"}, {"png", "image/png"}, {"jpg", "image/jpeg"}, {"jpeg", "image/jpeg"},
    {"gif", "image/gif"}, {"webp", "image/webp"}, {"bmp", "image/bmp"}, {"pdf", "application/pdf"},
    {"zip", "application/zip"}, {"gz", "application/gzip"}, {"tar", "application/x-tar"},
  };
  return table;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

bool starts_with(std::string_view data, std::string_view prefix) {
  return data.size() >= prefix.size() && data.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::string mime_from_extension(const std::string& filename) {
  std::filesystem::path p(filename);
  auto name = to_lower(p.filename().string());
  if(name == "dockerfile") return "text/x-dockerfile";
  if(name == "makefile") return "text/x-makefile";

  auto ext = p.extension().string();
  if(!ext.empty() && ext[0] == '.') ext.erase(0, 1);
  ext = to_lower(ext);
  const auto& table = extension_table();
  auto it = table.find(ext);
  if(it != table.end()) return it->second;
  return "application/octet-stream";
}

std::string detect_mime_type(std::string_view head, const std::string& filename) {
  using namespace std::string_view_literals;
  if(starts_with(head, "\x89PNG\r\n\x1a\n"sv)) return "image/png";
  if(starts_with(head, "\xff\xd8\xff"sv)) return "image/jpeg";
  if(starts_with(head, "GIF87a"sv) || starts_with(head, "GIF89a"sv)) return "image/gif";
  if(starts_with(head, "%PDF-"sv)) return "application/pdf";
  if(starts_with(head, "PK\x03\x04"sv)) return "application/zip";
  if(starts_with(head, "\x1f\x8b"sv)) return "application/gzip";
  if(starts_with(head, "\x7f" "ELF"sv)) return "application/x-executable";
  if(head.size() >= 12 && starts_with(head, "RIFF"sv) && head.substr(8, 4) == "WEBP"sv) {
    return "image/webp";
  }
  return mime_from_extension(filename);
}

bool is_text_mime(const std::string& mime) {
  auto ends_with = [&](const char* suffix) {
    std::string_view s(suffix);
    return mime.size() >= s.size() && mime.compare(mime.size() - s.size(), s.size(), s) == 0;
  };
  return mime.rfind("text/", 0) == 0 ||
         mime == "application/json" ||
         mime == "application/javascript" ||
         mime == "application/xml" ||
         ends_with("+xml") ||
         ends_with("+json");
}
