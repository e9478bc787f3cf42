#include "utils.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <fnmatch.h>
#include <unistd.h>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string base64_encode(std::string_view data){
    if(data.empty()) return std::string();
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(data.data()),
                            static_cast<int>(data.size()));
    out.resize(n < 0 ? 0 : static_cast<std::size_t>(n));
    return out;
}

bool base64_decode(std::string_view encoded, std::string& out){
    std::string clean;
    clean.reserve(encoded.size());
    for(char c : encoded){
        if(c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        clean.push_back(c);
    }
    out.clear();
    if(clean.empty()) return true;
    if(clean.size() % 4 != 0) return false;

    std::size_t padding = 0;
    if(clean[clean.size() - 1] == '=') padding++;
    if(clean[clean.size() - 2] == '=') padding++;

    out.resize(3 * (clean.size() / 4));
    int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(clean.data()),
                            static_cast<int>(clean.size()));
    if(n < 0 || static_cast<std::size_t>(n) < padding){
        out.clear();
        return false;
    }
    // EVP_DecodeBlock counts padding as zero bytes
    out.resize(static_cast<std::size_t>(n) - padding);
    return true;
}

std::string random_hex(std::size_t bytes){
    std::vector<unsigned char> buf(bytes);
    if(bytes > 0 && RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1){
        throw std::runtime_error("RAND_bytes failed");
    }
    return hex_from_bytes(buf);
}

std::string format_rfc3339(std::chrono::system_clock::time_point tp){
    auto secs = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::tm tm{};
    gmtime_r(&secs, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
    return oss.str();
}

std::string now_rfc3339(){
    return format_rfc3339(std::chrono::system_clock::now());
}

bool glob_match(const std::string& pattern, const std::string& text){
    return fnmatch(pattern.c_str(), text.c_str(), 0) == 0;
}

bool is_valid_utf8(std::string_view data){
    std::size_t i = 0;
    const std::size_t n = data.size();
    while(i < n){
        unsigned char c = static_cast<unsigned char>(data[i]);
        std::size_t len = 0;
        uint32_t cp = 0;
        if(c < 0x80){ i++; continue; }
        else if((c & 0xE0) == 0xC0){ len = 2; cp = c & 0x1F; }
        else if((c & 0xF0) == 0xE0){ len = 3; cp = c & 0x0F; }
        else if((c & 0xF8) == 0xF0){ len = 4; cp = c & 0x07; }
        else return false;
        if(i + len > n) return false;
        for(std::size_t k = 1; k < len; ++k){
            unsigned char cc = static_cast<unsigned char>(data[i + k]);
            if((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        // overlong forms, surrogates, out of range
        if((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)) return false;
        if(cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += len;
    }
    return true;
}

std::string utf8_truncate(std::string_view data, std::size_t max_bytes){
    if(data.size() <= max_bytes) return std::string(data);
    std::size_t cut = max_bytes;
    while(cut > 0 && (static_cast<unsigned char>(data[cut]) & 0xC0) == 0x80){
        cut--;
    }
    return std::string(data.substr(0, cut));
}

std::string local_hostname(){
    char hostname[256];
    if(gethostname(hostname, sizeof(hostname)) != 0){
        return "unknown-host";
    }
    hostname[sizeof(hostname) - 1] = '\0';
    return hostname;
}
