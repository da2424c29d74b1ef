#include "utils.hpp"
#include "errors.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <iomanip>

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

std::string sha256_hex(const std::vector<char>& data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return hex_from_bytes(out);
}

std::vector<unsigned char> random_bytes(std::size_t count){
    std::vector<unsigned char> out(count);
    if(count == 0) return out;
    if(RAND_bytes(out.data(), static_cast<int>(count)) != 1){
        throw CryptoError("random number generator failure");
    }
    return out;
}

std::string random_hex_id(std::size_t byte_count){
    return hex_from_bytes(random_bytes(byte_count));
}

std::string make_uuid_v4(){
    auto b = random_bytes(16);
    b[6] = static_cast<unsigned char>((b[6] & 0x0f) | 0x40);
    b[8] = static_cast<unsigned char>((b[8] & 0x3f) | 0x80);
    auto hex = hex_from_bytes(b);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20);
}

std::string base64url_encode(const std::vector<unsigned char>& data){
    if(data.empty()) return "";
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(written));
    while(!out.empty() && out.back() == '=') out.pop_back();
    for(auto& c : out){
        if(c == '+') c = '-';
        else if(c == '/') c = '_';
    }
    return out;
}

std::optional<std::vector<unsigned char>> base64url_decode(const std::string& text){
    if(text.empty()) return std::vector<unsigned char>{};
    // EVP_DecodeBlock accepts the standard alphabet, so the url-safe one is checked here
    for(unsigned char c : text){
        if(!(std::isalnum(c) || c == '-' || c == '_')) return std::nullopt;
    }
    if(text.size() % 4 == 1) return std::nullopt;

    std::string standard = text;
    for(auto& c : standard){
        if(c == '-') c = '+';
        else if(c == '_') c = '/';
    }
    std::size_t padding = (4 - standard.size() % 4) % 4;
    standard.append(padding, '=');

    std::vector<unsigned char> out(standard.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(standard.data()),
                                  static_cast<int>(standard.size()));
    if(decoded < 0 || static_cast<std::size_t>(decoded) < padding) return std::nullopt;
    out.resize(static_cast<std::size_t>(decoded) - padding);
    return out;
}

bool is_valid_utf8(const std::string& text){
    std::size_t i = 0;
    const std::size_t n = text.size();
    while(i < n){
        unsigned char c = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        uint32_t cp = 0;
        if(c < 0x80){ ++i; continue; }
        else if((c & 0xe0) == 0xc0){ extra = 1; cp = c & 0x1f; }
        else if((c & 0xf0) == 0xe0){ extra = 2; cp = c & 0x0f; }
        else if((c & 0xf8) == 0xf0){ extra = 3; cp = c & 0x07; }
        else return false;
        if(i + extra >= n) return false;
        for(std::size_t k = 1; k <= extra; ++k){
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if((cc & 0xc0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3f);
        }
        // overlong forms, surrogates and out-of-range code points
        if((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000)) return false;
        if(cp > 0x10ffff || (cp >= 0xd800 && cp <= 0xdfff)) return false;
        i += extra + 1;
    }
    return true;
}

uint64_t unix_time_seconds(){
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

std::string device_display_name(){
    char hostname[256] = {0};
    if(gethostname(hostname, sizeof(hostname) - 1) != 0 || hostname[0] == '\0'){
        return "Unknown Device";
    }
    return std::string(hostname);
}

std::string file_name_from_path(const std::string& path, const std::string& fallback){
    auto name = std::filesystem::path(path).filename().string();
    if(name.empty() || name == "." || name == "..") return fallback;
    return name;
}
