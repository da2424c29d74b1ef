#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);
std::string sha256_hex(const std::vector<char>& data);

// OpenSSL CSPRNG; throws CryptoError when the generator is not seeded.
std::vector<unsigned char> random_bytes(std::size_t count);
std::string random_hex_id(std::size_t byte_count = 32);
std::string make_uuid_v4();

// RFC 4648 section 5 alphabet without padding.
std::string base64url_encode(const std::vector<unsigned char>& data);
std::optional<std::vector<unsigned char>> base64url_decode(const std::string& text);

bool is_valid_utf8(const std::string& text);

uint64_t unix_time_seconds();

// Host name of this machine, or "Unknown Device".
std::string device_display_name();

// Final component of a path-like string, fallback when there is none.
std::string file_name_from_path(const std::string& path, const std::string& fallback = "file");
