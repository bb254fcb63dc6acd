#pragma once

#include <cstddef>
#include <string>

// HMAC-SHA256 of message under key, hex encoded (lowercase).
std::string hmac_sha256_hex(const std::string& key, const std::string& message);

// HMAC-SHA256 of message under key, base64 encoded.
std::string hmac_sha256_base64(const std::string& key, const std::string& message);

std::string base64_encode(const unsigned char* data, std::size_t len);
