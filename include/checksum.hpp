#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace lanxfer {

constexpr size_t kSha256HexLen = 64;

// Must run once before any other function here. Safe to call repeatedly.
bool crypto_init();

// Lowercase hex SHA-256 of a buffer.
std::string sha256_hex(const uint8_t* data, size_t len);

// Streams the file through SHA-256. Returns false on I/O error.
bool sha256_file(const std::string& path, std::string& hex_out);

// Case-insensitive comparison of two hex digests.
bool digest_equal(const std::string& a, const std::string& b);

std::string base64_encode(const uint8_t* data, size_t len);
bool base64_decode(const std::string& in, std::vector<uint8_t>& out);

} // namespace lanxfer
