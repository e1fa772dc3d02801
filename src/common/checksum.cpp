#include "checksum.hpp"
#include "logging.hpp"
#include <sodium.h>
#include <cctype>
#include <fstream>

namespace lanxfer {

bool crypto_init() {
  if (sodium_init() < 0) {
    Logger::instance().log(LogLevel::ERROR, "checksum",
                           "libsodium initialisation failed");
    return false;
  }
  return true;
}

static std::string to_hex(const uint8_t *bin, size_t len) {
  std::string hex(len * 2 + 1, '\0');
  sodium_bin2hex(&hex[0], hex.size(), bin, len);
  hex.resize(len * 2);
  return hex;
}

std::string sha256_hex(const uint8_t *data, size_t len) {
  uint8_t out[crypto_hash_sha256_BYTES];
  crypto_hash_sha256(out, data, (unsigned long long)len);
  return to_hex(out, sizeof(out));
}

bool sha256_file(const std::string &path, std::string &hex_out) {
  std::ifstream in(path, std::ios::binary);
  if (!in)
    return false;
  crypto_hash_sha256_state st;
  crypto_hash_sha256_init(&st);
  std::vector<char> buf(64 * 1024);
  while (in) {
    in.read(buf.data(), (std::streamsize)buf.size());
    std::streamsize n = in.gcount();
    if (n > 0)
      crypto_hash_sha256_update(&st, (const unsigned char *)buf.data(),
                                (unsigned long long)n);
  }
  if (in.bad())
    return false;
  uint8_t out[crypto_hash_sha256_BYTES];
  crypto_hash_sha256_final(&st, out);
  hex_out = to_hex(out, sizeof(out));
  return true;
}

bool digest_equal(const std::string &a, const std::string &b) {
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); i++) {
    if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i]))
      return false;
  }
  return true;
}

std::string base64_encode(const uint8_t *data, size_t len) {
  size_t cap = sodium_base64_ENCODED_LEN(len, sodium_base64_VARIANT_ORIGINAL);
  std::string out(cap, '\0');
  sodium_bin2base64(&out[0], cap, data, len, sodium_base64_VARIANT_ORIGINAL);
  out.resize(cap - 1);
  return out;
}

bool base64_decode(const std::string &in, std::vector<uint8_t> &out) {
  out.assign(in.size() / 4 * 3 + 3, 0);
  size_t bin_len = 0;
  const char *end = nullptr;
  if (sodium_base642bin(out.data(), out.size(), in.data(), in.size(), " \r\n",
                        &bin_len, &end, sodium_base64_VARIANT_ORIGINAL) != 0)
    return false;
  if (end != in.data() + in.size())
    return false;
  out.resize(bin_len);
  return true;
}

} // namespace lanxfer
