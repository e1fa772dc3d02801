#pragma once
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include "checksum.hpp"
#include "logging.hpp"

#define CHECK(cond)                                                        \
  do {                                                                     \
    if (!(cond)) {                                                         \
      std::cerr << "check failed at " << __FILE__ << ":" << __LINE__       \
                << ": " #cond "\n";                                        \
      return 1;                                                            \
    }                                                                      \
  } while (false)

// Runs a test function returning 0 on success and reports its name.
#define RUN(fn)                                                            \
  do {                                                                     \
    if (fn() != 0) {                                                       \
      std::cerr << #fn " failed\n";                                        \
      return 1;                                                            \
    }                                                                      \
  } while (false)

namespace lanxfer {
namespace test {

inline std::filesystem::path TempDir(const std::string &name) {
  std::error_code ec;
  auto dir = std::filesystem::temp_directory_path(ec) / name;
  if (ec) {
    dir = std::filesystem::path{"."} / name;
  }
  std::filesystem::remove_all(dir, ec);
  std::filesystem::create_directories(dir, ec);
  return dir;
}

inline void Quiet() { Logger::instance().set_level(LogLevel::OFF); }

inline std::vector<uint8_t> Pattern(size_t n, uint8_t seed) {
  std::vector<uint8_t> v(n);
  for (size_t i = 0; i < n; i++)
    v[i] = (uint8_t)(seed + i * 7);
  return v;
}

inline std::vector<uint8_t> ReadFile(const std::filesystem::path &p) {
  std::ifstream in(p, std::ios::binary);
  return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
}

inline bool Has(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace test
} // namespace lanxfer
