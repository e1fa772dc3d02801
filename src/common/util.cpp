#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace lanxfer {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos)
    return false;
  host = s.substr(0, pos);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
    host = host.substr(1, host.size() - 2);
  try {
    size_t used = 0;
    int p = std::stoi(s.substr(pos + 1), &used);
    if (used != s.size() - pos - 1 || p < 0 || p > 65535)
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::logic_error &) {
    return false;
  }
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  return s;
}

std::string file_extension(const std::string &file_name) {
  auto pos = file_name.rfind('.');
  if (pos == std::string::npos)
    return "";
  return to_lower(file_name.substr(pos));
}

bool is_safe_name(const std::string &s) {
  if (s.empty() || s == "." || s == "..")
    return false;
  for (unsigned char c : s) {
    if (!std::isalnum(c) && c != '.' && c != '_' && c != '-')
      return false;
  }
  return true;
}

bool is_hex_digest(const std::string &s, size_t len) {
  if (s.size() != len)
    return false;
  for (unsigned char c : s)
    if (!std::isxdigit(c))
      return false;
  return true;
}

bool contains(const std::vector<std::string> &v, const std::string &s) {
  return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace lanxfer
