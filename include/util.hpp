#pragma once
#include <string>
#include <cstdint>
#include <vector>

namespace lanxfer {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
std::string to_lower(std::string s);
// ".zip" for "backup.ZIP", "" when there is no dot.
std::string file_extension(const std::string& file_name);
// Letters, digits, '.', '_' and '-' only; never "." or "..".
bool is_safe_name(const std::string& s);
bool is_hex_digest(const std::string& s, size_t len);
bool contains(const std::vector<std::string>& v, const std::string& s);

} // namespace lanxfer
