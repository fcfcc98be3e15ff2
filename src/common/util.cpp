#include "util.hpp"
#include <algorithm>
#include <cctype>

namespace pacsat {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos)
    return false;
  host = s.substr(0, pos);
  try {
    int p = std::stoi(s.substr(pos + 1));
    if (p < 0 || p > 65535)
      return false;
    port = (uint16_t)p;
    return true;
  } catch (const std::exception &) {
    return false;
  }
}

std::string bytes_to_hex(const uint8_t *data, size_t len) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; i++) {
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  return out;
}

std::string to_upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return (char)std::toupper(c); });
  return s;
}

bool iequals(const std::string &a, const std::string &b) {
  return to_upper(a) == to_upper(b);
}

bool icontains(const std::string &haystack, const std::string &needle) {
  if (needle.empty())
    return true;
  return to_upper(haystack).find(to_upper(needle)) != std::string::npos;
}

std::string trim_right(const std::string &s) {
  size_t n = s.size();
  while (n > 0 && (s[n - 1] == ' ' || s[n - 1] == '\0'))
    n--;
  return s.substr(0, n);
}

} // namespace pacsat
