#pragma once
#include <string>
#include <cstdint>
#include <vector>

namespace pacsat {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
std::string bytes_to_hex(const uint8_t* data, size_t len);
std::string to_upper(std::string s);
bool iequals(const std::string& a, const std::string& b);
bool icontains(const std::string& haystack, const std::string& needle);
std::string trim_right(const std::string& s);

} // namespace pacsat
