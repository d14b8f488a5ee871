
#include "util.hpp"
#include <cctype>

namespace blockview {

bool parse_host_port(const std::string &s, std::string &host, uint16_t &port) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos || pos == 0)
    return false;
  std::string digits = s.substr(pos + 1);
  if (digits.empty() || digits.size() > 5)
    return false;
  uint64_t p = 0;
  if (!parse_u64(digits, p) || p == 0 || p > 65535)
    return false;
  host = s.substr(0, pos);
  if (host.size() > 2 && host.front() == '[' && host.back() == ']')
    host = host.substr(1, host.size() - 2);
  port = (uint16_t)p;
  return true;
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

std::vector<uint8_t> hex_to_bytes(const std::string &hex) {
  std::vector<uint8_t> out;
  if (hex.empty() || (hex.size() % 2) != 0)
    return out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = hex_value(hex[i]);
    int lo = hex_value(hex[i + 1]);
    if (hi < 0 || lo < 0)
      return {};
    out.push_back((uint8_t)((hi << 4) | lo));
  }
  return out;
}

bool parse_u64(const std::string &s, uint64_t &out) {
  if (s.empty() || s.size() > 20)
    return false;
  uint64_t v = 0;
  for (char ch : s) {
    if (!std::isdigit((unsigned char)ch))
      return false;
    uint64_t d = (uint64_t)(ch - '0');
    if (v > (UINT64_MAX - d) / 10)
      return false;
    v = v * 10 + d;
  }
  out = v;
  return true;
}

bool parse_u64_in_range(const std::string &s, uint64_t lo, uint64_t hi,
                        uint64_t &out) {
  uint64_t v = 0;
  if (!parse_u64(s, v) || v < lo || v > hi)
    return false;
  out = v;
  return true;
}

uint64_t parse_chunk_size(const std::string &s, uint64_t default_value) {
  uint64_t n = 0;
  if (!parse_u64(s, n) || n == 0)
    return default_value;
  return n;
}

} // namespace blockview
