#pragma once
#include <string>
#include <cstdint>
#include <vector>

namespace blockview {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
std::vector<uint8_t> hex_to_bytes(const std::string& hex);
// Whole string must be a decimal number; no sign, no trailing characters.
bool parse_u64(const std::string& s, uint64_t& out);
// parse_u64 restricted to [lo, hi].
bool parse_u64_in_range(const std::string& s, uint64_t lo, uint64_t hi, uint64_t& out);

// Request parameter to chunk size; absent, malformed or non-positive input
// yields default_value.
uint64_t parse_chunk_size(const std::string& s, uint64_t default_value);

} // namespace blockview
