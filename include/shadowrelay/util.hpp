#pragma once
#include <string>
#include <cstdint>
#include <vector>

namespace shadowrelay {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);
bool parse_uint(const std::string& s, uint64_t max, uint64_t& out);
// Empty result on odd length or non-hex input.
std::vector<uint8_t> hex_to_bytes(const std::string& hex);

} // namespace shadowrelay
