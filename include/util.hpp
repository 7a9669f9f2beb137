#pragma once
#include <string>
#include <cstdint>
#include <optional>

namespace termlink {

bool parse_host_port(const std::string& s, std::string& host, uint16_t& port);

// "65536", "64k", "16m", "1g" (binary multiples)
std::optional<int64_t> parse_size(const std::string& s);

} // namespace termlink
