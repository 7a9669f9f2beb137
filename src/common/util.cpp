#include "util.hpp"
#include <cctype>
#include <stdexcept>

namespace termlink {

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

std::optional<int64_t> parse_size(const std::string &s) {
  if (s.empty())
    return std::nullopt;
  int64_t mult = 1;
  std::string digits = s;
  switch (std::tolower((unsigned char)s.back())) {
  case 'k':
    mult = 1024;
    break;
  case 'm':
    mult = 1024 * 1024;
    break;
  case 'g':
    mult = 1024 * 1024 * 1024;
    break;
  default:
    break;
  }
  if (mult != 1)
    digits.pop_back();
  if (digits.empty())
    return std::nullopt;
  for (char c : digits)
    if (!std::isdigit((unsigned char)c))
      return std::nullopt;
  try {
    return std::stoll(digits) * mult;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

} // namespace termlink
