#include "errors.hpp"
#include <string>

namespace termlink {

namespace {

class TermlinkCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "termlink"; }
  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
    case errc::not_connected:
      return "endpoint not connected";
    case errc::closed:
      return "endpoint closed";
    case errc::back_pressured:
      return "back pressured";
    case errc::payload_too_large:
      return "payload too large";
    case errc::window_full:
      return "send window full";
    default:
      return "unknown termlink error";
    }
  }
};

} // namespace

const std::error_category &termlink_category() {
  static TermlinkCategory cat;
  return cat;
}

} // namespace termlink
