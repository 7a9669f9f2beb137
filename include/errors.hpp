#pragma once
#include <system_error>

namespace termlink {

enum class errc {
    not_connected = 1,
    closed,
    back_pressured,
    payload_too_large,
    window_full
};

const std::error_category& termlink_category();

inline std::error_code make_error_code(errc e) {
    return std::error_code(static_cast<int>(e), termlink_category());
}

} // namespace termlink

namespace std {
template <> struct is_error_code_enum<termlink::errc> : true_type {};
} // namespace std
