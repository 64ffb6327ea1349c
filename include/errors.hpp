
#pragma once
#include <system_error>

namespace brainlink {

enum class errc {
    sync_timeout = 1,
    truncated_payload,
    unknown_command,
    payload_too_large,
    io_failure,
    short_write,
    invalid_packet_size
};

const std::error_category& link_category();
std::error_code make_error_code(errc e);

} // namespace brainlink

namespace std {
template <> struct is_error_code_enum<brainlink::errc> : true_type {};
} // namespace std
