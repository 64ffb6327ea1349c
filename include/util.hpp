
#pragma once
#include <string>
#include <cstddef>
#include <cstdint>

namespace brainlink {

// Space separated, at most max_bytes shown, longer input ends with "...".
std::string bytes_to_hex(const uint8_t* data, size_t len, size_t max_bytes = 64);

} // namespace brainlink
