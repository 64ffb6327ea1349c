
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>
#include "protocol.hpp"
#include "stream.hpp"

namespace brainlink {

// [C9 36 B8 47][cmd][payload...]
std::vector<uint8_t> encode_simple(Command cmd, const std::vector<uint8_t>& payload);

// Builds [inner cmd][len (1 or 2 bytes)][payload...][crc16 hi][crc16 lo], the
// payload of an outer Extended simple frame. The CRC covers the outer magic and
// Extended byte too. Fails with errc::payload_too_large above 0x7FFF bytes.
bool encode_extended(Command cmd, const std::vector<uint8_t>& payload,
                     std::vector<uint8_t>& out, std::error_code& ec);

// Device reply layout consumed by decode_frame:
// [AA 55][cmd][len][len lo, Extended only][payload...]
bool encode_reply(Command cmd, const std::vector<uint8_t>& payload,
                  std::vector<uint8_t>& out, std::error_code& ec);

// Scans the stream for the reply marker and reads one frame. The marker search
// is bounded by timeout; each read of the frame body gets the same timeout.
std::optional<Frame> decode_frame(ByteStream& stream, std::chrono::milliseconds timeout,
                                  std::error_code& ec);

} // namespace brainlink
