
#pragma once
#include <chrono>
#include <cstdint>
#include <cstddef>
#include <system_error>

namespace brainlink {

using Clock = std::chrono::steady_clock;

// Blocking duplex byte stream owned by exactly one dispatcher.
//
// read_exact blocks until len bytes arrived or the deadline passed. On timeout
// it returns the number of bytes read so far and sets ec to a value equal to
// std::errc::timed_out. Any other error is a transport failure.
class ByteStream {
public:
    virtual ~ByteStream() = default;
    virtual size_t read_exact(uint8_t* data, size_t len, Clock::time_point deadline,
                              std::error_code& ec) = 0;
    virtual size_t write_all(const uint8_t* data, size_t len, std::error_code& ec) = 0;
    virtual void flush(std::error_code& ec) = 0;
};

} // namespace brainlink
