
#pragma once
#include <chrono>
#include <optional>
#include <system_error>
#include <vector>
#include "protocol.hpp"
#include "stream.hpp"

namespace brainlink {

// One device connection. Owns the protocol exchange over a stream it does not
// own; the stream must outlive the dispatcher and have no other user.
class Dispatcher {
public:
    static constexpr std::chrono::milliseconds kDefaultTimeout{100};
    static constexpr std::chrono::milliseconds kCloseTimeout{15000};

    explicit Dispatcher(ByteStream& stream, DeviceType type = DeviceType::User);

    // Returns the number of bytes put on the wire, 0 on failure.
    size_t send_simple(Command cmd, const std::vector<uint8_t>& payload, std::error_code& ec);
    size_t send_extended(Command cmd, const std::vector<uint8_t>& payload, std::error_code& ec);

    // Blocks until one reply frame is read or the timeout (the dispatcher's
    // current one when not given) runs out.
    std::optional<Frame> receive_simple(std::error_code& ec,
                                        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // nullopt restores kDefaultTimeout.
    void set_timeout(std::optional<std::chrono::milliseconds> t);
    std::chrono::milliseconds timeout() const { return timeout_; }
    DeviceType device_type() const { return type_; }

private:
    ByteStream& stream_;
    DeviceType type_;
    std::chrono::milliseconds timeout_{kDefaultTimeout};
};

// Raises a dispatcher's receive timeout for a scope, restoring the previous
// value on exit.
class ScopedTimeout {
public:
    ScopedTimeout(Dispatcher& d, std::chrono::milliseconds t)
        : d_(d), prev_(d.timeout()) { d_.set_timeout(t); }
    ~ScopedTimeout() { d_.set_timeout(prev_); }
    ScopedTimeout(const ScopedTimeout&) = delete;
    ScopedTimeout& operator=(const ScopedTimeout&) = delete;
private:
    Dispatcher& d_;
    std::chrono::milliseconds prev_;
};

} // namespace brainlink
