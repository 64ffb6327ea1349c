
#pragma once
#include <asio.hpp>
#include <string>
#include "stream.hpp"

namespace brainlink {

struct SerialConfig {
    std::string device;
    unsigned baud_rate{115200};
};

// "path" or "path:baud". baud_rate is left untouched when absent.
bool parse_device_spec(const std::string& s, SerialConfig& cfg);

// ByteStream over a serial port. Reads are bounded by driving a private
// io_context until the caller's deadline and cancelling what is still pending.
class SerialStream : public ByteStream {
public:
    SerialStream();
    ~SerialStream() override;
    SerialStream(const SerialStream&) = delete;
    SerialStream& operator=(const SerialStream&) = delete;

    void open(const SerialConfig& cfg, std::error_code& ec);
    void close();
    bool is_open() const { return port_.is_open(); }
    const SerialConfig& config() const { return cfg_; }

    size_t read_exact(uint8_t* data, size_t len, Clock::time_point deadline,
                      std::error_code& ec) override;
    size_t write_all(const uint8_t* data, size_t len, std::error_code& ec) override;
    void flush(std::error_code& ec) override;

private:
    asio::io_context io_;
    asio::serial_port port_;
    SerialConfig cfg_;
};

} // namespace brainlink
