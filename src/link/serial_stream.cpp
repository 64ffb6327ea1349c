
#include "serial_stream.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <cerrno>
#include <stdexcept>

#if defined(_WIN32)
#include <windows.h>
#else
#include <termios.h>
#endif

namespace brainlink {

bool parse_device_spec(const std::string &s, SerialConfig &cfg) {
  auto pos = s.rfind(':');
  if (pos == std::string::npos) {
    if (s.empty())
      return false;
    cfg.device = s;
    return true;
  }
  if (pos == 0)
    return false;
  std::string rate = s.substr(pos + 1);
  if (rate.empty())
    return false;
  for (char c : rate)
    if (c < '0' || c > '9')
      return false;
  unsigned long baud = 0;
  try {
    baud = std::stoul(rate);
  } catch (const std::out_of_range &) {
    return false;
  }
  if (baud == 0 || baud > 4000000)
    return false;
  cfg.device = s.substr(0, pos);
  cfg.baud_rate = static_cast<unsigned>(baud);
  return true;
}

SerialStream::SerialStream() : port_(io_) {}

SerialStream::~SerialStream() { close(); }

void SerialStream::open(const SerialConfig &cfg, std::error_code &ec) {
  ec.clear();
  close();
  port_.open(cfg.device, ec);
  if (ec) {
    Logger::instance().log(LogLevel::WARN, "open %s failed: %s",
                           cfg.device.c_str(), ec.message().c_str());
    return;
  }
  using base = asio::serial_port_base;
  port_.set_option(base::baud_rate(cfg.baud_rate), ec);
  if (!ec)
    port_.set_option(base::character_size(8), ec);
  if (!ec)
    port_.set_option(base::parity(base::parity::none), ec);
  if (!ec)
    port_.set_option(base::stop_bits(base::stop_bits::one), ec);
  if (!ec)
    port_.set_option(base::flow_control(base::flow_control::none), ec);
  if (ec) {
    Logger::instance().log(LogLevel::WARN, "configure %s failed: %s",
                           cfg.device.c_str(), ec.message().c_str());
    close();
    return;
  }
  cfg_ = cfg;
  Logger::instance().log(LogLevel::INFO, "opened %s at %u baud",
                         cfg.device.c_str(), cfg.baud_rate);
}

void SerialStream::close() {
  if (!port_.is_open())
    return;
  std::error_code ec;
  port_.close(ec);
  if (ec)
    Logger::instance().log(LogLevel::WARN, "close %s: %s", cfg_.device.c_str(),
                           ec.message().c_str());
}

size_t SerialStream::read_exact(uint8_t *data, size_t len,
                                Clock::time_point deadline,
                                std::error_code &ec) {
  ec.clear();
  if (!port_.is_open()) {
    ec = errc::io_failure;
    return 0;
  }
  if (len == 0)
    return 0;

  std::error_code result = asio::error::would_block;
  size_t got = 0;
  asio::async_read(port_, asio::buffer(data, len),
                   [&](const std::error_code &e, std::size_t n) {
                     result = e;
                     got = n;
                   });
  io_.restart();
  io_.run_until(deadline);
  if (result == asio::error::would_block) {
    std::error_code ignored;
    port_.cancel(ignored);
    io_.run();
    if (result == asio::error::operation_aborted) {
      ec = asio::error::timed_out;
      return got;
    }
  }
  ec = result;
  return got;
}

size_t SerialStream::write_all(const uint8_t *data, size_t len,
                               std::error_code &ec) {
  ec.clear();
  if (!port_.is_open()) {
    ec = errc::io_failure;
    return 0;
  }
  size_t n = asio::write(port_, asio::buffer(data, len), ec);
  if (!ec && n != len)
    ec = errc::short_write;
  return n;
}

void SerialStream::flush(std::error_code &ec) {
  ec.clear();
  if (!port_.is_open()) {
    ec = errc::io_failure;
    return;
  }
#if defined(_WIN32)
  if (!::FlushFileBuffers(port_.native_handle()))
    ec = std::error_code((int)::GetLastError(), std::system_category());
#else
  if (::tcdrain(port_.native_handle()) != 0)
    ec = std::error_code(errno, std::generic_category());
#endif
}

} // namespace brainlink
