
#include "dispatcher.hpp"
#include "codec.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"

namespace brainlink {

Dispatcher::Dispatcher(ByteStream &stream, DeviceType type)
    : stream_(stream), type_(type) {}

size_t Dispatcher::send_simple(Command cmd, const std::vector<uint8_t> &payload,
                               std::error_code &ec) {
  ec.clear();
  std::vector<uint8_t> packet = encode_simple(cmd, payload);
  auto &log = Logger::instance();
  if (log.enabled(LogLevel::TRACE))
    log.log(LogLevel::TRACE, "%s tx %s [%s]", device_type_name(type_),
            command_name(cmd), bytes_to_hex(packet.data(), packet.size()).c_str());

  size_t n = stream_.write_all(packet.data(), packet.size(), ec);
  if (!ec && n != packet.size())
    ec = errc::short_write;
  if (ec) {
    log.log(LogLevel::WARN, "%s write failed after %zu/%zu bytes: %s",
            device_type_name(type_), n, packet.size(), ec.message().c_str());
    return 0;
  }
  stream_.flush(ec);
  if (ec) {
    log.log(LogLevel::WARN, "%s flush failed: %s", device_type_name(type_),
            ec.message().c_str());
    return 0;
  }
  return packet.size();
}

size_t Dispatcher::send_extended(Command cmd,
                                 const std::vector<uint8_t> &payload,
                                 std::error_code &ec) {
  std::vector<uint8_t> inner;
  if (!encode_extended(cmd, payload, inner, ec))
    return 0;
  return send_simple(Command::Extended, inner, ec);
}

std::optional<Frame>
Dispatcher::receive_simple(std::error_code &ec,
                           std::optional<std::chrono::milliseconds> timeout) {
  auto f = decode_frame(stream_, timeout.value_or(timeout_), ec);
  auto &log = Logger::instance();
  if (!f) {
    log.log(LogLevel::DEBUG, "%s rx failed: %s", device_type_name(type_),
            ec.message().c_str());
    return std::nullopt;
  }
  if (log.enabled(LogLevel::TRACE))
    log.log(LogLevel::TRACE, "%s rx %s [%s]", device_type_name(type_),
            command_name(f->command),
            bytes_to_hex(f->payload.data(), f->payload.size()).c_str());
  return f;
}

void Dispatcher::set_timeout(std::optional<std::chrono::milliseconds> t) {
  timeout_ = t.value_or(kDefaultTimeout);
}

} // namespace brainlink
