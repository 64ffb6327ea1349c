
#include "codec.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace brainlink {

namespace {

bool is_timeout(const std::error_code &ec) {
  return ec == std::errc::timed_out;
}

// Reads the part of a frame that follows the marker. Running out of time here
// means the frame was cut short.
bool read_body(ByteStream &stream, uint8_t *data, size_t len,
               std::chrono::milliseconds timeout, std::error_code &ec) {
  if (len == 0)
    return true;
  std::error_code rec;
  size_t n = stream.read_exact(data, len, Clock::now() + timeout, rec);
  if (rec) {
    ec = is_timeout(rec) ? make_error_code(errc::truncated_payload) : rec;
    return false;
  }
  if (n != len) {
    ec = errc::truncated_payload;
    return false;
  }
  return true;
}

} // namespace

std::vector<uint8_t> encode_simple(Command cmd,
                                   const std::vector<uint8_t> &payload) {
  std::vector<uint8_t> out;
  out.reserve(kHostMagic.size() + 1 + payload.size());
  out.insert(out.end(), kHostMagic.begin(), kHostMagic.end());
  out.push_back(to_byte(cmd));
  out.insert(out.end(), payload.begin(), payload.end());
  return out;
}

bool encode_extended(Command cmd, const std::vector<uint8_t> &payload,
                     std::vector<uint8_t> &out, std::error_code &ec) {
  ec.clear();
  out.clear();
  size_t len = payload.size();
  if (len > kExtendedPayloadMax) {
    ec = errc::payload_too_large;
    return false;
  }
  out.reserve(len + 5);
  out.push_back(to_byte(cmd));
  if (len > kShortLengthMax) {
    out.push_back((uint8_t)((len >> 8) | kLengthContinuation));
    out.push_back((uint8_t)(len & 0xFF));
  } else {
    out.push_back((uint8_t)len);
  }
  out.insert(out.end(), payload.begin(), payload.end());

  // checksum over the frame as it will appear on the wire
  std::vector<uint8_t> prefix = encode_simple(Command::Extended, {});
  uint16_t crc = crc16(prefix.data(), prefix.size());
  crc = crc16(out.data(), out.size(), crc);
  out.push_back((uint8_t)(crc >> 8));
  out.push_back((uint8_t)(crc & 0xFF));
  return true;
}

bool encode_reply(Command cmd, const std::vector<uint8_t> &payload,
                  std::vector<uint8_t> &out, std::error_code &ec) {
  ec.clear();
  out.clear();
  size_t len = payload.size();
  bool extended = cmd == Command::Extended;
  if (len > (extended ? 0xFFFFu : 0xFFu)) {
    ec = errc::payload_too_large;
    return false;
  }
  out.reserve(kReplyMarker.size() + 3 + len);
  out.insert(out.end(), kReplyMarker.begin(), kReplyMarker.end());
  out.push_back(to_byte(cmd));
  if (extended) {
    out.push_back((uint8_t)(len >> 8));
    out.push_back((uint8_t)(len & 0xFF));
  } else {
    out.push_back((uint8_t)len);
  }
  out.insert(out.end(), payload.begin(), payload.end());
  return true;
}

std::optional<Frame> decode_frame(ByteStream &stream,
                                  std::chrono::milliseconds timeout,
                                  std::error_code &ec) {
  ec.clear();
  const auto deadline = Clock::now() + timeout;

  size_t matched = 0;
  size_t skipped = 0;
  while (matched < kReplyMarker.size()) {
    if (Clock::now() >= deadline) {
      ec = errc::sync_timeout;
      return std::nullopt;
    }
    uint8_t b = 0;
    std::error_code rec;
    stream.read_exact(&b, 1, deadline, rec);
    if (rec) {
      ec = is_timeout(rec) ? make_error_code(errc::sync_timeout) : rec;
      return std::nullopt;
    }
    if (b == kReplyMarker[matched]) {
      matched++;
    } else {
      skipped += matched + 1;
      matched = 0;
      if (b == kReplyMarker[0]) {
        matched = 1;
        skipped--;
      }
    }
  }
  if (skipped > 0)
    Logger::instance().log(LogLevel::DEBUG, "resync: skipped %zu bytes",
                           skipped);

  uint8_t hdr[2];
  if (!read_body(stream, hdr, sizeof(hdr), timeout, ec))
    return std::nullopt;
  uint8_t raw_cmd = hdr[0];
  uint16_t length = hdr[1];
  if (raw_cmd == to_byte(Command::Extended)) {
    uint8_t lo = 0;
    if (!read_body(stream, &lo, 1, timeout, ec))
      return std::nullopt;
    length = (uint16_t)((length << 8) | lo);
  }

  Frame f;
  f.payload.resize(length);
  if (!read_body(stream, f.payload.data(), length, timeout, ec))
    return std::nullopt;

  auto cmd = command_from_byte(raw_cmd);
  if (!cmd) {
    Logger::instance().log(LogLevel::WARN, "unknown command 0x%02x in reply",
                           raw_cmd);
    ec = errc::unknown_command;
    return std::nullopt;
  }
  f.command = *cmd;
  return f;
}

} // namespace brainlink
