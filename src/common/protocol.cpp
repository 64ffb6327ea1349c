
#include "protocol.hpp"
#include <array>

namespace brainlink {

std::optional<Command> command_from_byte(uint8_t b) {
  switch (b) {
  case static_cast<uint8_t>(Command::ExecuteFile):
    return Command::ExecuteFile;
  case static_cast<uint8_t>(Command::Extended):
    return Command::Extended;
  default:
    return std::nullopt;
  }
}

const char *command_name(Command c) {
  switch (c) {
  case Command::ExecuteFile:
    return "ExecuteFile";
  case Command::Extended:
    return "Extended";
  }
  return "?";
}

const char *device_type_name(DeviceType t) {
  switch (t) {
  case DeviceType::User:
    return "user";
  case DeviceType::System:
    return "system";
  case DeviceType::Joystick:
    return "joystick";
  default:
    return "unknown";
  }
}

uint16_t crc16(const uint8_t *data, size_t len, uint16_t crc) {
  static const std::array<uint16_t, 256> table = [] {
    std::array<uint16_t, 256> t{};
    for (uint32_t i = 0; i < 256; i++) {
      uint16_t c = (uint16_t)(i << 8);
      for (int j = 0; j < 8; j++)
        c = (c & 0x8000) ? (uint16_t)((c << 1) ^ kCrc16Poly) : (uint16_t)(c << 1);
      t[i] = c;
    }
    return t;
  }();
  for (size_t i = 0; i < len; i++)
    crc = (uint16_t)((crc << 8) ^ table[((crc >> 8) ^ data[i]) & 0xFF]);
  return crc;
}

uint32_t crc32(const uint8_t *data, size_t len, uint32_t crc) {
  static const std::array<uint32_t, 256> table = [] {
    std::array<uint32_t, 256> t{};
    for (uint32_t i = 0; i < 256; i++) {
      uint32_t c = i << 24;
      for (int j = 0; j < 8; j++)
        c = (c & 0x80000000u) ? ((c << 1) ^ kCrc32Poly) : (c << 1);
      t[i] = c;
    }
    return t;
  }();
  for (size_t i = 0; i < len; i++)
    crc = (crc << 8) ^ table[((crc >> 24) ^ data[i]) & 0xFF];
  return crc;
}

} // namespace brainlink
