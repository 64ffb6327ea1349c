
#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include <optional>
#include <vector>

namespace brainlink {

// Host -> device frames start with this magic.
constexpr std::array<uint8_t, 4> kHostMagic = {0xC9, 0x36, 0xB8, 0x47};
// Device -> host frames start with this sync marker.
constexpr std::array<uint8_t, 2> kReplyMarker = {0xAA, 0x55};

// Extended length fields use one byte up to this value, two bytes above it.
constexpr size_t kShortLengthMax = 0x80;
constexpr size_t kExtendedPayloadMax = 0x7FFF;
constexpr uint8_t kLengthContinuation = 0x80;

constexpr uint16_t kCrc16Poly = 0x1021;
constexpr uint16_t kCrc16Init = 0xFFFF;
constexpr uint32_t kCrc32Poly = 0x04C11DB7;
constexpr uint32_t kCrc32Init = 0x00000000;

enum class Command : uint8_t {
    ExecuteFile = 0x18,
    Extended    = 0x56
};

enum class DeviceType : uint8_t { User = 0, System, Joystick, Unknown };

struct Frame {
    Command command{Command::Extended};
    std::vector<uint8_t> payload;
};

inline uint8_t to_byte(Command c) { return static_cast<uint8_t>(c); }
std::optional<Command> command_from_byte(uint8_t b);

const char* command_name(Command c);
const char* device_type_name(DeviceType t);

// CRC-16/CCITT-FALSE: poly 0x1021, init 0xFFFF, no reflection, no xorout.
uint16_t crc16(const uint8_t* data, size_t len, uint16_t crc = kCrc16Init);
// MSB-first CRC-32: poly 0x04C11DB7, init 0, no reflection, no xorout.
uint32_t crc32(const uint8_t* data, size_t len, uint32_t crc = kCrc32Init);

} // namespace brainlink
