
#pragma once
#include <cstdint>
#include <cstddef>
#include <system_error>
#include <vector>

namespace brainlink {

// Negotiated when the remote file is opened. Read-only afterwards.
struct TransferMetadata {
    uint16_t max_packet_size{0};
    uint32_t file_size{0};
    uint32_t crc{0};
};

enum class FinishAction : uint8_t {
    DoNothing     = 0,
    RunProgram    = 1,
    ShowRunScreen = 3
};

// An open file on the device. Implementations issue the actual extended
// commands through a Dispatcher.
class FileHandle {
public:
    virtual ~FileHandle() = default;
    virtual const TransferMetadata& metadata() const = 0;
    virtual uint32_t base_address() const = 0;
    virtual size_t write_some(uint32_t address, const uint8_t* data, size_t len,
                              std::error_code& ec) = 0;
    virtual void close(FinishAction action, std::error_code& ec) = 0;
};

class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;
    virtual void on_start(size_t total) = 0;
    virtual void on_advance(size_t delta) = 0;
    virtual void on_finish() = 0;
};

// Largest chunk sent in one write: three quarters of the packet limit, the
// rest is left for framing.
inline size_t chunk_limit(uint16_t max_packet_size) {
    return (size_t)max_packet_size * 3 / 4;
}

// Writes min(buffer.size(), declared file size) bytes in chunk_limit sized
// pieces at base_address + offset. Stops at the first failed write.
size_t write_chunked(FileHandle& handle, const std::vector<uint8_t>& buffer,
                     std::error_code& ec, ProgressReporter* progress = nullptr);

} // namespace brainlink
