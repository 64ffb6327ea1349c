
#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>
#include "dispatcher.hpp"
#include "transfer.hpp"

namespace brainlink {

constexpr uint32_t kUserProgramAddress = 0x03800000;

enum class FileMode : uint8_t { Upload = 1, Download = 2 };
enum class FileTarget : uint8_t { Ddr = 0, Flash = 1, Screen = 2 };
enum class FileVid : uint8_t { User = 1, System = 15, Rms = 16, Pros = 24, Mw = 32 };

struct InitialFileMetadata {
    FileMode mode{FileMode::Upload};
    FileTarget target{FileTarget::Flash};
    bool overwrite{true};
    FileVid vid{FileVid::User};
    uint8_t options{0};
    uint32_t length{0};
    uint32_t addr{kUserProgramAddress};
    uint32_t crc{0};
    std::array<uint8_t, 4> type{{'b', 'i', 'n', 0}};
    uint32_t timestamp{0};
    uint32_t version{0x01000000};
    std::optional<std::string> linked_name;
};

// Opens files on the device. The negotiation behind open() and close() lives
// with the implementation.
class FileService {
public:
    virtual ~FileService() = default;
    virtual std::unique_ptr<FileHandle> open(const std::string& name,
                                             const InitialFileMetadata& meta,
                                             std::error_code& ec) = 0;
};

// Uploads data as a user program file and closes it with ShowRunScreen. The
// receive timeout is raised to Dispatcher::kCloseTimeout while closing.
bool upload_file(Dispatcher& dispatcher, FileService& service, const std::string& name,
                 const std::vector<uint8_t>& data, std::error_code& ec,
                 ProgressReporter* progress = nullptr);

} // namespace brainlink
