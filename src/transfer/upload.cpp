
#include "upload.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "protocol.hpp"
#include <chrono>
#include <limits>

namespace brainlink {

namespace {

double seconds_since(std::chrono::steady_clock::time_point t) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - t)
      .count();
}

} // namespace

bool upload_file(Dispatcher &dispatcher, FileService &service,
                 const std::string &name, const std::vector<uint8_t> &data,
                 std::error_code &ec, ProgressReporter *progress) {
  ec.clear();
  auto &log = Logger::instance();
  if (data.size() > std::numeric_limits<uint32_t>::max()) {
    ec = errc::payload_too_large;
    return false;
  }
  auto start = std::chrono::steady_clock::now();
  log.log(LogLevel::INFO, "uploading %s (%zu bytes)", name.c_str(),
          data.size());

  InitialFileMetadata meta;
  meta.length = (uint32_t)data.size();
  meta.crc = crc32(data.data(), data.size());

  auto handle = service.open(name, meta, ec);
  if (!handle || ec) {
    if (!ec)
      ec = errc::io_failure;
    log.log(LogLevel::WARN, "open %s failed: %s", name.c_str(),
            ec.message().c_str());
    return false;
  }

  size_t written = write_chunked(*handle, data, ec, progress);
  if (ec)
    return false;
  log.log(LogLevel::DEBUG, "wrote %zu of %zu bytes", written, data.size());

  // the device may flush to storage before it acknowledges the close
  {
    ScopedTimeout slow(dispatcher, Dispatcher::kCloseTimeout);
    auto close_start = std::chrono::steady_clock::now();
    handle->close(FinishAction::ShowRunScreen, ec);
    if (ec) {
      log.log(LogLevel::WARN, "close %s failed: %s", name.c_str(),
              ec.message().c_str());
      return false;
    }
    log.log(LogLevel::INFO, "closed file handle in %.3f seconds",
            seconds_since(close_start));
  }

  log.log(LogLevel::INFO, "uploaded %s in %.3f seconds", name.c_str(),
          seconds_since(start));
  return true;
}

} // namespace brainlink
