
#include "transfer.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>

namespace brainlink {

size_t write_chunked(FileHandle &handle, const std::vector<uint8_t> &buffer,
                     std::error_code &ec, ProgressReporter *progress) {
  ec.clear();
  const TransferMetadata &meta = handle.metadata();
  size_t limit = chunk_limit(meta.max_packet_size);
  // never more than the device expects, never past the end of the buffer
  size_t total = std::min(buffer.size(), (size_t)meta.file_size);
  if (total == 0)
    return 0;
  if (limit == 0) {
    Logger::instance().log(LogLevel::WARN,
                           "max packet size %u leaves no room for data",
                           (unsigned)meta.max_packet_size);
    ec = errc::invalid_packet_size;
    return 0;
  }

  Logger::instance().log(LogLevel::DEBUG,
                         "writing %zu bytes in chunks of %zu at 0x%08x", total,
                         limit, (unsigned)handle.base_address());
  if (progress)
    progress->on_start(total);

  size_t written = 0;
  for (size_t off = 0; off < total; off += limit) {
    size_t n = std::min(limit, total - off);
    uint32_t addr = handle.base_address() + (uint32_t)off;
    size_t w = handle.write_some(addr, buffer.data() + off, n, ec);
    if (!ec && w != n)
      ec = errc::short_write;
    if (ec) {
      Logger::instance().log(LogLevel::WARN, "write at 0x%08x failed: %s",
                             (unsigned)addr, ec.message().c_str());
      return 0;
    }
    written += n;
    if (progress)
      progress->on_advance(n);
  }

  if (progress)
    progress->on_finish();
  return written;
}

} // namespace brainlink
