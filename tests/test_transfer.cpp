/**
 * @file test_transfer.cpp
 * @brief Chunked write and upload tests
 */

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <array>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "dispatcher.hpp"
#include "errors.hpp"
#include "memory_stream.hpp"
#include "protocol.hpp"
#include "transfer.hpp"
#include "upload.hpp"

using namespace brainlink;
using brainlink::testing::MemoryStream;
using namespace std::chrono_literals;

namespace
{

struct WriteCall
{
  uint32_t address;
  std::vector<uint8_t> data;
};

/**
 * @brief File handle that records every addressed write
 */
class RecordingHandle : public FileHandle
{
 public:
  RecordingHandle(uint16_t max_packet_size, uint32_t file_size, uint32_t base)
      : base_(base)
  {
    meta_.max_packet_size = max_packet_size;
    meta_.file_size = file_size;
  }

  const TransferMetadata& metadata() const override
  {
    return meta_;
  }

  uint32_t base_address() const override
  {
    return base_;
  }

  size_t write_some(uint32_t address, const uint8_t* data, size_t len,
                    std::error_code& ec) override
  {
    ec.clear();
    if (fail_on_call >= 0 && static_cast<int>(writes.size()) == fail_on_call)
    {
      ec = std::make_error_code(std::errc::io_error);
      return 0;
    }
    writes.push_back(WriteCall{address, std::vector<uint8_t>(data, data + len)});
    return short_by > 0 && len > short_by ? len - short_by : len;
  }

  void close(FinishAction action, std::error_code& ec) override
  {
    ec = close_error;
    closed = true;
    close_action = action;
    if (dispatcher)
    {
      timeout_at_close = dispatcher->timeout();
    }
  }

  TransferMetadata meta_;
  uint32_t base_;
  std::vector<WriteCall> writes;
  int fail_on_call = -1;
  size_t short_by = 0;

  std::error_code close_error;
  bool closed = false;
  FinishAction close_action = FinishAction::DoNothing;
  Dispatcher* dispatcher = nullptr;
  std::chrono::milliseconds timeout_at_close{0};
};

class RecordingProgress : public ProgressReporter
{
 public:
  void on_start(size_t total) override
  {
    started = true;
    this->total = total;
  }

  void on_advance(size_t delta) override
  {
    advances.push_back(delta);
  }

  void on_finish() override
  {
    finished = true;
  }

  bool started = false;
  bool finished = false;
  size_t total = 0;
  std::vector<size_t> advances;
};

/**
 * @brief Handle given out by FakeService, so the recorded state outlives it
 */
class ForwardingHandle : public FileHandle
{
 public:
  explicit ForwardingHandle(RecordingHandle& target) : target_(target) {}

  const TransferMetadata& metadata() const override
  {
    return target_.metadata();
  }

  uint32_t base_address() const override
  {
    return target_.base_address();
  }

  size_t write_some(uint32_t address, const uint8_t* data, size_t len,
                    std::error_code& ec) override
  {
    return target_.write_some(address, data, len, ec);
  }

  void close(FinishAction action, std::error_code& ec) override
  {
    target_.close(action, ec);
  }

 private:
  RecordingHandle& target_;
};

class FakeService : public FileService
{
 public:
  std::unique_ptr<FileHandle> open(const std::string& name, const InitialFileMetadata& meta,
                                   std::error_code& ec) override
  {
    ec = open_error;
    opened_name = name;
    opened_meta = meta;
    if (ec)
    {
      return nullptr;
    }
    handle = std::make_unique<RecordingHandle>(max_packet_size, meta.length, meta.addr);
    handle->dispatcher = dispatcher;
    handle->close_error = close_error;
    last = handle.get();
    return std::make_unique<ForwardingHandle>(*handle);
  }

  uint16_t max_packet_size = 400;
  std::error_code open_error;
  std::error_code close_error;
  Dispatcher* dispatcher = nullptr;

  std::string opened_name;
  InitialFileMetadata opened_meta;
  std::unique_ptr<RecordingHandle> handle;
  RecordingHandle* last = nullptr;
};

std::vector<uint8_t> make_buffer(size_t len)
{
  std::vector<uint8_t> data(len);
  for (size_t i = 0; i < len; ++i)
  {
    data[i] = static_cast<uint8_t>(i * 7 + 3);
  }
  return data;
}

}  // namespace

/* ========================================================================= */
/* Chunk sizing                                                              */
/* ========================================================================= */

TEST_CASE("Chunk limit is three quarters of the packet size")
{
  CHECK(chunk_limit(400) == 300);
  CHECK(chunk_limit(4096) == 3072);
  CHECK(chunk_limit(0xFFFF) == 49151);
  CHECK(chunk_limit(1) == 0);
}

/* ========================================================================= */
/* write_chunked                                                             */
/* ========================================================================= */

TEST_CASE("write_chunked splits the buffer")
{
  const uint32_t base = 0x03800000;
  const auto data = make_buffer(1000);
  RecordingHandle handle(400, 1000, base);
  RecordingProgress progress;
  std::error_code ec;

  const size_t written = write_chunked(handle, data, ec, &progress);

  CHECK_FALSE(ec);
  CHECK(written == 1000);
  REQUIRE(handle.writes.size() == 4);
  CHECK(handle.writes[0].address == base);
  CHECK(handle.writes[1].address == base + 300);
  CHECK(handle.writes[2].address == base + 600);
  CHECK(handle.writes[3].address == base + 900);
  CHECK(handle.writes[0].data.size() == 300);
  CHECK(handle.writes[1].data.size() == 300);
  CHECK(handle.writes[2].data.size() == 300);
  CHECK(handle.writes[3].data.size() == 100);

  std::vector<uint8_t> joined;
  for (const auto& w : handle.writes)
  {
    joined.insert(joined.end(), w.data.begin(), w.data.end());
  }
  CHECK(joined == data);

  CHECK(progress.started);
  CHECK(progress.total == 1000);
  CHECK(progress.advances == std::vector<size_t>{300, 300, 300, 100});
  CHECK(progress.finished);
}

TEST_CASE("write_chunked with an exact multiple of the chunk size")
{
  const auto data = make_buffer(600);
  RecordingHandle handle(400, 600, 0);
  std::error_code ec;

  CHECK(write_chunked(handle, data, ec) == 600);
  REQUIRE(handle.writes.size() == 2);
  CHECK(handle.writes[1].data.size() == 300);
}

TEST_CASE("write_chunked with a buffer smaller than one chunk")
{
  const auto data = make_buffer(10);
  RecordingHandle handle(400, 10, 0x100);
  std::error_code ec;

  CHECK(write_chunked(handle, data, ec) == 10);
  REQUIRE(handle.writes.size() == 1);
  CHECK(handle.writes[0].address == 0x100);
  CHECK(handle.writes[0].data == data);
}

TEST_CASE("write_chunked never exceeds the declared size")
{
  const auto data = make_buffer(1000);
  RecordingHandle handle(400, 450, 0);
  std::error_code ec;

  CHECK(write_chunked(handle, data, ec) == 450);
  REQUIRE(handle.writes.size() == 2);
  CHECK(handle.writes[0].data.size() == 300);
  CHECK(handle.writes[1].data.size() == 150);
  CHECK(handle.writes[1].data.back() == data[449]);
}

TEST_CASE("write_chunked never reads past the buffer")
{
  const auto data = make_buffer(500);
  RecordingHandle handle(400, 5000, 0);
  std::error_code ec;

  CHECK(write_chunked(handle, data, ec) == 500);
  REQUIRE(handle.writes.size() == 2);
  CHECK(handle.writes[1].data.size() == 200);
}

TEST_CASE("write_chunked with nothing to send")
{
  RecordingProgress progress;
  std::error_code ec;

  SUBCASE("Empty buffer")
  {
    RecordingHandle handle(400, 1000, 0);
    CHECK(write_chunked(handle, {}, ec, &progress) == 0);
    CHECK_FALSE(ec);
    CHECK(handle.writes.empty());
  }

  SUBCASE("Zero declared size")
  {
    RecordingHandle handle(400, 0, 0);
    CHECK(write_chunked(handle, make_buffer(100), ec, &progress) == 0);
    CHECK_FALSE(ec);
    CHECK(handle.writes.empty());
  }

  CHECK_FALSE(progress.started);
}

TEST_CASE("write_chunked failures")
{
  const auto data = make_buffer(1000);
  RecordingProgress progress;
  std::error_code ec;

  SUBCASE("Write error aborts the remaining chunks")
  {
    RecordingHandle handle(400, 1000, 0);
    handle.fail_on_call = 2;

    CHECK(write_chunked(handle, data, ec, &progress) == 0);
    CHECK(ec == std::errc::io_error);
    CHECK(handle.writes.size() == 2);
    CHECK(progress.advances == std::vector<size_t>{300, 300});
    CHECK_FALSE(progress.finished);
  }

  SUBCASE("Short write")
  {
    RecordingHandle handle(400, 1000, 0);
    handle.short_by = 1;

    CHECK(write_chunked(handle, data, ec, &progress) == 0);
    CHECK(ec == errc::short_write);
    CHECK(handle.writes.size() == 1);
  }

  SUBCASE("Packet size too small to carry data")
  {
    RecordingHandle handle(1, 1000, 0);

    CHECK(write_chunked(handle, data, ec, &progress) == 0);
    CHECK(ec == errc::invalid_packet_size);
    CHECK(handle.writes.empty());
  }
}

/* ========================================================================= */
/* upload_file                                                               */
/* ========================================================================= */

TEST_CASE("upload_file")
{
  MemoryStream stream;
  Dispatcher dispatcher(stream);
  FakeService service;
  service.dispatcher = &dispatcher;
  RecordingProgress progress;
  std::error_code ec;

  const auto data = make_buffer(1000);

  SUBCASE("Successful upload")
  {
    dispatcher.set_timeout(250ms);
    REQUIRE(upload_file(dispatcher, service, "slot_1.bin", data, ec, &progress));
    CHECK_FALSE(ec);

    CHECK(service.opened_name == "slot_1.bin");
    CHECK(service.opened_meta.length == 1000);
    CHECK(service.opened_meta.crc == crc32(data.data(), data.size()));
    CHECK(service.opened_meta.addr == kUserProgramAddress);
    CHECK(service.opened_meta.mode == FileMode::Upload);
    CHECK(service.opened_meta.target == FileTarget::Flash);
    CHECK(service.opened_meta.vid == FileVid::User);
    const std::array<uint8_t, 4> bin_type = {{'b', 'i', 'n', 0}};
    CHECK(service.opened_meta.type == bin_type);

    REQUIRE(service.last != nullptr);
    CHECK(service.last->writes.size() == 4);
    CHECK(service.last->closed);
    CHECK(service.last->close_action == FinishAction::ShowRunScreen);
    CHECK(service.last->timeout_at_close == Dispatcher::kCloseTimeout);
    CHECK(dispatcher.timeout() == 250ms);
    CHECK(progress.finished);
  }

  SUBCASE("Timeout is restored when close fails")
  {
    service.close_error = std::make_error_code(std::errc::timed_out);
    CHECK_FALSE(upload_file(dispatcher, service, "slot_1.bin", data, ec));
    CHECK(ec == std::errc::timed_out);
    CHECK(service.last->timeout_at_close == Dispatcher::kCloseTimeout);
    CHECK(dispatcher.timeout() == Dispatcher::kDefaultTimeout);
  }

  SUBCASE("Open failure")
  {
    service.open_error = std::make_error_code(std::errc::permission_denied);
    CHECK_FALSE(upload_file(dispatcher, service, "slot_1.bin", data, ec));
    CHECK(ec == std::errc::permission_denied);
    CHECK(service.last == nullptr);
  }

  SUBCASE("Write failure skips close")
  {
    service.max_packet_size = 1;
    CHECK_FALSE(upload_file(dispatcher, service, "slot_1.bin", data, ec));
    CHECK(ec == errc::invalid_packet_size);
    REQUIRE(service.last != nullptr);
    CHECK_FALSE(service.last->closed);
  }
}
