
#include "errors.hpp"
#include <string>

namespace brainlink {

namespace {

class LinkCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "brainlink"; }
  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
    case errc::sync_timeout:
      return "reply header not found before timeout";
    case errc::truncated_payload:
      return "frame ended before its declared length";
    case errc::unknown_command:
      return "unknown command byte";
    case errc::payload_too_large:
      return "payload too large for length field";
    case errc::io_failure:
      return "stream i/o failure";
    case errc::short_write:
      return "stream accepted fewer bytes than written";
    case errc::invalid_packet_size:
      return "negotiated packet size too small to transfer";
    }
    return "unknown brainlink error";
  }
};

} // namespace

const std::error_category &link_category() {
  static LinkCategory inst;
  return inst;
}

std::error_code make_error_code(errc e) {
  return std::error_code(static_cast<int>(e), link_category());
}

} // namespace brainlink
