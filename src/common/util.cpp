
#include "util.hpp"

namespace brainlink {

std::string bytes_to_hex(const uint8_t *data, size_t len, size_t max_bytes) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  size_t n = len < max_bytes ? len : max_bytes;
  out.reserve(n * 3 + 3);
  for (size_t i = 0; i < n; i++) {
    if (i)
      out.push_back(' ');
    out.push_back(digits[data[i] >> 4]);
    out.push_back(digits[data[i] & 0x0F]);
  }
  if (n < len)
    out += " ...";
  return out;
}

} // namespace brainlink
