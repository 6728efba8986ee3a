#include "internal/util/hash.hpp"

namespace stpa::util {

std::string HexDigest(std::uint64_t value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[value & 0x0F];
    value >>= 4;
  }
  return out;
}

} // namespace stpa::util
