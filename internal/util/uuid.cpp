#include "uuid.hpp"

#include <random>

namespace stpa::util {

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<std::uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

// 8-4-4-4-12 lowercase hex groups.
std::string ToString(const UUID& id) {
  static constexpr char kDigits[] = "0123456789abcdef";

  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10)
      out += '-';
    out += kDigits[id[i] >> 4];
    out += kDigits[id[i] & 0x0F];
  }
  return out;
}

} // namespace stpa::util
