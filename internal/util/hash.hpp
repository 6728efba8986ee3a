#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace stpa::util {

/*
  Incremental 64-bit FNV-1a. Not cryptographic; used for content-derived
  cache keys only.
*/
class Fnv1a {
 public:
  static constexpr std::uint64_t kOffsetBasis = 14695981039346656037ULL;
  static constexpr std::uint64_t kPrime       = 1099511628211ULL;

  void Update(std::string_view bytes) {
    for (const char c : bytes) {
      state_ ^= static_cast<std::uint8_t>(c);
      state_ *= kPrime;
    }
  }

  // Length-prefixed so that ("ab","c") and ("a","bc") differ.
  void UpdateField(std::string_view field) {
    UpdateInt(field.size());
    Update(field);
  }

  // Little-endian, independent of host byte order.
  void UpdateInt(std::uint64_t value) {
    for (int i = 0; i < 8; ++i) {
      state_ ^= static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF);
      state_ *= kPrime;
    }
  }

  std::uint64_t Digest() const {
    return state_;
  }

 private:
  std::uint64_t state_ = kOffsetBasis;
};

// 16 lowercase hex characters, most significant nibble first.
std::string HexDigest(std::uint64_t value);

} // namespace stpa::util
