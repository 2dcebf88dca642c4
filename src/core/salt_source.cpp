#include "chatsan/core/salt_source.h"

#include <random>

namespace chatsan::core {

Salt RandomSaltSource::generate() {
  constexpr char kHexDigits[] = "0123456789abcdef";
  constexpr int kSaltWords = 4;  // 4 x 32 bits

  std::random_device device;
  std::string out;
  out.reserve(kSaltWords * 8);
  for (int w = 0; w < kSaltWords; ++w) {
    auto word = static_cast<std::uint32_t>(device());
    for (int nibble = 0; nibble < 8; ++nibble) {
      out.push_back(kHexDigits[word & 0x0fu]);
      word >>= 4u;
    }
  }
  return Salt{out};
}

Salt FixedSaltSource::generate() {
  return salt_;
}

}  // namespace chatsan::core
