#include "chatsan/core/sha256.h"

#include <algorithm>

namespace chatsan::core {

namespace {

// FIPS 180-4 §5.3.3 initial hash value.
constexpr std::array<std::uint32_t, 8> kInitialState = {
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u,
};

// FIPS 180-4 §4.2.2 round constants.
constexpr std::array<std::uint32_t, 64> kRoundConstants = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u,
    0xab1c5ed5u, 0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu,
    0x9bdc06a7u, 0xc19bf174u, 0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu,
    0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau, 0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u,
    0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u, 0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu,
    0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u, 0xa2bfe8a1u, 0xa81a664bu,
    0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u, 0x19a4c116u,
    0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u,
    0xc67178f2u,
};

constexpr std::uint32_t rotr(std::uint32_t x, unsigned n) noexcept {
  return (x >> n) | (x << (32u - n));
}

constexpr std::uint32_t big_sigma0(std::uint32_t x) noexcept {
  return rotr(x, 2u) ^ rotr(x, 13u) ^ rotr(x, 22u);
}

constexpr std::uint32_t big_sigma1(std::uint32_t x) noexcept {
  return rotr(x, 6u) ^ rotr(x, 11u) ^ rotr(x, 25u);
}

constexpr std::uint32_t small_sigma0(std::uint32_t x) noexcept {
  return rotr(x, 7u) ^ rotr(x, 18u) ^ (x >> 3u);
}

constexpr std::uint32_t small_sigma1(std::uint32_t x) noexcept {
  return rotr(x, 17u) ^ rotr(x, 19u) ^ (x >> 10u);
}

constexpr std::uint32_t load_be32(const std::uint8_t* p) noexcept {
  return (static_cast<std::uint32_t>(p[0]) << 24u) | (static_cast<std::uint32_t>(p[1]) << 16u) |
         (static_cast<std::uint32_t>(p[2]) << 8u) | static_cast<std::uint32_t>(p[3]);
}

}  // namespace

Sha256::Sha256() : state_(kInitialState) {}

void Sha256::update(const std::string_view data) {
  total_bytes_ += data.size();
  for (const char ch : data) {
    buffer_[buffered_++] = static_cast<std::uint8_t>(ch);
    if (buffered_ == buffer_.size()) {
      process_block(buffer_.data());
      buffered_ = 0;
    }
  }
}

Sha256Digest Sha256::finish() {
  const std::uint64_t bit_len = total_bytes_ * 8u;

  // Padding: a single 1 bit, zeroes, then the 64-bit big-endian message length.
  buffer_[buffered_++] = 0x80u;
  if (buffered_ > 56u) {
    std::fill(buffer_.begin() + static_cast<std::ptrdiff_t>(buffered_), buffer_.end(), 0u);
    process_block(buffer_.data());
    buffered_ = 0;
  }
  std::fill(buffer_.begin() + static_cast<std::ptrdiff_t>(buffered_), buffer_.begin() + 56, 0u);
  for (unsigned i = 0; i < 8u; ++i) {
    buffer_[56u + i] = static_cast<std::uint8_t>(bit_len >> ((7u - i) * 8u));
  }
  process_block(buffer_.data());
  buffered_ = 0;

  Sha256Digest digest{};
  for (std::size_t i = 0; i < state_.size(); ++i) {
    digest[i * 4u + 0u] = static_cast<std::uint8_t>(state_[i] >> 24u);
    digest[i * 4u + 1u] = static_cast<std::uint8_t>(state_[i] >> 16u);
    digest[i * 4u + 2u] = static_cast<std::uint8_t>(state_[i] >> 8u);
    digest[i * 4u + 3u] = static_cast<std::uint8_t>(state_[i]);
  }
  return digest;
}

void Sha256::process_block(const std::uint8_t* block) {
  std::array<std::uint32_t, 64> schedule{};
  for (unsigned t = 0; t < 16u; ++t) {
    schedule[t] = load_be32(block + t * 4u);
  }
  for (unsigned t = 16u; t < 64u; ++t) {
    schedule[t] = small_sigma1(schedule[t - 2u]) + schedule[t - 7u] +
                  small_sigma0(schedule[t - 15u]) + schedule[t - 16u];
  }

  auto work = state_;
  for (unsigned t = 0; t < 64u; ++t) {
    const std::uint32_t e = work[4];
    const std::uint32_t a = work[0];
    const std::uint32_t choose = (e & work[5]) ^ (~e & work[6]);
    const std::uint32_t majority = (a & work[1]) ^ (a & work[2]) ^ (work[1] & work[2]);
    const std::uint32_t t1 = work[7] + big_sigma1(e) + choose + kRoundConstants[t] + schedule[t];
    const std::uint32_t t2 = big_sigma0(a) + majority;

    // Rotate the working variables h..a one position down.
    std::move_backward(work.begin(), work.end() - 1, work.end());
    work[4] += t1;
    work[0] = t1 + t2;
  }

  for (std::size_t i = 0; i < state_.size(); ++i) {
    state_[i] += work[i];
  }
}

std::string to_hex(const Sha256Digest& digest) {
  constexpr char kHexDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(digest.size() * 2u);
  for (const std::uint8_t byte : digest) {
    out.push_back(kHexDigits[byte >> 4u]);
    out.push_back(kHexDigits[byte & 0x0fu]);
  }
  return out;
}

std::string sha256_hex(const std::string_view input) {
  Sha256 hasher;
  hasher.update(input);
  return to_hex(hasher.finish());
}

}  // namespace chatsan::core
