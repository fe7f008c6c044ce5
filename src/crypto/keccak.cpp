#include "crypto/keccak.hpp"

namespace autopay::crypto {

namespace {

constexpr std::size_t kRate = 136;

constexpr std::uint64_t kRoundConstants[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL,
};

constexpr int kRotations[25] = {
    0,  1,  62, 28, 27,
    36, 44, 6,  55, 20,
    3,  10, 43, 25, 39,
    41, 45, 15, 21, 8,
    18, 2,  61, 56, 14,
};

inline std::uint64_t Rotl(std::uint64_t x, int n) {
  return n == 0 ? x : (x << n) | (x >> (64 - n));
}

void KeccakF1600(std::array<std::uint64_t, 25>& a) {
  for (int round = 0; round < 24; ++round) {
    // Theta.
    std::uint64_t c[5];
    for (int x = 0; x < 5; ++x) {
      c[x] = a[x] ^ a[x + 5] ^ a[x + 10] ^ a[x + 15] ^ a[x + 20];
    }
    for (int x = 0; x < 5; ++x) {
      const std::uint64_t d = c[(x + 4) % 5] ^ Rotl(c[(x + 1) % 5], 1);
      for (int y = 0; y < 25; y += 5) {
        a[y + x] ^= d;
      }
    }
    // Rho and pi.
    std::uint64_t b[25];
    for (int x = 0; x < 5; ++x) {
      for (int y = 0; y < 5; ++y) {
        b[y + 5 * ((2 * x + 3 * y) % 5)] = Rotl(a[x + 5 * y], kRotations[x + 5 * y]);
      }
    }
    // Chi.
    for (int y = 0; y < 25; y += 5) {
      for (int x = 0; x < 5; ++x) {
        a[y + x] = b[y + x] ^ (~b[y + (x + 1) % 5] & b[y + (x + 2) % 5]);
      }
    }
    // Iota.
    a[0] ^= kRoundConstants[round];
  }
}

}  // namespace

Keccak256::Keccak256() = default;

void Keccak256::AbsorbBlock() {
  for (std::size_t i = 0; i < kRate / 8; ++i) {
    std::uint64_t lane = 0;
    for (int b = 0; b < 8; ++b) {
      lane |= static_cast<std::uint64_t>(buffer_[i * 8 + b]) << (8 * b);
    }
    state_[i] ^= lane;
  }
  KeccakF1600(state_);
  buffered_ = 0;
}

Keccak256& Keccak256::Update(std::span<const std::uint8_t> data) {
  for (const auto byte : data) {
    buffer_[buffered_++] = byte;
    if (buffered_ == kRate) {
      AbsorbBlock();
    }
  }
  return *this;
}

Keccak256& Keccak256::Update(std::string_view data) {
  return Update(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
}

Hash256 Keccak256::Finalize() {
  for (std::size_t i = buffered_; i < kRate; ++i) {
    buffer_[i] = 0;
  }
  buffer_[buffered_] ^= 0x01;
  buffer_[kRate - 1] ^= 0x80;
  AbsorbBlock();

  Hash256 out{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<std::uint8_t>((state_[i / 8] >> (8 * (i % 8))) & 0xff);
  }
  state_.fill(0);
  return out;
}

Hash256 Keccak256Hash(std::span<const std::uint8_t> data) {
  Keccak256 hasher;
  hasher.Update(data);
  return hasher.Finalize();
}

Hash256 Keccak256Hash(std::string_view data) {
  Keccak256 hasher;
  hasher.Update(data);
  return hasher.Finalize();
}

}  // namespace autopay::crypto
