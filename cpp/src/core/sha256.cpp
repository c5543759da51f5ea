#include "sha256.hpp"

#include <stdexcept>

namespace codescope::core {
namespace {

constexpr std::array<std::uint32_t, 64> kK = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
};

constexpr std::array<std::uint32_t, 8> kInitialState = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19,
};

constexpr std::uint32_t Rotr(std::uint32_t x, unsigned n) {
  return (x >> n) | (x << (32U - n));
}

std::uint32_t LoadBE32(const std::uint8_t* p) {
  return (static_cast<std::uint32_t>(p[0]) << 24U) | (static_cast<std::uint32_t>(p[1]) << 16U) |
         (static_cast<std::uint32_t>(p[2]) << 8U) | static_cast<std::uint32_t>(p[3]);
}

}  // namespace

Sha256::Sha256() : h_(kInitialState) {}

void Sha256::Update(std::span<const std::byte> bytes) {
  if (done_) {
    throw std::logic_error("Sha256::Update after Finalize");
  }
  total_bytes_ += bytes.size();
  for (const auto b : bytes) {
    block_[block_fill_++] = std::to_integer<std::uint8_t>(b);
    if (block_fill_ == block_.size()) {
      Compress(block_.data());
      block_fill_ = 0;
    }
  }
}

void Sha256::Update(std::string_view text) {
  Update(std::as_bytes(std::span<const char>(text.data(), text.size())));
}

Sha256Hash Sha256::Finalize() {
  if (!done_) {
    const std::uint64_t bit_count = total_bytes_ * 8U;
    block_[block_fill_++] = 0x80;
    if (block_fill_ > 56) {
      while (block_fill_ < 64) {
        block_[block_fill_++] = 0;
      }
      Compress(block_.data());
      block_fill_ = 0;
    }
    while (block_fill_ < 56) {
      block_[block_fill_++] = 0;
    }
    for (int shift = 56; shift >= 0; shift -= 8) {
      block_[block_fill_++] = static_cast<std::uint8_t>((bit_count >> static_cast<unsigned>(shift)) & 0xFFU);
    }
    Compress(block_.data());
    block_fill_ = 0;
    done_ = true;
  }

  Sha256Hash out{};
  for (std::size_t i = 0; i < h_.size(); ++i) {
    for (std::size_t j = 0; j < 4; ++j) {
      out[i * 4 + j] = static_cast<std::byte>((h_[i] >> (24U - 8U * j)) & 0xFFU);
    }
  }
  return out;
}

void Sha256::Compress(const std::uint8_t* block) {
  std::array<std::uint32_t, 64> w{};
  for (std::size_t t = 0; t < 16; ++t) {
    w[t] = LoadBE32(block + t * 4);
  }
  for (std::size_t t = 16; t < 64; ++t) {
    const auto sigma0 = Rotr(w[t - 15], 7) ^ Rotr(w[t - 15], 18) ^ (w[t - 15] >> 3U);
    const auto sigma1 = Rotr(w[t - 2], 17) ^ Rotr(w[t - 2], 19) ^ (w[t - 2] >> 10U);
    w[t] = w[t - 16] + sigma0 + w[t - 7] + sigma1;
  }

  auto v = h_;
  for (std::size_t t = 0; t < 64; ++t) {
    const auto big_sigma1 = Rotr(v[4], 6) ^ Rotr(v[4], 11) ^ Rotr(v[4], 25);
    const auto choose = (v[4] & v[5]) ^ (~v[4] & v[6]);
    const auto t1 = v[7] + big_sigma1 + choose + kK[t] + w[t];
    const auto big_sigma0 = Rotr(v[0], 2) ^ Rotr(v[0], 13) ^ Rotr(v[0], 22);
    const auto majority = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
    const auto t2 = big_sigma0 + majority;
    for (std::size_t k = 7; k > 0; --k) {
      v[k] = v[k - 1];
    }
    v[4] += t1;
    v[0] = t1 + t2;
  }
  for (std::size_t i = 0; i < h_.size(); ++i) {
    h_[i] += v[i];
  }
}

Sha256Hash Sha256Of(std::span<const std::byte> bytes) {
  Sha256 hasher;
  hasher.Update(bytes);
  return hasher.Finalize();
}

Sha256Hash Sha256Of(std::string_view text) {
  Sha256 hasher;
  hasher.Update(text);
  return hasher.Finalize();
}

std::string ToHex(std::span<const std::byte> bytes) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (const auto b : bytes) {
    const auto value = std::to_integer<unsigned>(b);
    out.push_back(kDigits[(value >> 4U) & 0x0FU]);
    out.push_back(kDigits[value & 0x0FU]);
  }
  return out;
}

}  // namespace codescope::core
