#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace codescope::core {

using Sha256Hash = std::array<std::byte, 32>;

// Streaming SHA-256. Finalize() may be called once; further Update() calls throw.
class Sha256 {
 public:
  Sha256();

  void Update(std::span<const std::byte> bytes);
  void Update(std::string_view text);
  [[nodiscard]] Sha256Hash Finalize();

 private:
  void Compress(const std::uint8_t* block);

  std::array<std::uint32_t, 8> h_{};
  std::array<std::uint8_t, 64> block_{};
  std::size_t block_fill_ = 0;
  std::uint64_t total_bytes_ = 0;
  bool done_ = false;
};

[[nodiscard]] Sha256Hash Sha256Of(std::span<const std::byte> bytes);
[[nodiscard]] Sha256Hash Sha256Of(std::string_view text);
[[nodiscard]] std::string ToHex(std::span<const std::byte> bytes);

}  // namespace codescope::core
