#pragma once

#include "codescope/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <vector>

namespace codescope {

// On-disk layout, little-endian:
//   header   "CSVX" u16 version u16 reserved u32 dimension u64 count u64 payload_length u32 reserved
//   payload  count * dimension f32
//   ids      count * u64
//   trailer  "CSVXEND1" sha256(header..ids)
// A snapshot without an intact trailer is never accepted.
struct VectorSnapshotInfo {
  std::uint32_t dimension = 0;
  std::uint64_t vector_count = 0;
};

struct VectorSnapshot {
  VectorSnapshotInfo info{};
  std::vector<float> vectors{};
  std::vector<SymbolId> ids{};
};

inline constexpr std::size_t kVectorSnapshotHeaderSize = 32;
inline constexpr std::size_t kVectorSnapshotTrailerSize = 40;

[[nodiscard]] std::vector<std::byte> EncodeVectorSnapshot(const VectorSnapshotInfo& info,
                                                          std::span<const float> vectors,
                                                          std::span<const SymbolId> ids);

// Throws CorruptionError on a truncated, garbled or unterminated snapshot.
[[nodiscard]] VectorSnapshot DecodeVectorSnapshot(std::span<const std::byte> bytes);

// Writes through a sibling ".tmp" file and renames it into place.
void WriteSnapshotFile(const std::filesystem::path& path, std::span<const std::byte> bytes);

// std::nullopt when the file does not exist.
[[nodiscard]] std::optional<std::vector<std::byte>> ReadSnapshotFile(const std::filesystem::path& path);

}  // namespace codescope
