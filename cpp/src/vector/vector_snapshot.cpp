#include "codescope/vector_snapshot.hpp"
#include "codescope/errors.hpp"

#include "../core/sha256.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <fstream>
#include <limits>
#include <string>
#include <system_error>

namespace codescope {
namespace {

constexpr std::array<std::byte, 4> kMagic = {
    std::byte{0x43},  // 'C'
    std::byte{0x53},  // 'S'
    std::byte{0x56},  // 'V'
    std::byte{0x58},  // 'X'
};
constexpr std::array<std::byte, 8> kTrailerMagic = {
    std::byte{0x43}, std::byte{0x53}, std::byte{0x56}, std::byte{0x58},  // 'CSVX'
    std::byte{0x45}, std::byte{0x4E}, std::byte{0x44}, std::byte{0x31},  // 'END1'
};
constexpr std::uint16_t kVersion = 1;

CorruptionError SnapshotError(const std::string& message) {
  return CorruptionError("vector_snapshot: " + message);
}

std::uint16_t ReadU16LE(std::span<const std::byte> bytes, std::size_t offset) {
  if (offset + sizeof(std::uint16_t) > bytes.size()) {
    throw SnapshotError("u16 read out of bounds");
  }
  std::uint16_t out = 0;
  for (std::size_t i = 0; i < sizeof(out); ++i) {
    out |= static_cast<std::uint16_t>(std::to_integer<std::uint8_t>(bytes[offset + i]) << (8U * i));
  }
  return out;
}

std::uint32_t ReadU32LE(std::span<const std::byte> bytes, std::size_t offset) {
  if (offset + sizeof(std::uint32_t) > bytes.size()) {
    throw SnapshotError("u32 read out of bounds");
  }
  std::uint32_t out = 0;
  for (std::size_t i = 0; i < sizeof(out); ++i) {
    out |= static_cast<std::uint32_t>(std::to_integer<std::uint8_t>(bytes[offset + i])) << (8U * i);
  }
  return out;
}

std::uint64_t ReadU64LE(std::span<const std::byte> bytes, std::size_t offset) {
  if (offset + sizeof(std::uint64_t) > bytes.size()) {
    throw SnapshotError("u64 read out of bounds");
  }
  std::uint64_t out = 0;
  for (std::size_t i = 0; i < sizeof(out); ++i) {
    out |= static_cast<std::uint64_t>(std::to_integer<std::uint8_t>(bytes[offset + i])) << (8U * i);
  }
  return out;
}

void AppendU16LE(std::vector<std::byte>& out, std::uint16_t value) {
  for (std::size_t i = 0; i < sizeof(value); ++i) {
    out.push_back(static_cast<std::byte>((value >> (8U * i)) & 0xFFU));
  }
}

void AppendU32LE(std::vector<std::byte>& out, std::uint32_t value) {
  for (std::size_t i = 0; i < sizeof(value); ++i) {
    out.push_back(static_cast<std::byte>((value >> (8U * i)) & 0xFFU));
  }
}

void AppendU64LE(std::vector<std::byte>& out, std::uint64_t value) {
  for (std::size_t i = 0; i < sizeof(value); ++i) {
    out.push_back(static_cast<std::byte>((value >> (8U * i)) & 0xFFU));
  }
}

bool TryMul(std::uint64_t lhs, std::uint64_t rhs, std::uint64_t& out) {
  if (lhs != 0 && rhs > std::numeric_limits<std::uint64_t>::max() / lhs) {
    return false;
  }
  out = lhs * rhs;
  return true;
}

}  // namespace

std::vector<std::byte> EncodeVectorSnapshot(const VectorSnapshotInfo& info,
                                            std::span<const float> vectors,
                                            std::span<const SymbolId> ids) {
  if (ids.size() != info.vector_count) {
    throw std::runtime_error("vector_snapshot: id count mismatch");
  }
  std::uint64_t value_count = 0;
  if (!TryMul(info.vector_count, info.dimension, value_count) || vectors.size() != value_count) {
    throw std::runtime_error("vector_snapshot: vector value count mismatch");
  }

  std::vector<std::byte> out{};
  out.reserve(kVectorSnapshotHeaderSize + vectors.size() * sizeof(float) + ids.size() * sizeof(std::uint64_t) +
              kVectorSnapshotTrailerSize);
  out.insert(out.end(), kMagic.begin(), kMagic.end());
  AppendU16LE(out, kVersion);
  AppendU16LE(out, 0);
  AppendU32LE(out, info.dimension);
  AppendU64LE(out, info.vector_count);
  AppendU64LE(out, value_count * sizeof(float));
  AppendU32LE(out, 0);

  for (const float value : vectors) {
    std::uint32_t bits = 0;
    static_assert(sizeof(bits) == sizeof(value));
    std::memcpy(&bits, &value, sizeof(bits));
    AppendU32LE(out, bits);
  }
  for (const auto id : ids) {
    AppendU64LE(out, id);
  }

  const auto digest = core::Sha256Of(std::span<const std::byte>(out.data(), out.size()));
  out.insert(out.end(), kTrailerMagic.begin(), kTrailerMagic.end());
  out.insert(out.end(), digest.begin(), digest.end());
  return out;
}

VectorSnapshot DecodeVectorSnapshot(std::span<const std::byte> bytes) {
  if (bytes.size() < kVectorSnapshotHeaderSize + kVectorSnapshotTrailerSize) {
    throw SnapshotError("snapshot too small");
  }

  const auto body_size = bytes.size() - kVectorSnapshotTrailerSize;
  const auto trailer = bytes.subspan(body_size);
  if (!std::equal(kTrailerMagic.begin(), kTrailerMagic.end(), trailer.begin())) {
    throw SnapshotError("integrity marker missing");
  }
  const auto body = bytes.first(body_size);
  const auto digest = core::Sha256Of(body);
  if (!std::equal(digest.begin(), digest.end(), trailer.begin() + static_cast<std::ptrdiff_t>(kTrailerMagic.size()))) {
    throw SnapshotError("integrity checksum mismatch");
  }

  if (!std::equal(kMagic.begin(), kMagic.end(), body.begin())) {
    throw SnapshotError("magic mismatch");
  }
  if (ReadU16LE(body, 4) != kVersion) {
    throw SnapshotError("unsupported version");
  }
  VectorSnapshot out{};
  out.info.dimension = ReadU32LE(body, 8);
  out.info.vector_count = ReadU64LE(body, 12);
  const auto payload_length = ReadU64LE(body, 20);

  std::uint64_t value_count = 0;
  std::uint64_t expected_payload = 0;
  std::uint64_t id_bytes = 0;
  if (!TryMul(out.info.vector_count, out.info.dimension, value_count) ||
      !TryMul(value_count, sizeof(float), expected_payload) ||
      !TryMul(out.info.vector_count, sizeof(std::uint64_t), id_bytes)) {
    throw SnapshotError("size overflow");
  }
  if (payload_length != expected_payload) {
    throw SnapshotError("payload length mismatch");
  }
  if (kVectorSnapshotHeaderSize + expected_payload + id_bytes != body.size()) {
    throw SnapshotError("snapshot length mismatch");
  }

  out.vectors.reserve(static_cast<std::size_t>(value_count));
  for (std::uint64_t i = 0; i < value_count; ++i) {
    const auto raw = ReadU32LE(body, kVectorSnapshotHeaderSize + static_cast<std::size_t>(i * sizeof(float)));
    float value = 0.0F;
    std::memcpy(&value, &raw, sizeof(value));
    out.vectors.push_back(value);
  }
  const auto id_offset = kVectorSnapshotHeaderSize + static_cast<std::size_t>(expected_payload);
  out.ids.reserve(static_cast<std::size_t>(out.info.vector_count));
  for (std::uint64_t i = 0; i < out.info.vector_count; ++i) {
    out.ids.push_back(ReadU64LE(body, id_offset + static_cast<std::size_t>(i * sizeof(std::uint64_t))));
  }
  return out;
}

void WriteSnapshotFile(const std::filesystem::path& path, std::span<const std::byte> bytes) {
  auto tmp_path = path;
  tmp_path += ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw StoreError("vector_snapshot: failed to open for write: " + tmp_path.string());
    }
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      throw StoreError("vector_snapshot: failed to write " + tmp_path.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    throw StoreError("vector_snapshot: failed to publish snapshot: " + ec.message());
  }
}

std::optional<std::vector<std::byte>> ReadSnapshotFile(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    throw StoreError("vector_snapshot: failed to stat " + path.string() + ": " + ec.message());
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw StoreError("vector_snapshot: failed to open for read: " + path.string());
  }
  std::vector<std::byte> out(static_cast<std::size_t>(size));
  in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
  if (in.gcount() != static_cast<std::streamsize>(out.size())) {
    throw StoreError("vector_snapshot: short read on " + path.string());
  }
  return out;
}

}  // namespace codescope
