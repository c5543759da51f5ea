#pragma once

#include "codescope/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <unordered_map>
#include <utility>
#include <vector>

namespace codescope {

// Cosine of the angle between two vectors; 0 when either has zero norm.
[[nodiscard]] float CosineSimilarity(std::span<const float> lhs, std::span<const float> rhs);

using VectorHit = std::pair<SymbolId, float>;

class VectorIndex {
 public:
  virtual ~VectorIndex() = default;

  virtual int dimensions() const = 0;
  // Up to top_k hits, descending similarity, ties by ascending id.
  virtual std::vector<VectorHit> Search(const std::vector<float>& query, int top_k) const = 0;
  // Similarity of one stored vector to the query; std::nullopt when id is absent.
  virtual std::optional<float> Similarity(const std::vector<float>& query, SymbolId id) const = 0;
  virtual void StageAdd(SymbolId id, const std::vector<float>& vector) = 0;
  virtual void StageRemove(SymbolId id) = 0;
  virtual void CommitStaged() = 0;
  virtual void RollbackStaged() = 0;
  virtual std::size_t PendingMutationCount() const = 0;
  virtual void Add(SymbolId id, const std::vector<float>& vector) = 0;
  virtual void Remove(SymbolId id) = 0;
  virtual void Rebuild(const std::vector<std::pair<SymbolId, std::vector<float>>>& entries) = 0;
  virtual void Clear() = 0;
  virtual std::size_t Size() const = 0;
  virtual bool Contains(SymbolId id) const = 0;
  virtual std::vector<std::byte> Serialize() const = 0;
  virtual void Load(std::span<const std::byte> snapshot_bytes) = 0;
};

// Exact search over a contiguous slab. Removal tombstones a slot; Rebuild() compacts.
class FlatVectorIndex final : public VectorIndex {
 public:
  explicit FlatVectorIndex(int dimensions);

  int dimensions() const override;
  std::vector<VectorHit> Search(const std::vector<float>& query, int top_k) const override;
  std::optional<float> Similarity(const std::vector<float>& query, SymbolId id) const override;
  void StageAdd(SymbolId id, const std::vector<float>& vector) override;
  void StageRemove(SymbolId id) override;
  void CommitStaged() override;
  void RollbackStaged() override;
  std::size_t PendingMutationCount() const override;
  void Add(SymbolId id, const std::vector<float>& vector) override;
  void Remove(SymbolId id) override;
  void Rebuild(const std::vector<std::pair<SymbolId, std::vector<float>>>& entries) override;
  void Clear() override;
  std::size_t Size() const override;
  bool Contains(SymbolId id) const override;
  std::vector<std::byte> Serialize() const override;
  void Load(std::span<const std::byte> snapshot_bytes) override;

  [[nodiscard]] std::size_t TombstoneCount() const;
  [[nodiscard]] std::size_t SlotCount() const;

 private:
  enum class PendingMutationType {
    kAdd,
    kRemove,
  };
  struct PendingMutation {
    PendingMutationType type = PendingMutationType::kAdd;
    SymbolId id = 0;
    std::vector<float> vector{};
  };

  void CheckDimensions(const char* where, std::size_t size) const;
  void AppendSlot(SymbolId id, std::span<const float> vector);
  void TombstoneSlot(SymbolId id);
  [[nodiscard]] std::span<const float> SlotVector(std::size_t slot) const;

  int dimensions_;
  std::vector<float> slab_;
  std::vector<float> norms_;
  std::vector<SymbolId> slot_ids_;
  std::vector<bool> live_;
  std::unordered_map<SymbolId, std::size_t> slots_;
  std::vector<PendingMutation> pending_mutations_;
};

namespace vector::testing {

void SetCommitFailCountdown(std::uint32_t countdown);
void ClearCommitFailCountdown();

}  // namespace vector::testing

}  // namespace codescope
