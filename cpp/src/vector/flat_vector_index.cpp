#include "codescope/vector_index.hpp"
#include "codescope/errors.hpp"
#include "codescope/vector_snapshot.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <utility>

namespace codescope {
namespace {

std::atomic<std::uint32_t> g_test_commit_fail_countdown{0};

double Dot(std::span<const float> lhs, std::span<const float> rhs) {
  double dot = 0.0;
  for (std::size_t i = 0; i < lhs.size(); ++i) {
    dot += static_cast<double>(lhs[i]) * static_cast<double>(rhs[i]);
  }
  return dot;
}

double Norm(std::span<const float> v) {
  return std::sqrt(std::max(Dot(v, v), 0.0));
}

float CosineFromParts(double dot, double lhs_norm, double rhs_norm) {
  if (lhs_norm <= 0.0 || rhs_norm <= 0.0) {
    return 0.0F;
  }
  const double cosine = dot / (lhs_norm * rhs_norm);
  return static_cast<float>(std::clamp(cosine, -1.0, 1.0));
}

bool HitLess(const VectorHit& lhs, const VectorHit& rhs) {
  if (lhs.second != rhs.second) {
    return lhs.second > rhs.second;
  }
  return lhs.first < rhs.first;
}

void MaybeInjectCommitFailure() {
  auto remaining = g_test_commit_fail_countdown.load(std::memory_order_relaxed);
  while (remaining > 0) {
    if (g_test_commit_fail_countdown.compare_exchange_weak(remaining,
                                                           remaining - 1,
                                                           std::memory_order_relaxed,
                                                           std::memory_order_relaxed)) {
      if (remaining == 1) {
        throw std::runtime_error("FlatVectorIndex::CommitStaged injected failure");
      }
      return;
    }
  }
}

}  // namespace

float CosineSimilarity(std::span<const float> lhs, std::span<const float> rhs) {
  if (lhs.size() != rhs.size()) {
    throw DimensionMismatchError("CosineSimilarity", lhs.size(), rhs.size());
  }
  return CosineFromParts(Dot(lhs, rhs), Norm(lhs), Norm(rhs));
}

FlatVectorIndex::FlatVectorIndex(int dimensions) : dimensions_(dimensions) {
  if (dimensions_ <= 0) {
    throw ConfigurationError("FlatVectorIndex dimensions must be positive");
  }
}

int FlatVectorIndex::dimensions() const {
  return dimensions_;
}

void FlatVectorIndex::CheckDimensions(const char* where, std::size_t size) const {
  if (size != static_cast<std::size_t>(dimensions_)) {
    throw DimensionMismatchError(where, static_cast<std::size_t>(dimensions_), size);
  }
}

std::span<const float> FlatVectorIndex::SlotVector(std::size_t slot) const {
  const auto dims = static_cast<std::size_t>(dimensions_);
  return std::span<const float>(slab_.data() + slot * dims, dims);
}

std::vector<VectorHit> FlatVectorIndex::Search(const std::vector<float>& query, int top_k) const {
  CheckDimensions("FlatVectorIndex::Search", query.size());
  if (top_k <= 0 || slots_.empty()) {
    return {};
  }

  const auto query_span = std::span<const float>(query.data(), query.size());
  const double query_norm = Norm(query_span);
  std::vector<VectorHit> hits{};
  hits.reserve(slots_.size());
  for (std::size_t slot = 0; slot < slot_ids_.size(); ++slot) {
    if (!live_[slot]) {
      continue;
    }
    const float score = CosineFromParts(Dot(query_span, SlotVector(slot)), query_norm, norms_[slot]);
    hits.emplace_back(slot_ids_[slot], score);
  }

  const auto keep = std::min<std::size_t>(hits.size(), static_cast<std::size_t>(top_k));
  std::partial_sort(hits.begin(), hits.begin() + static_cast<std::ptrdiff_t>(keep), hits.end(), HitLess);
  hits.resize(keep);
  return hits;
}

std::optional<float> FlatVectorIndex::Similarity(const std::vector<float>& query, SymbolId id) const {
  CheckDimensions("FlatVectorIndex::Similarity", query.size());
  const auto it = slots_.find(id);
  if (it == slots_.end()) {
    return std::nullopt;
  }
  const auto query_span = std::span<const float>(query.data(), query.size());
  return CosineFromParts(Dot(query_span, SlotVector(it->second)), Norm(query_span), norms_[it->second]);
}

void FlatVectorIndex::StageAdd(SymbolId id, const std::vector<float>& vector) {
  CheckDimensions("FlatVectorIndex::StageAdd", vector.size());
  pending_mutations_.push_back(PendingMutation{PendingMutationType::kAdd, id, vector});
}

void FlatVectorIndex::StageRemove(SymbolId id) {
  pending_mutations_.push_back(PendingMutation{PendingMutationType::kRemove, id, {}});
}

void FlatVectorIndex::CommitStaged() {
  MaybeInjectCommitFailure();
  for (const auto& mutation : pending_mutations_) {
    if (mutation.type == PendingMutationType::kAdd) {
      TombstoneSlot(mutation.id);
      AppendSlot(mutation.id, mutation.vector);
      continue;
    }
    TombstoneSlot(mutation.id);
  }
  pending_mutations_.clear();
}

void FlatVectorIndex::RollbackStaged() {
  pending_mutations_.clear();
}

std::size_t FlatVectorIndex::PendingMutationCount() const {
  return pending_mutations_.size();
}

void FlatVectorIndex::Add(SymbolId id, const std::vector<float>& vector) {
  StageAdd(id, vector);
  CommitStaged();
}

void FlatVectorIndex::Remove(SymbolId id) {
  StageRemove(id);
  CommitStaged();
}

void FlatVectorIndex::AppendSlot(SymbolId id, std::span<const float> vector) {
  const auto slot = slot_ids_.size();
  slab_.insert(slab_.end(), vector.begin(), vector.end());
  norms_.push_back(static_cast<float>(Norm(vector)));
  slot_ids_.push_back(id);
  live_.push_back(true);
  slots_[id] = slot;
}

void FlatVectorIndex::TombstoneSlot(SymbolId id) {
  const auto it = slots_.find(id);
  if (it == slots_.end()) {
    return;
  }
  live_[it->second] = false;
  slots_.erase(it);
}

void FlatVectorIndex::Rebuild(const std::vector<std::pair<SymbolId, std::vector<float>>>& entries) {
  for (const auto& [id, vector] : entries) {
    CheckDimensions("FlatVectorIndex::Rebuild", vector.size());
  }
  std::vector<std::size_t> order(entries.size());
  std::iota(order.begin(), order.end(), std::size_t{0});
  std::sort(order.begin(), order.end(), [&](std::size_t lhs, std::size_t rhs) {
    return entries[lhs].first < entries[rhs].first;
  });

  Clear();
  slab_.reserve(entries.size() * static_cast<std::size_t>(dimensions_));
  norms_.reserve(entries.size());
  slot_ids_.reserve(entries.size());
  live_.reserve(entries.size());
  for (const auto index : order) {
    TombstoneSlot(entries[index].first);
    AppendSlot(entries[index].first, entries[index].second);
  }
}

void FlatVectorIndex::Clear() {
  slab_.clear();
  norms_.clear();
  slot_ids_.clear();
  live_.clear();
  slots_.clear();
  pending_mutations_.clear();
}

std::size_t FlatVectorIndex::Size() const {
  return slots_.size();
}

bool FlatVectorIndex::Contains(SymbolId id) const {
  return slots_.find(id) != slots_.end();
}

std::size_t FlatVectorIndex::TombstoneCount() const {
  return slot_ids_.size() - slots_.size();
}

std::size_t FlatVectorIndex::SlotCount() const {
  return slot_ids_.size();
}

std::vector<std::byte> FlatVectorIndex::Serialize() const {
  std::vector<SymbolId> ids{};
  ids.reserve(slots_.size());
  for (const auto& [id, _] : slots_) {
    ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());

  std::vector<float> vectors{};
  vectors.reserve(ids.size() * static_cast<std::size_t>(dimensions_));
  for (const auto id : ids) {
    const auto values = SlotVector(slots_.at(id));
    vectors.insert(vectors.end(), values.begin(), values.end());
  }

  VectorSnapshotInfo info{};
  info.dimension = static_cast<std::uint32_t>(dimensions_);
  info.vector_count = ids.size();
  return EncodeVectorSnapshot(info, vectors, ids);
}

void FlatVectorIndex::Load(std::span<const std::byte> snapshot_bytes) {
  const auto snapshot = DecodeVectorSnapshot(snapshot_bytes);
  if (snapshot.info.dimension != static_cast<std::uint32_t>(dimensions_)) {
    throw DimensionMismatchError("FlatVectorIndex::Load", static_cast<std::size_t>(dimensions_),
                                 snapshot.info.dimension);
  }

  const auto dims = static_cast<std::size_t>(dimensions_);
  Clear();
  for (std::size_t i = 0; i < snapshot.ids.size(); ++i) {
    TombstoneSlot(snapshot.ids[i]);
    AppendSlot(snapshot.ids[i], std::span<const float>(snapshot.vectors.data() + i * dims, dims));
  }
}

namespace vector::testing {

void SetCommitFailCountdown(std::uint32_t countdown) {
  g_test_commit_fail_countdown.store(countdown, std::memory_order_relaxed);
}

void ClearCommitFailCountdown() {
  g_test_commit_fail_countdown.store(0, std::memory_order_relaxed);
}

}  // namespace vector::testing

}  // namespace codescope
