#include "codescope/errors.hpp"
#include "codescope/vector_index.hpp"
#include "codescope/vector_snapshot.hpp"

#include "../test_logger.hpp"

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

bool ApproxEqual(float lhs, float rhs, float eps = 1e-5F) {
  return std::fabs(lhs - rhs) <= eps;
}

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const std::exception&) {
    return true;
  }
  return false;
}

template <typename E, typename Fn>
bool ThrowsAs(Fn&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  } catch (const std::exception&) {
    return false;
  }
  return false;
}

void ScenarioCosineProperties() {
  codescope::tests::Log("scenario: cosine properties");
  const std::vector<float> a = {0.3F, -1.2F, 2.0F};
  const std::vector<float> b = {1.0F, 0.5F, -0.25F};
  Require(ApproxEqual(codescope::CosineSimilarity(a, a), 1.0F), "self similarity must be 1");
  Require(ApproxEqual(codescope::CosineSimilarity(a, b), codescope::CosineSimilarity(b, a)),
          "cosine must be symmetric");
  const std::vector<float> negated = {-0.3F, 1.2F, -2.0F};
  Require(ApproxEqual(codescope::CosineSimilarity(a, negated), -1.0F), "opposite vectors must score -1");
  const std::vector<float> zero = {0.0F, 0.0F, 0.0F};
  Require(codescope::CosineSimilarity(a, zero) == 0.0F, "zero vector must score 0");
  Require(ThrowsAs<codescope::DimensionMismatchError>([&]() {
            (void)codescope::CosineSimilarity(a, std::vector<float>{1.0F, 2.0F});
          }),
          "cosine over mismatched dimensions must throw");
}

void ScenarioCtorValidation() {
  codescope::tests::Log("scenario: constructor validation");
  Require(ThrowsAs<codescope::ConfigurationError>([]() { codescope::FlatVectorIndex invalid(0); }),
          "dimensions <= 0 must throw");
}

void ScenarioSearchOrderingAndTieBreak() {
  codescope::tests::Log("scenario: search ordering and tie-break");
  codescope::FlatVectorIndex index(3);
  index.Add(10, {1.0F, 0.0F, 0.0F});
  index.Add(2, {2.0F, 0.0F, 0.0F});
  index.Add(7, {0.0F, 1.0F, 0.0F});
  index.Add(4, {1.0F, 1.0F, 0.0F});

  const auto results = index.Search({1.0F, 0.0F, 0.0F}, 10);
  Require(results.size() == 4, "expected four results");
  Require(results[0].first == 2 && results[1].first == 10, "ties must order by ascending id");
  Require(ApproxEqual(results[0].second, results[1].second), "tied entries must score equally");
  Require(results[2].first == 4, "diagonal vector must rank third");
  Require(results[3].first == 7, "orthogonal vector must rank last");

  Require(index.Search({1.0F, 0.0F, 0.0F}, 2).size() == 2, "top_k must cap results");
  Require(index.Search({1.0F, 0.0F, 0.0F}, 0).empty(), "top_k=0 must return empty");
  Require(index.Search({1.0F, 0.0F, 0.0F}, -1).empty(), "top_k<0 must return empty");
  Require(ThrowsAs<codescope::DimensionMismatchError>([&]() { (void)index.Search({1.0F, 0.0F}, 3); }),
          "query of wrong dimension must throw");
  Require(ThrowsAs<codescope::DimensionMismatchError>([&]() { index.Add(11, {1.0F}); }),
          "vector of wrong dimension must throw");

  const auto similarity = index.Similarity({1.0F, 0.0F, 0.0F}, 4);
  Require(similarity.has_value() && ApproxEqual(*similarity, 1.0F / std::sqrt(2.0F)), "Similarity mismatch");
  Require(!index.Similarity({1.0F, 0.0F, 0.0F}, 99).has_value(), "Similarity of unknown id must be empty");
}

void ScenarioRemoveReplaceAndCompact() {
  codescope::tests::Log("scenario: remove, replace and compact");
  codescope::FlatVectorIndex index(2);
  index.Add(1, {1.0F, 0.0F});
  index.Add(2, {0.0F, 1.0F});
  index.Remove(2);
  index.Remove(99);
  Require(index.Size() == 1 && !index.Contains(2), "removed vector must be absent");
  const auto after_remove = index.Search({0.0F, 1.0F}, 5);
  Require(after_remove.size() == 1 && after_remove[0].first == 1, "removed vector must not be returned");

  index.Add(1, {0.0F, 1.0F});
  Require(index.Size() == 1, "re-adding an id must replace it");
  Require(index.TombstoneCount() == 2, "replaced and removed slots must be tombstoned");
  const auto replaced = index.Search({0.0F, 1.0F}, 1);
  Require(ApproxEqual(replaced[0].second, 1.0F), "replacement vector must be searched");

  index.Rebuild({{1, {0.0F, 1.0F}}});
  Require(index.TombstoneCount() == 0 && index.SlotCount() == 1, "rebuild must drop tombstones");
}

void ScenarioRebuildEquivalence() {
  codescope::tests::Log("scenario: rebuild equivalence");
  codescope::FlatVectorIndex incremental(3);
  std::vector<std::pair<codescope::SymbolId, std::vector<float>>> entries{};
  for (codescope::SymbolId id = 1; id <= 12; ++id) {
    const auto x = static_cast<float>(id);
    std::vector<float> vector = {std::sin(x), std::cos(x), x / 12.0F};
    incremental.Add(id, vector);
    entries.emplace_back(id, vector);
  }
  incremental.Remove(3);
  incremental.Remove(8);
  entries.erase(entries.begin() + 7);
  entries.erase(entries.begin() + 2);

  codescope::FlatVectorIndex rebuilt(3);
  rebuilt.Rebuild(entries);
  const std::vector<float> query = {0.4F, -0.2F, 0.9F};
  Require(incremental.Search(query, 20) == rebuilt.Search(query, 20), "rebuilt index must rank identically");
}

void ScenarioStagedMutations() {
  codescope::tests::Log("scenario: staged mutations");
  codescope::FlatVectorIndex index(2);
  index.StageAdd(5, {1.0F, 0.0F});
  Require(index.PendingMutationCount() == 1, "pending mutation count mismatch after stage add");
  Require(!index.Contains(5), "staged add must not be visible");
  index.RollbackStaged();
  Require(index.PendingMutationCount() == 0 && !index.Contains(5), "rollback must drop staged add");

  index.StageAdd(5, {1.0F, 0.0F});
  index.StageRemove(5);
  index.StageAdd(6, {0.0F, 1.0F});
  index.CommitStaged();
  Require(!index.Contains(5) && index.Contains(6), "staged mutations must apply in order");
}

void ScenarioInjectedCommitFailure() {
  codescope::tests::Log("scenario: injected commit failure");
  codescope::FlatVectorIndex index(2);
  codescope::vector::testing::SetCommitFailCountdown(2);
  index.Add(1, {1.0F, 0.0F});
  index.StageAdd(2, {0.0F, 1.0F});
  Require(Throws([&]() { index.CommitStaged(); }), "second commit must fail");
  Require(!index.Contains(2), "failed commit must not apply");
  index.RollbackStaged();
  codescope::vector::testing::ClearCommitFailCountdown();
  index.Add(2, {0.0F, 1.0F});
  Require(index.Size() == 2, "commits must succeed once the countdown is cleared");
}

void ScenarioSnapshotRoundtrip() {
  codescope::tests::Log("scenario: snapshot roundtrip");
  codescope::FlatVectorIndex index(3);
  index.Add(30, {0.0F, 0.0F, 1.0F});
  index.Add(10, {1.0F, 0.0F, 0.0F});
  index.Add(20, {0.0F, 1.0F, 0.0F});
  index.Remove(20);

  const auto bytes = index.Serialize();
  const auto decoded = codescope::DecodeVectorSnapshot(bytes);
  Require(decoded.info.dimension == 3 && decoded.info.vector_count == 2, "snapshot header mismatch");
  Require(decoded.ids == std::vector<codescope::SymbolId>({10, 30}), "snapshot ids must be sorted and live");

  codescope::FlatVectorIndex loaded(3);
  loaded.Load(bytes);
  const std::vector<float> query = {0.5F, 0.1F, 0.5F};
  Require(loaded.Search(query, 5) == index.Search(query, 5), "loaded index must rank identically");

  codescope::FlatVectorIndex wrong(4);
  Require(ThrowsAs<codescope::DimensionMismatchError>([&]() { wrong.Load(bytes); }),
          "loading into another dimension must throw");
}

void ScenarioCorruptSnapshot() {
  codescope::tests::Log("scenario: corrupt snapshot");
  codescope::FlatVectorIndex index(2);
  index.Add(1, {1.0F, 0.0F});
  index.Add(2, {0.0F, 1.0F});
  const auto bytes = index.Serialize();

  auto truncated = bytes;
  truncated.resize(truncated.size() - 9);
  Require(ThrowsAs<codescope::CorruptionError>([&]() { (void)codescope::DecodeVectorSnapshot(truncated); }),
          "truncated snapshot must be rejected");

  auto flipped = bytes;
  flipped[codescope::kVectorSnapshotHeaderSize] ^= std::byte{0x01};
  Require(ThrowsAs<codescope::CorruptionError>([&]() { (void)codescope::DecodeVectorSnapshot(flipped); }),
          "checksum mismatch must be rejected");

  const std::vector<std::byte> tiny(8, std::byte{0});
  Require(ThrowsAs<codescope::CorruptionError>([&]() { (void)codescope::DecodeVectorSnapshot(tiny); }),
          "tiny snapshot must be rejected");

  codescope::FlatVectorIndex target(2);
  target.Add(9, {1.0F, 1.0F});
  Require(Throws([&]() { target.Load(truncated); }), "Load must reject a corrupt snapshot");
  Require(target.Contains(9) && target.Size() == 1, "failed Load must leave the index untouched");
}

void ScenarioSnapshotFile() {
  codescope::tests::Log("scenario: snapshot file");
  const auto path = std::filesystem::temp_directory_path() /
                    ("codescope_vector_index_test_" +
                     std::to_string(std::chrono::high_resolution_clock::now().time_since_epoch().count()) + ".csvx");
  Require(!codescope::ReadSnapshotFile(path).has_value(), "missing snapshot file must read as empty");

  codescope::FlatVectorIndex index(2);
  index.Add(1, {1.0F, 0.0F});
  const auto bytes = index.Serialize();
  codescope::WriteSnapshotFile(path, bytes);
  const auto read = codescope::ReadSnapshotFile(path);
  Require(read.has_value() && *read == bytes, "snapshot file roundtrip mismatch");

  std::error_code ec;
  std::filesystem::remove(path, ec);
}

}  // namespace

int main() {
  try {
    codescope::tests::Log("vector_index_test: start");
    ScenarioCosineProperties();
    ScenarioCtorValidation();
    ScenarioSearchOrderingAndTieBreak();
    ScenarioRemoveReplaceAndCompact();
    ScenarioRebuildEquivalence();
    ScenarioStagedMutations();
    ScenarioInjectedCommitFailure();
    ScenarioSnapshotRoundtrip();
    ScenarioCorruptSnapshot();
    ScenarioSnapshotFile();
    codescope::tests::Log("vector_index_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    codescope::vector::testing::ClearCommitFailCountdown();
    codescope::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
