#include "codescope/corpus.hpp"

#include "codescope/errors.hpp"
#include "codescope/logging.hpp"
#include "codescope/vector_snapshot.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace codescope {
namespace {

constexpr const char* kStoreFile = "symbols.db";
constexpr const char* kSnapshotFile = "vectors.csvx";
constexpr const char* kMetaDimensions = "dimensions";
constexpr const char* kMetaVersion = "version";
constexpr const char* kMetaMutations = "mutations";
constexpr const char* kMetaSnapshotMutations = "snapshot_mutations";

std::filesystem::path StoreLocation(const CorpusConfig& config) {
  if (config.data_dir.empty()) {
    return ":memory:";
  }
  return config.data_dir / kStoreFile;
}

std::uint64_t ParseCounter(const char* key, const std::string& raw) {
  try {
    return static_cast<std::uint64_t>(std::stoull(raw));
  } catch (const std::exception&) {
    throw CorruptionError(std::string("corpus: unreadable ") + key + " '" + raw + "'");
  }
}

int ParseDimensions(const std::string& raw) {
  try {
    return std::stoi(raw);
  } catch (const std::exception&) {
    throw CorruptionError("corpus: unreadable dimensions '" + raw + "'");
  }
}

}  // namespace

Corpus::ReadView::ReadView(const Corpus& corpus) : corpus_(corpus), lock_(corpus.mutex_) {}

Corpus::WriteView::WriteView(Corpus& corpus) : corpus_(corpus), lock_(corpus.mutex_) {}

void Corpus::WriteView::BumpVersion() {
  corpus_.store_.SetMeta(kMetaVersion, std::to_string(corpus_.version_ + 1));
  ++corpus_.version_;
}

void Corpus::WriteView::RollbackVersion() {
  if (corpus_.version_ > 0) {
    --corpus_.version_;
  }
}

void Corpus::WriteView::RecordMutation() {
  corpus_.store_.SetMeta(kMetaMutations, std::to_string(corpus_.mutations_ + 1));
  ++corpus_.mutations_;
}

void Corpus::WriteView::RollbackMutation() {
  if (corpus_.mutations_ > 0) {
    --corpus_.mutations_;
  }
}

void Corpus::WriteView::CompactVectors() {
  corpus_.RebuildVectorsFromStore("compaction");
}

Corpus::Corpus(const CorpusConfig& config, const LexicalConfig& lexical_config)
    : config_(config),
      store_(SymbolStore::Open(StoreLocation(config))),
      lexical_(lexical_config),
      vectors_(config.dimensions) {
  if (const auto recorded = store_.GetMeta(kMetaDimensions); recorded.has_value()) {
    const int stored = ParseDimensions(*recorded);
    if (stored != config_.dimensions) {
      throw DimensionMismatchError("corpus", static_cast<std::size_t>(stored),
                                   static_cast<std::size_t>(config_.dimensions));
    }
  } else {
    store_.SetMeta(kMetaDimensions, std::to_string(config_.dimensions));
  }
  if (const auto recorded = store_.GetMeta(kMetaVersion); recorded.has_value()) {
    version_ = ParseCounter(kMetaVersion, *recorded);
  }
  if (const auto recorded = store_.GetMeta(kMetaMutations); recorded.has_value()) {
    mutations_ = ParseCounter(kMetaMutations, *recorded);
  }
  LoadIndexes();
}

std::filesystem::path Corpus::StorePath() const {
  return StoreLocation(config_);
}

std::filesystem::path Corpus::SnapshotPath() const {
  if (config_.data_dir.empty()) {
    return {};
  }
  return config_.data_dir / kSnapshotFile;
}

void Corpus::LoadIndexes() {
  const auto entries = store_.Entries();
  for (const auto& [id, entry] : entries) {
    lexical_.StageIndex(id, entry.term_vector);
  }
  lexical_.CommitStaged();

  if (!persistent()) {
    RebuildVectorsFromStore("startup");
    return;
  }

  std::optional<std::vector<std::byte>> snapshot{};
  try {
    snapshot = ReadSnapshotFile(SnapshotPath());
  } catch (const StoreError& e) {
    Logger()->warn("corpus: cannot read vector snapshot {}: {}", SnapshotPath().string(), e.what());
    RebuildVectorsFromStore("unreadable snapshot");
    return;
  }
  if (!snapshot.has_value()) {
    RebuildVectorsFromStore("no snapshot");
    return;
  }
  try {
    vectors_.Load(*snapshot);
  } catch (const CorruptionError& e) {
    Logger()->warn("corpus: discarding vector snapshot {}: {}", SnapshotPath().string(), e.what());
    RebuildVectorsFromStore("corrupt snapshot");
    return;
  } catch (const DimensionMismatchError& e) {
    Logger()->warn("corpus: discarding vector snapshot {}: {}", SnapshotPath().string(), e.what());
    RebuildVectorsFromStore("snapshot dimension mismatch");
    return;
  }

  // Commits after the last Persist() are in the store but not in the snapshot.
  const auto snapshot_mutations = store_.GetMeta(kMetaSnapshotMutations);
  bool stale = !snapshot_mutations.has_value() ||
               ParseCounter(kMetaSnapshotMutations, *snapshot_mutations) != mutations_ ||
               vectors_.Size() != entries.size();
  for (std::size_t i = 0; !stale && i < entries.size(); ++i) {
    stale = !vectors_.Contains(entries[i].first);
  }
  if (stale) {
    Logger()->warn("corpus: vector snapshot is behind the symbol store ({} vectors, {} entries)",
                   vectors_.Size(), entries.size());
    RebuildVectorsFromStore("stale snapshot");
    return;
  }
  Logger()->info("corpus: loaded {} vectors from {}", vectors_.Size(), SnapshotPath().string());
}

void Corpus::RebuildVectorsFromStore(const char* reason) {
  auto entries = store_.Entries();
  std::vector<std::pair<SymbolId, std::vector<float>>> vectors{};
  vectors.reserve(entries.size());
  for (auto& [id, entry] : entries) {
    vectors.emplace_back(id, std::move(entry.embedding));
  }
  vectors_.Rebuild(vectors);
  Logger()->debug("corpus: rebuilt vector index from store ({}, {} vectors)", reason, vectors_.Size());
}

CorpusStats Corpus::Stats() const {
  const auto view = Read();
  CorpusStats stats{};
  stats.symbols = store_.SymbolCount();
  stats.files = store_.FileCount();
  stats.by_kind = store_.CountsByKind();
  stats.vectors = vectors_.Size();
  stats.vector_tombstones = vectors_.TombstoneCount();
  const auto lexical = lexical_.Stats();
  stats.lexical_documents = lexical.documents;
  stats.unique_terms = lexical.unique_terms;
  stats.version = version_;
  stats.dimensions = config_.dimensions;
  return stats;
}

void Corpus::Clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  store_.Clear();
  lexical_.Clear();
  vectors_.Clear();
  version_ = 0;
  mutations_ = 0;
  store_.SetMeta(kMetaVersion, "0");
  store_.SetMeta(kMetaMutations, "0");

  if (persistent()) {
    std::error_code ec;
    std::filesystem::remove(SnapshotPath(), ec);
    if (ec) {
      Logger()->warn("corpus: failed to remove {}: {}", SnapshotPath().string(), ec.message());
    }
  }
  Logger()->info("corpus: cleared");
}

void Corpus::Persist() {
  if (!persistent()) {
    return;
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const auto bytes = vectors_.Serialize();
  WriteSnapshotFile(SnapshotPath(), bytes);
  store_.SetMeta(kMetaSnapshotMutations, std::to_string(mutations_));
  Logger()->debug("corpus: persisted vector snapshot ({} bytes)", bytes.size());
}

}  // namespace codescope
