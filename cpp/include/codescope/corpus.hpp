#pragma once

#include "codescope/lexical_index.hpp"
#include "codescope/symbol_store.hpp"
#include "codescope/types.hpp"
#include "codescope/vector_index.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <shared_mutex>

namespace codescope {

// Exclusive owner of the Symbol Store and both indexes. Readers hold a ReadView
// (shared lock), writers a WriteView (exclusive lock); Clear() takes the exclusive lock so a
// concurrent search sees either the whole corpus or none of it.
class Corpus {
 public:
  Corpus(const CorpusConfig& config, const LexicalConfig& lexical_config);
  Corpus(const Corpus&) = delete;
  Corpus& operator=(const Corpus&) = delete;

  class ReadView {
   public:
    explicit ReadView(const Corpus& corpus);

    [[nodiscard]] const SymbolStore& store() const { return corpus_.store_; }
    [[nodiscard]] const LexicalIndex& lexical() const { return corpus_.lexical_; }
    [[nodiscard]] const FlatVectorIndex& vectors() const { return corpus_.vectors_; }
    [[nodiscard]] std::uint64_t version() const { return corpus_.version_; }
    [[nodiscard]] std::uint64_t mutations() const { return corpus_.mutations_; }

   private:
    const Corpus& corpus_;
    std::shared_lock<std::shared_mutex> lock_;
  };

  class WriteView {
   public:
    explicit WriteView(Corpus& corpus);

    [[nodiscard]] SymbolStore& store() { return corpus_.store_; }
    [[nodiscard]] LexicalIndex& lexical() { return corpus_.lexical_; }
    [[nodiscard]] FlatVectorIndex& vectors() { return corpus_.vectors_; }
    [[nodiscard]] std::uint64_t version() const { return corpus_.version_; }
    void BumpVersion();
    // Undoes BumpVersion() after the surrounding store transaction rolled back.
    void RollbackVersion();
    // Counts one committed symbol write or removal; the snapshot is current only when it
    // was taken at the same count.
    void RecordMutation();
    void RollbackMutation();
    // Rebuilds the vector slab from the store's entries, dropping tombstones.
    void CompactVectors();

   private:
    Corpus& corpus_;
    std::unique_lock<std::shared_mutex> lock_;
  };

  [[nodiscard]] ReadView Read() const { return ReadView(*this); }
  [[nodiscard]] WriteView Write() { return WriteView(*this); }

  [[nodiscard]] int dimensions() const { return config_.dimensions; }
  [[nodiscard]] bool persistent() const { return !config_.data_dir.empty(); }
  [[nodiscard]] CorpusStats Stats() const;

  // Drops every symbol and index entry and resets the version counter.
  void Clear();
  // Publishes the vector snapshot. The Symbol Store is durable on every commit.
  void Persist();

  [[nodiscard]] std::filesystem::path StorePath() const;
  [[nodiscard]] std::filesystem::path SnapshotPath() const;

 private:
  void LoadIndexes();
  void RebuildVectorsFromStore(const char* reason);

  CorpusConfig config_;
  SymbolStore store_;
  LexicalIndex lexical_;
  FlatVectorIndex vectors_;
  std::uint64_t version_ = 0;
  std::uint64_t mutations_ = 0;
  mutable std::shared_mutex mutex_{};
};

}  // namespace codescope
