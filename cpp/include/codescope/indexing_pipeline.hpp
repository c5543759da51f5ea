#pragma once

#include "codescope/corpus.hpp"
#include "codescope/embeddings.hpp"
#include "codescope/types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace codescope {

// Cooperative cancellation for an indexing run, observed between batches.
class CancellationToken {
 public:
  void Cancel() { cancelled_.store(true, std::memory_order_release); }
  [[nodiscard]] bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

 private:
  std::atomic<bool> cancelled_{false};
};

// The only write path into a Corpus. Stages per run:
//   validate   assign id and content hash, reject malformed records, skip unchanged ones
//   embed      batches of PipelineConfig::batch_size on up to embed_concurrency threads
//   commit     one transaction per symbol across store, vector and lexical index
// Failures are reported in RunStats and never escape Run().
class IndexingPipeline {
 public:
  IndexingPipeline(Corpus& corpus, std::shared_ptr<EmbeddingProvider> embedder, PipelineConfig config);

  RunStats Run(const std::vector<Symbol>& symbols, const CancellationToken* cancel = nullptr);

  // Deletes symbols from all three stores. Unknown ids are ignored. Returns how many existed.
  std::uint64_t Remove(const std::vector<SymbolId>& ids);
  std::uint64_t RemoveFile(const std::string& file_path);

  // Rebuilds the vector index without tombstoned slots.
  void Compact();

 private:
  Corpus& corpus_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  PipelineConfig config_;
};

}  // namespace codescope
