#pragma once

#include "codescope/context_assembler.hpp"
#include "codescope/corpus.hpp"
#include "codescope/embeddings.hpp"
#include "codescope/hybrid_ranker.hpp"
#include "codescope/indexing_pipeline.hpp"
#include "codescope/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace codescope {

// Wires one Corpus to its write path (IndexingPipeline) and read path (HybridRanker,
// ContextAssembler). Several engines can live in one process; they share nothing.
class CodeSearchEngine {
 public:
  // A null embedder selects HashingEmbeddingProvider. corpus.dimensions == 0 adopts the
  // embedder's dimensionality.
  explicit CodeSearchEngine(EngineConfig config, std::shared_ptr<EmbeddingProvider> embedder = nullptr);
  CodeSearchEngine(const CodeSearchEngine&) = delete;
  CodeSearchEngine& operator=(const CodeSearchEngine&) = delete;

  RunStats Index(const std::vector<Symbol>& symbols, const CancellationToken* cancel = nullptr);
  std::uint64_t Remove(const std::vector<SymbolId>& ids);
  std::uint64_t RemoveFile(const std::string& file_path);

  [[nodiscard]] std::vector<SearchHit> Search(const SearchQuery& query) const;
  [[nodiscard]] std::vector<SearchHit> FindSimilarCode(const std::string& code_snippet,
                                                       int limit = 10,
                                                       float min_similarity = 0.5f) const;
  [[nodiscard]] std::vector<Symbol> FindByName(const std::string& name, int limit = 20) const;
  [[nodiscard]] ContextBlock BuildContext(const std::string& query) const;

  [[nodiscard]] std::vector<std::string> Autocomplete(const std::string& prefix, int limit = 10) const;
  [[nodiscard]] std::vector<std::pair<std::string, std::uint64_t>> PopularTerms(int limit = 20) const;

  void Clear();
  [[nodiscard]] CorpusStats Stats() const;
  void Persist();
  void Compact();

  [[nodiscard]] const EngineConfig& config() const { return config_; }
  [[nodiscard]] const std::shared_ptr<EmbeddingProvider>& embedder() const { return embedder_; }

 private:
  EngineConfig config_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  std::unique_ptr<Corpus> corpus_;
  std::unique_ptr<IndexingPipeline> pipeline_;
  std::unique_ptr<HybridRanker> ranker_;
  std::unique_ptr<ContextAssembler> assembler_;
};

}  // namespace codescope
