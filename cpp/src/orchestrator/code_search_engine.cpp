#include "codescope/code_search_engine.hpp"

#include "codescope/errors.hpp"
#include "codescope/logging.hpp"

#include <utility>

namespace codescope {
namespace {

constexpr int kDefaultDimensions = 384;

std::shared_ptr<EmbeddingProvider> ResolveEmbedder(const EngineConfig& config,
                                                   std::shared_ptr<EmbeddingProvider> embedder) {
  if (embedder != nullptr) {
    return embedder;
  }
  const int dimensions = config.corpus.dimensions > 0 ? config.corpus.dimensions : kDefaultDimensions;
  return std::make_shared<HashingEmbeddingProvider>(dimensions);
}

EngineConfig ResolveConfig(EngineConfig config, const EmbeddingProvider& embedder) {
  if (config.corpus.dimensions == 0) {
    config.corpus.dimensions = embedder.dimensions();
  } else if (config.corpus.dimensions != embedder.dimensions()) {
    throw DimensionMismatchError("engine config", static_cast<std::size_t>(config.corpus.dimensions),
                                 static_cast<std::size_t>(embedder.dimensions()));
  }
  ValidateConfig(config);
  return config;
}

}  // namespace

CodeSearchEngine::CodeSearchEngine(EngineConfig config, std::shared_ptr<EmbeddingProvider> embedder)
    : embedder_(ResolveEmbedder(config, std::move(embedder))) {
  config_ = ResolveConfig(std::move(config), *embedder_);
  corpus_ = std::make_unique<Corpus>(config_.corpus, config_.lexical);
  pipeline_ = std::make_unique<IndexingPipeline>(*corpus_, embedder_, config_.pipeline);
  ranker_ = std::make_unique<HybridRanker>(*corpus_, embedder_, config_.ranker);
  assembler_ = std::make_unique<ContextAssembler>(*ranker_, config_.context);

  const auto stats = corpus_->Stats();
  Logger()->info("engine: opened corpus with {} symbols in {} files (dimensions {}, version {})", stats.symbols,
                 stats.files, stats.dimensions, stats.version);
}

RunStats CodeSearchEngine::Index(const std::vector<Symbol>& symbols, const CancellationToken* cancel) {
  return pipeline_->Run(symbols, cancel);
}

std::uint64_t CodeSearchEngine::Remove(const std::vector<SymbolId>& ids) {
  return pipeline_->Remove(ids);
}

std::uint64_t CodeSearchEngine::RemoveFile(const std::string& file_path) {
  return pipeline_->RemoveFile(file_path);
}

std::vector<SearchHit> CodeSearchEngine::Search(const SearchQuery& query) const {
  return ranker_->Search(query);
}

std::vector<SearchHit> CodeSearchEngine::FindSimilarCode(const std::string& code_snippet,
                                                         int limit,
                                                         float min_similarity) const {
  return ranker_->FindSimilarCode(code_snippet, limit, min_similarity);
}

std::vector<Symbol> CodeSearchEngine::FindByName(const std::string& name, int limit) const {
  const auto view = corpus_->Read();
  return view.store().FindByName(name, limit);
}

ContextBlock CodeSearchEngine::BuildContext(const std::string& query) const {
  return assembler_->Build(query);
}

std::vector<std::string> CodeSearchEngine::Autocomplete(const std::string& prefix, int limit) const {
  const auto view = corpus_->Read();
  return view.lexical().Autocomplete(prefix, limit);
}

std::vector<std::pair<std::string, std::uint64_t>> CodeSearchEngine::PopularTerms(int limit) const {
  const auto view = corpus_->Read();
  return view.lexical().PopularTerms(limit);
}

void CodeSearchEngine::Clear() {
  corpus_->Clear();
}

CorpusStats CodeSearchEngine::Stats() const {
  return corpus_->Stats();
}

void CodeSearchEngine::Persist() {
  corpus_->Persist();
}

void CodeSearchEngine::Compact() {
  pipeline_->Compact();
}

}  // namespace codescope
