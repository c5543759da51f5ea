#pragma once

#include "codescope/corpus.hpp"
#include "codescope/embeddings.hpp"
#include "codescope/types.hpp"
#include "codescope/vector_index.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace codescope {

struct FusedCandidate {
  SymbolId id = 0;
  float similarity = 0.0f;
  float lexical = 0.0f;
  float score = 0.0f;
};

// Combines both channels over their union. Negative cosine counts as 0; lexical scores are
// min-max normalised over the union, where vector-only candidates count as lexical 0
// (a single or all-equal set maps to 1.0).
// Result is sorted by score descending, ties by ascending id.
[[nodiscard]] std::vector<FusedCandidate> FuseCandidates(const std::vector<VectorHit>& vector_hits,
                                                         const std::unordered_map<SymbolId, float>& lexical_scores,
                                                         float alpha);

// Read path over a Corpus.
class HybridRanker {
 public:
  HybridRanker(const Corpus& corpus, std::shared_ptr<EmbeddingProvider> embedder, RankerConfig config);

  // Throws ProviderError when the query cannot be embedded; an empty result means no match.
  [[nodiscard]] std::vector<SearchHit> Search(const SearchQuery& query) const;

  // Ranks by embedding similarity to a code snippet only.
  [[nodiscard]] std::vector<SearchHit> FindSimilarCode(const std::string& code_snippet,
                                                       int limit,
                                                       float min_similarity) const;

  [[nodiscard]] const RankerConfig& config() const { return config_; }

 private:
  [[nodiscard]] std::vector<float> EmbedQuery(const std::string& text) const;

  const Corpus& corpus_;
  std::shared_ptr<EmbeddingProvider> embedder_;
  RankerConfig config_;
};

}  // namespace codescope
