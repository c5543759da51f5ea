#pragma once

#include "codescope/types.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace codescope {

struct WeightedTerm {
  std::string term;
  float weight = 1.0f;
  bool allow_prefix = false;
};

struct LexicalStats {
  std::uint64_t documents = 0;
  std::uint64_t unique_terms = 0;
  double average_document_length = 0.0;
};

// Inverted index with BM25 scoring. Document frequency of a term is the size of its
// posting list, so it can never go negative.
class LexicalIndex {
 public:
  explicit LexicalIndex(LexicalConfig config = {});

  void StageIndex(SymbolId id, TermVector term_vector);
  void StageRemove(SymbolId id);
  void CommitStaged();
  void RollbackStaged();
  [[nodiscard]] std::size_t PendingMutationCount() const;

  void Index(SymbolId id, TermVector term_vector);
  void Remove(SymbolId id);
  void Clear();

  // Tokenizes, expands and weights a free-text query the same way documents were indexed.
  [[nodiscard]] std::vector<WeightedTerm> QueryTerms(std::string_view query) const;

  // Documents matching none of the terms are absent from the result.
  [[nodiscard]] std::unordered_map<SymbolId, float> Score(const std::vector<WeightedTerm>& query_terms) const;
  [[nodiscard]] std::unordered_map<SymbolId, float> Score(std::string_view query) const;

  [[nodiscard]] std::vector<std::string> Autocomplete(std::string_view prefix, int limit) const;
  [[nodiscard]] std::vector<std::pair<std::string, std::uint64_t>> PopularTerms(int limit) const;

  [[nodiscard]] bool Contains(SymbolId id) const;
  [[nodiscard]] std::uint64_t DocumentFrequency(const std::string& term) const;
  [[nodiscard]] LexicalStats Stats() const;
  [[nodiscard]] const LexicalConfig& config() const { return config_; }

 private:
  enum class PendingMutationType {
    kIndex,
    kRemove,
  };
  struct PendingMutation {
    PendingMutationType type = PendingMutationType::kIndex;
    SymbolId id = 0;
    TermVector terms{};
  };
  struct Document {
    TermVector terms;
    std::uint64_t length = 0;
  };

  void ApplyIndex(SymbolId id, TermVector terms);
  void ApplyRemove(SymbolId id);
  [[nodiscard]] double Idf(std::uint64_t document_frequency) const;
  [[nodiscard]] double TermScore(std::uint32_t tf, std::uint64_t document_length, double idf) const;

  LexicalConfig config_;
  std::map<std::string, std::unordered_map<SymbolId, std::uint32_t>, std::less<>> postings_;
  std::unordered_map<SymbolId, Document> documents_;
  std::uint64_t total_length_ = 0;
  std::vector<PendingMutation> pending_mutations_;
};

}  // namespace codescope
