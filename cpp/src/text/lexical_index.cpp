#include "codescope/lexical_index.hpp"

#include "codescope/tokenizer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace codescope {
namespace {

bool StartsWith(std::string_view text, std::string_view prefix) {
  return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

std::string Lowercase(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char ch : text) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  return out;
}

bool TermFrequencyLess(const std::pair<std::string, std::uint64_t>& lhs,
                       const std::pair<std::string, std::uint64_t>& rhs) {
  if (lhs.second != rhs.second) {
    return lhs.second > rhs.second;
  }
  return lhs.first < rhs.first;
}

}  // namespace

LexicalIndex::LexicalIndex(LexicalConfig config) : config_(config) {}

void LexicalIndex::StageIndex(SymbolId id, TermVector term_vector) {
  pending_mutations_.push_back(PendingMutation{PendingMutationType::kIndex, id, std::move(term_vector)});
}

void LexicalIndex::StageRemove(SymbolId id) {
  pending_mutations_.push_back(PendingMutation{PendingMutationType::kRemove, id, {}});
}

void LexicalIndex::CommitStaged() {
  for (auto& mutation : pending_mutations_) {
    if (mutation.type == PendingMutationType::kIndex) {
      ApplyIndex(mutation.id, std::move(mutation.terms));
      continue;
    }
    ApplyRemove(mutation.id);
  }
  pending_mutations_.clear();
}

void LexicalIndex::RollbackStaged() {
  pending_mutations_.clear();
}

std::size_t LexicalIndex::PendingMutationCount() const {
  return pending_mutations_.size();
}

void LexicalIndex::Index(SymbolId id, TermVector term_vector) {
  StageIndex(id, std::move(term_vector));
  CommitStaged();
}

void LexicalIndex::Remove(SymbolId id) {
  StageRemove(id);
  CommitStaged();
}

void LexicalIndex::Clear() {
  postings_.clear();
  documents_.clear();
  total_length_ = 0;
  pending_mutations_.clear();
}

void LexicalIndex::ApplyIndex(SymbolId id, TermVector terms) {
  ApplyRemove(id);

  Document doc{};
  for (auto it = terms.begin(); it != terms.end();) {
    if (it->second == 0) {
      it = terms.erase(it);
      continue;
    }
    postings_[it->first][id] = it->second;
    doc.length += it->second;
    ++it;
  }
  doc.terms = std::move(terms);
  total_length_ += doc.length;
  documents_.emplace(id, std::move(doc));
}

void LexicalIndex::ApplyRemove(SymbolId id) {
  const auto doc_it = documents_.find(id);
  if (doc_it == documents_.end()) {
    return;
  }
  for (const auto& [term, _] : doc_it->second.terms) {
    const auto posting_it = postings_.find(term);
    if (posting_it == postings_.end()) {
      continue;
    }
    posting_it->second.erase(id);
    if (posting_it->second.empty()) {
      postings_.erase(posting_it);
    }
  }
  total_length_ -= std::min(total_length_, doc_it->second.length);
  documents_.erase(doc_it);
}

double LexicalIndex::Idf(std::uint64_t document_frequency) const {
  const auto n = static_cast<double>(documents_.size());
  const auto df = static_cast<double>(document_frequency);
  return std::log((n - df + 0.5) / (df + 0.5) + 1.0);
}

double LexicalIndex::TermScore(std::uint32_t tf, std::uint64_t document_length, double idf) const {
  const double average_length =
      documents_.empty() ? 1.0 : static_cast<double>(total_length_) / static_cast<double>(documents_.size());
  const double length_ratio = average_length > 0.0 ? static_cast<double>(document_length) / average_length : 1.0;
  const double k1 = config_.k1;
  const double b = config_.b;
  const double f = static_cast<double>(tf);
  return idf * (f * (k1 + 1.0)) / (f + k1 * (1.0 - b + b * length_ratio));
}

std::vector<WeightedTerm> LexicalIndex::QueryTerms(std::string_view query) const {
  const auto tokens = Tokenize(query, config_.min_token_length);
  std::vector<WeightedTerm> out{};
  auto allow_prefix = [&](const std::string& term) {
    return config_.enable_prefix_match && term.size() >= config_.prefix_min_length;
  };

  if (!config_.enable_query_expansion) {
    for (const auto& token : tokens) {
      out.push_back(WeightedTerm{token, 1.0f, allow_prefix(token)});
    }
    return out;
  }
  for (auto& expanded : ExpandQuery(tokens)) {
    const float weight = expanded.original ? 1.0f : config_.expanded_term_weight;
    const bool prefix = allow_prefix(expanded.term);
    out.push_back(WeightedTerm{std::move(expanded.term), weight, prefix});
  }
  return out;
}

std::unordered_map<SymbolId, float> LexicalIndex::Score(const std::vector<WeightedTerm>& query_terms) const {
  std::unordered_map<SymbolId, float> scores{};
  if (documents_.empty() || query_terms.empty()) {
    return scores;
  }

  std::unordered_map<SymbolId, double> best{};
  auto accumulate = [&](const std::unordered_map<SymbolId, std::uint32_t>& posting, double weight) {
    const double idf = Idf(posting.size());
    for (const auto& [id, tf] : posting) {
      const auto doc_it = documents_.find(id);
      if (doc_it == documents_.end()) {
        continue;
      }
      const double contribution = weight * TermScore(tf, doc_it->second.length, idf);
      auto& slot = best[id];
      slot = std::max(slot, contribution);
    }
  };

  for (const auto& query_term : query_terms) {
    if (query_term.term.empty() || query_term.weight <= 0.0f) {
      continue;
    }
    best.clear();
    if (const auto exact = postings_.find(query_term.term); exact != postings_.end()) {
      accumulate(exact->second, query_term.weight);
    }
    if (query_term.allow_prefix) {
      for (auto it = postings_.upper_bound(query_term.term);
           it != postings_.end() && StartsWith(it->first, query_term.term);
           ++it) {
        accumulate(it->second, static_cast<double>(query_term.weight) * config_.prefix_match_weight);
      }
    }
    for (const auto& [id, value] : best) {
      if (value > 0.0) {
        scores[id] += static_cast<float>(value);
      }
    }
  }
  return scores;
}

std::unordered_map<SymbolId, float> LexicalIndex::Score(std::string_view query) const {
  return Score(QueryTerms(query));
}

std::vector<std::string> LexicalIndex::Autocomplete(std::string_view prefix, int limit) const {
  if (limit <= 0 || prefix.size() < 2) {
    return {};
  }
  const auto lowered = Lowercase(prefix);
  std::vector<std::pair<std::string, std::uint64_t>> matches{};
  for (auto it = postings_.lower_bound(lowered); it != postings_.end() && StartsWith(it->first, lowered); ++it) {
    matches.emplace_back(it->first, it->second.size());
  }
  std::sort(matches.begin(), matches.end(), TermFrequencyLess);
  if (matches.size() > static_cast<std::size_t>(limit)) {
    matches.resize(static_cast<std::size_t>(limit));
  }
  std::vector<std::string> out{};
  out.reserve(matches.size());
  for (auto& [term, _] : matches) {
    out.push_back(std::move(term));
  }
  return out;
}

std::vector<std::pair<std::string, std::uint64_t>> LexicalIndex::PopularTerms(int limit) const {
  if (limit <= 0) {
    return {};
  }
  std::vector<std::pair<std::string, std::uint64_t>> terms{};
  terms.reserve(postings_.size());
  for (const auto& [term, posting] : postings_) {
    terms.emplace_back(term, posting.size());
  }
  const auto keep = std::min(terms.size(), static_cast<std::size_t>(limit));
  std::partial_sort(terms.begin(), terms.begin() + static_cast<std::ptrdiff_t>(keep), terms.end(), TermFrequencyLess);
  terms.resize(keep);
  return terms;
}

bool LexicalIndex::Contains(SymbolId id) const {
  return documents_.find(id) != documents_.end();
}

std::uint64_t LexicalIndex::DocumentFrequency(const std::string& term) const {
  const auto it = postings_.find(term);
  return it == postings_.end() ? 0 : it->second.size();
}

LexicalStats LexicalIndex::Stats() const {
  LexicalStats stats{};
  stats.documents = documents_.size();
  stats.unique_terms = postings_.size();
  stats.average_document_length =
      documents_.empty() ? 0.0 : static_cast<double>(total_length_) / static_cast<double>(documents_.size());
  return stats;
}

}  // namespace codescope
