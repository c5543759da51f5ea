#include "codescope/hybrid_ranker.hpp"

#include "codescope/errors.hpp"
#include "codescope/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>

namespace codescope {
namespace {

constexpr float kEqualScoreEpsilon = 1e-6F;

bool ScoreLess(const FusedCandidate& lhs, const FusedCandidate& rhs) {
  const float lhs_score = std::isnan(lhs.score) ? 0.0F : lhs.score;
  const float rhs_score = std::isnan(rhs.score) ? 0.0F : rhs.score;
  if (lhs_score != rhs_score) {
    return lhs_score > rhs_score;
  }
  return lhs.id < rhs.id;
}

float ClampAlpha(float alpha) {
  return std::max(0.0F, std::min(1.0F, alpha));
}

bool IsLexicalMatch(float score) {
  return score > 0.0F && std::isfinite(score);
}

int ClampTopK(std::size_t requested, std::size_t available) {
  const auto capped = std::min(requested, available);
  return static_cast<int>(std::min<std::size_t>(capped, static_cast<std::size_t>(std::numeric_limits<int>::max())));
}

bool IsBlank(std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
  });
}

std::string Lowercase(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (const char ch : text) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  return out;
}

SearchHit MakeHit(Symbol symbol, const FusedCandidate& candidate) {
  SearchHit hit{};
  hit.id = symbol.id;
  hit.name = std::move(symbol.name);
  hit.kind = symbol.kind;
  hit.file_path = std::move(symbol.file_path);
  hit.start_line = symbol.start_line;
  hit.end_line = symbol.end_line;
  hit.code_text = std::move(symbol.code_text);
  hit.doc_text = std::move(symbol.doc_text);
  hit.score = candidate.score;
  hit.similarity = candidate.similarity;
  hit.lexical = candidate.lexical;
  return hit;
}

// Walks ranked candidates in order, loading their symbols in chunks and applying the
// kind and path filters, until `limit` hits are collected.
std::vector<SearchHit> AttachSymbols(const SymbolStore& store,
                                     const std::vector<FusedCandidate>& ranked,
                                     int limit,
                                     const std::optional<SymbolKind>& kind,
                                     const std::optional<std::string>& file_path_filter) {
  const auto wanted = static_cast<std::size_t>(std::max(0, limit));
  const auto chunk = std::min(std::max<std::size_t>(wanted, 16), std::max<std::size_t>(ranked.size(), 1));
  const std::string path_needle = file_path_filter.has_value() ? Lowercase(*file_path_filter) : std::string{};

  std::vector<SearchHit> out{};
  out.reserve(std::min(wanted, ranked.size()));
  for (std::size_t start = 0; start < ranked.size() && out.size() < wanted; start += chunk) {
    const auto end = std::min(ranked.size(), start + chunk);
    std::vector<SymbolId> ids{};
    ids.reserve(end - start);
    for (std::size_t i = start; i < end; ++i) {
      ids.push_back(ranked[i].id);
    }
    auto symbols = store.GetMany(ids);

    std::size_t cursor = 0;
    for (std::size_t i = start; i < end && out.size() < wanted; ++i) {
      if (cursor >= symbols.size() || symbols[cursor].id != ranked[i].id) {
        Logger()->debug("ranker: candidate {} has no stored symbol", ranked[i].id);
        continue;
      }
      auto& symbol = symbols[cursor++];
      if (kind.has_value() && symbol.kind != *kind) {
        continue;
      }
      if (!path_needle.empty() && Lowercase(symbol.file_path).find(path_needle) == std::string::npos) {
        continue;
      }
      out.push_back(MakeHit(std::move(symbol), ranked[i]));
    }
  }
  return out;
}

}  // namespace

std::vector<FusedCandidate> FuseCandidates(const std::vector<VectorHit>& vector_hits,
                                           const std::unordered_map<SymbolId, float>& lexical_scores,
                                           float alpha) {
  std::unordered_map<SymbolId, FusedCandidate> merged{};
  merged.reserve(vector_hits.size() + lexical_scores.size());
  for (const auto& [id, similarity] : vector_hits) {
    auto& candidate = merged[id];
    candidate.id = id;
    candidate.similarity = std::isnan(similarity) ? 0.0F : std::max(0.0F, similarity);
  }

  float min_lexical = std::numeric_limits<float>::max();
  float max_lexical = 0.0F;
  for (const auto& [id, score] : lexical_scores) {
    if (!IsLexicalMatch(score)) {
      continue;
    }
    min_lexical = std::min(min_lexical, score);
    max_lexical = std::max(max_lexical, score);
  }
  // Vector-only candidates sit at lexical 0 and pull the minimum down with them.
  const bool has_vector_only = std::any_of(vector_hits.begin(), vector_hits.end(), [&](const VectorHit& hit) {
    const auto it = lexical_scores.find(hit.first);
    return it == lexical_scores.end() || !IsLexicalMatch(it->second);
  });
  if (has_vector_only) {
    min_lexical = 0.0F;
  }
  const float range = max_lexical - min_lexical;
  for (const auto& [id, score] : lexical_scores) {
    if (!IsLexicalMatch(score)) {
      continue;
    }
    auto& candidate = merged[id];
    candidate.id = id;
    candidate.lexical = range <= kEqualScoreEpsilon ? 1.0F : (score - min_lexical) / range;
  }

  const float semantic_weight = ClampAlpha(alpha);
  std::vector<FusedCandidate> out{};
  out.reserve(merged.size());
  for (auto& [id, candidate] : merged) {
    candidate.score = semantic_weight * candidate.similarity + (1.0F - semantic_weight) * candidate.lexical;
    out.push_back(candidate);
  }
  std::sort(out.begin(), out.end(), ScoreLess);
  return out;
}

HybridRanker::HybridRanker(const Corpus& corpus, std::shared_ptr<EmbeddingProvider> embedder, RankerConfig config)
    : corpus_(corpus), embedder_(std::move(embedder)), config_(config) {
  if (embedder_ == nullptr) {
    throw ConfigurationError("hybrid ranker requires an embedding provider");
  }
}

std::vector<float> HybridRanker::EmbedQuery(const std::string& text) const {
  std::vector<float> embedding{};
  try {
    embedding = embedder_->Embed(text);
  } catch (const Error&) {
    throw;
  } catch (const std::exception& e) {
    throw ProviderError(std::string("ranker: query embedding failed: ") + e.what());
  }
  if (embedding.size() != static_cast<std::size_t>(corpus_.dimensions())) {
    throw ProviderError("ranker: query embedding has " + std::to_string(embedding.size()) +
                        " dimensions, corpus expects " + std::to_string(corpus_.dimensions()));
  }
  return embedding;
}

std::vector<SearchHit> HybridRanker::Search(const SearchQuery& query) const {
  if (IsBlank(query.text)) {
    return {};
  }
  const int limit = query.limit > 0 ? query.limit : config_.default_limit;
  const float threshold = query.min_similarity.value_or(config_.min_similarity);
  const auto embedding = EmbedQuery(query.text);

  const auto view = corpus_.Read();
  const auto& vectors = view.vectors();
  const auto& lexical = view.lexical();
  if (vectors.Size() == 0 && lexical.Stats().documents == 0) {
    return {};
  }

  // Filters apply after fusion, so a filtered query ranks the whole vector set.
  const bool filtered = query.kind.has_value() || query.file_path_filter.has_value();
  const auto oversampled = std::max(static_cast<std::size_t>(limit) *
                                        static_cast<std::size_t>(std::max(1, config_.vector_oversample)),
                                    static_cast<std::size_t>(std::max(0, config_.min_vector_candidates)));
  const int vector_candidates = ClampTopK(filtered ? vectors.Size() : oversampled, vectors.Size());
  auto vector_hits = vectors.Search(embedding, vector_candidates);
  const auto lexical_scores = lexical.Score(query.text);

  std::unordered_set<SymbolId> seen{};
  seen.reserve(vector_hits.size());
  for (const auto& hit : vector_hits) {
    seen.insert(hit.first);
  }
  for (const auto& [id, _] : lexical_scores) {
    if (seen.count(id) != 0) {
      continue;
    }
    if (const auto similarity = vectors.Similarity(embedding, id); similarity.has_value()) {
      vector_hits.emplace_back(id, *similarity);
    }
  }

  auto ranked = FuseCandidates(vector_hits, lexical_scores, config_.alpha);
  const auto below = std::find_if(ranked.begin(), ranked.end(), [&](const FusedCandidate& candidate) {
    return candidate.score < threshold;
  });
  ranked.erase(below, ranked.end());

  auto hits = AttachSymbols(view.store(), ranked, limit, query.kind, query.file_path_filter);
  Logger()->debug("ranker: '{}' -> {} candidates, {} hits", query.text, ranked.size(), hits.size());
  return hits;
}

std::vector<SearchHit> HybridRanker::FindSimilarCode(const std::string& code_snippet,
                                                     int limit,
                                                     float min_similarity) const {
  if (IsBlank(code_snippet)) {
    return {};
  }
  const int wanted = limit > 0 ? limit : config_.default_limit;
  const auto embedding = EmbedQuery(code_snippet);

  const auto view = corpus_.Read();
  std::vector<FusedCandidate> ranked{};
  const int top_k = ClampTopK(static_cast<std::size_t>(wanted), view.vectors().Size());
  for (const auto& [id, similarity] : view.vectors().Search(embedding, top_k)) {
    if (similarity < min_similarity) {
      break;
    }
    FusedCandidate candidate{};
    candidate.id = id;
    candidate.similarity = std::max(0.0F, similarity);
    candidate.score = candidate.similarity;
    ranked.push_back(candidate);
  }
  return AttachSymbols(view.store(), ranked, wanted, std::nullopt, std::nullopt);
}

}  // namespace codescope
