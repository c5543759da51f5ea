#include "codescope/types.hpp"
#include "codescope/errors.hpp"

#include "sha256.hpp"

#include <cmath>
#include <string>

namespace codescope {

void KindCounts::Add(SymbolKind kind, std::uint64_t n) {
  switch (kind) {
    case SymbolKind::kFunction:
      functions += n;
      return;
    case SymbolKind::kClass:
      classes += n;
      return;
    case SymbolKind::kMethod:
      methods += n;
      return;
  }
}

std::uint64_t KindCounts::Get(SymbolKind kind) const {
  switch (kind) {
    case SymbolKind::kFunction:
      return functions;
    case SymbolKind::kClass:
      return classes;
    case SymbolKind::kMethod:
      return methods;
  }
  return 0;
}

const char* SymbolKindName(SymbolKind kind) {
  switch (kind) {
    case SymbolKind::kFunction:
      return "function";
    case SymbolKind::kClass:
      return "class";
    case SymbolKind::kMethod:
      return "method";
  }
  return "unknown";
}

SymbolKind ParseSymbolKind(const std::string& name) {
  for (const auto kind : kAllSymbolKinds) {
    if (name == SymbolKindName(kind)) {
      return kind;
    }
  }
  throw ConfigurationError("unknown symbol kind: '" + name + "'");
}

const char* FailureCategoryName(FailureCategory category) {
  switch (category) {
    case FailureCategory::kMalformedSymbol:
      return "malformed_symbol";
    case FailureCategory::kConfiguration:
      return "configuration";
    case FailureCategory::kProvider:
      return "provider";
    case FailureCategory::kStore:
      return "store";
  }
  return "unknown";
}

SymbolId MakeSymbolId(const std::string& file_path, const std::string& name, int start_line) {
  core::Sha256 hasher;
  hasher.Update(file_path);
  hasher.Update(std::string_view("\x1F", 1));
  hasher.Update(name);
  hasher.Update(std::string_view("\x1F", 1));
  hasher.Update(std::to_string(start_line));
  const auto digest = hasher.Finalize();

  SymbolId id = 0;
  for (std::size_t i = 0; i < sizeof(id); ++i) {
    id = (id << 8U) | std::to_integer<std::uint64_t>(digest[i]);
  }
  // Keep ids representable as a non-negative SQLite INTEGER.
  return id & 0x7FFFFFFFFFFFFFFFULL;
}

std::string ContentHash(const std::string& code_text) {
  const auto digest = core::Sha256Of(code_text);
  return core::ToHex(digest);
}

void ValidateConfig(const EngineConfig& config) {
  if (config.corpus.dimensions <= 0) {
    throw ConfigurationError("config: corpus.dimensions must be positive");
  }
  const auto& lexical = config.lexical;
  if (!(lexical.k1 >= 0.0f) || !std::isfinite(lexical.k1)) {
    throw ConfigurationError("config: lexical.k1 must be a non-negative number");
  }
  if (!(lexical.b >= 0.0f && lexical.b <= 1.0f)) {
    throw ConfigurationError("config: lexical.b must be within [0, 1]");
  }
  if (!(lexical.expanded_term_weight >= 0.0f && lexical.expanded_term_weight <= 1.0f) ||
      !(lexical.prefix_match_weight >= 0.0f && lexical.prefix_match_weight <= 1.0f)) {
    throw ConfigurationError("config: lexical match weights must be within [0, 1]");
  }
  if (!(config.ranker.alpha >= 0.0f && config.ranker.alpha <= 1.0f)) {
    throw ConfigurationError("config: ranker.alpha must be within [0, 1]");
  }
  if (!std::isfinite(config.ranker.min_similarity) || !std::isfinite(config.context.min_similarity)) {
    throw ConfigurationError("config: min_similarity must be finite");
  }
  if (config.ranker.default_limit <= 0 || config.ranker.min_vector_candidates <= 0 ||
      config.ranker.vector_oversample <= 0) {
    throw ConfigurationError("config: ranker limits must be positive");
  }
  if (config.context.limit <= 0) {
    throw ConfigurationError("config: context.limit must be positive");
  }
  if (config.pipeline.batch_size <= 0 || config.pipeline.embed_concurrency <= 0 ||
      config.pipeline.min_batch_for_bulk <= 0) {
    throw ConfigurationError("config: pipeline sizes must be positive");
  }
}

}  // namespace codescope
