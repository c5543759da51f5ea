#pragma once

#include "codescope/types.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace codescope {

// Lowercased terms split on non-alphanumerics and on camelCase / snake_case boundaries.
// Letters keep trailing digits ("utf8"); code stopwords and short tokens are dropped.
[[nodiscard]] std::vector<std::string> Tokenize(std::string_view text, std::size_t min_token_length = 2);

// Strips one common English suffix when at least three characters remain.
[[nodiscard]] std::string Stem(std::string_view word);

struct ExpandedTerm {
  std::string term;
  bool original = true;
};

// Original tokens first, then stems and synonyms not already present.
[[nodiscard]] std::vector<ExpandedTerm> ExpandQuery(const std::vector<std::string>& tokens);

// name x3, doc x2, code x1 and the kind name once.
[[nodiscard]] TermVector BuildTermVector(const Symbol& symbol, std::size_t min_token_length = 2);

// Text handed to the embedding provider for a symbol.
[[nodiscard]] std::string EmbeddingText(const Symbol& symbol);

}  // namespace codescope
