#pragma once

#include "codescope/hybrid_ranker.hpp"
#include "codescope/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace codescope {

// Formats ranked hits into a citation-annotated block of at most max_chars characters.
// Whole sections are dropped from the lowest-ranked end until the block fits.
[[nodiscard]] ContextBlock AssembleContext(const std::string& query,
                                           const std::vector<SearchHit>& hits,
                                           std::size_t max_chars);

class ContextAssembler {
 public:
  ContextAssembler(const HybridRanker& ranker, ContextConfig config);

  // grounded is false when nothing ranked above ContextConfig::min_similarity or when even
  // the top hit does not fit in max_context_chars; dropped_results separates the two.
  [[nodiscard]] ContextBlock Build(const std::string& query) const;

 private:
  const HybridRanker& ranker_;
  ContextConfig config_;
};

}  // namespace codescope
