#include "codescope/context_assembler.hpp"

#include "codescope/logging.hpp"

#include <string>
#include <utility>

namespace codescope {
namespace {

constexpr const char* kSeparator = "\n---\n";

std::string FormatSection(std::size_t ordinal, const SearchHit& hit) {
  std::string section = "[" + std::to_string(ordinal) + "] File: " + hit.file_path + ":" +
                        std::to_string(hit.start_line) + "-" + std::to_string(hit.end_line) + "\n";
  section.append("Function/Class: ");
  section.append(hit.name);
  section.append(" (");
  section.append(SymbolKindName(hit.kind));
  section.append(")\nCode:\n");
  section.append(hit.code_text);
  section.push_back('\n');
  if (hit.doc_text.has_value() && !hit.doc_text->empty()) {
    section.append("Description: ");
    section.append(*hit.doc_text);
    section.push_back('\n');
  }
  return section;
}

}  // namespace

ContextBlock AssembleContext(const std::string& query, const std::vector<SearchHit>& hits, std::size_t max_chars) {
  ContextBlock block{};
  block.query = query;

  std::vector<std::string> sections{};
  sections.reserve(hits.size());
  std::size_t total = 0;
  for (std::size_t i = 0; i < hits.size(); ++i) {
    sections.push_back(FormatSection(i + 1, hits[i]));
    total += sections.back().size() + (i > 0 ? std::char_traits<char>::length(kSeparator) : 0);
  }
  while (!sections.empty() && total > max_chars) {
    total -= sections.back().size();
    if (sections.size() > 1) {
      total -= std::char_traits<char>::length(kSeparator);
    }
    sections.pop_back();
  }
  block.dropped_results = hits.size() - sections.size();

  for (std::size_t i = 0; i < sections.size(); ++i) {
    if (i > 0) {
      block.text.append(kSeparator);
    }
    block.text.append(sections[i]);

    const auto& hit = hits[i];
    Citation citation{};
    citation.id = hit.id;
    citation.symbol = hit.name;
    citation.file_path = hit.file_path;
    citation.start_line = hit.start_line;
    citation.end_line = hit.end_line;
    citation.similarity = hit.score;
    block.citations.push_back(std::move(citation));
  }
  block.grounded = !block.citations.empty();
  return block;
}

ContextAssembler::ContextAssembler(const HybridRanker& ranker, ContextConfig config)
    : ranker_(ranker), config_(config) {}

ContextBlock ContextAssembler::Build(const std::string& query) const {
  SearchQuery search{};
  search.text = query;
  search.limit = config_.limit;
  search.min_similarity = config_.min_similarity;
  const auto hits = ranker_.Search(search);

  auto block = AssembleContext(query, hits, config_.max_context_chars);
  if (!block.grounded && block.dropped_results > 0) {
    Logger()->warn("context: all {} results for '{}' exceed the {} char budget", block.dropped_results, query,
                   config_.max_context_chars);
  } else if (!block.grounded) {
    Logger()->info("context: no grounding for '{}'", query);
  } else if (block.dropped_results > 0) {
    Logger()->debug("context: dropped {} results over the {} char budget", block.dropped_results,
                    config_.max_context_chars);
  }
  return block;
}

}  // namespace codescope
