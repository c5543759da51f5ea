#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace codescope {

using SymbolId = std::uint64_t;
using TermVector = std::unordered_map<std::string, std::uint32_t>;

enum class SymbolKind : std::uint8_t {
  kFunction = 0,
  kClass = 1,
  kMethod = 2,
};

inline constexpr SymbolKind kAllSymbolKinds[] = {
    SymbolKind::kFunction,
    SymbolKind::kClass,
    SymbolKind::kMethod,
};

struct Symbol {
  SymbolId id = 0;
  std::string name;
  SymbolKind kind = SymbolKind::kFunction;
  std::string file_path;
  int start_line = 0;
  int end_line = 0;
  std::string code_text;
  std::optional<std::string> doc_text;
  std::string content_hash;
};

struct IndexEntry {
  std::vector<float> embedding;
  TermVector term_vector;
};

// Per-kind counters, one named field per SymbolKind.
struct KindCounts {
  std::uint64_t functions = 0;
  std::uint64_t classes = 0;
  std::uint64_t methods = 0;

  void Add(SymbolKind kind, std::uint64_t n = 1);
  [[nodiscard]] std::uint64_t Get(SymbolKind kind) const;
};

enum class FailureCategory {
  kMalformedSymbol,
  kConfiguration,
  kProvider,
  kStore,
};

struct SymbolFailure {
  std::size_t position = 0;
  std::optional<SymbolId> id;
  std::string name;
  FailureCategory category = FailureCategory::kMalformedSymbol;
  std::string message;
};

struct RunStats {
  std::uint64_t processed = 0;
  std::uint64_t succeeded = 0;
  std::uint64_t skipped_unchanged = 0;
  std::uint64_t failed = 0;
  KindCounts by_kind{};
  std::uint64_t total_lines = 0;
  std::chrono::milliseconds elapsed{0};
  bool cancelled = false;
  std::vector<SymbolFailure> failures;
};

struct CorpusStats {
  std::uint64_t symbols = 0;
  std::uint64_t files = 0;
  KindCounts by_kind{};
  std::uint64_t vectors = 0;
  std::uint64_t vector_tombstones = 0;
  std::uint64_t lexical_documents = 0;
  std::uint64_t unique_terms = 0;
  std::uint64_t version = 0;
  int dimensions = 0;
};

struct SearchQuery {
  std::string text;
  // Non-positive falls back to RankerConfig::default_limit.
  int limit = 0;
  std::optional<float> min_similarity;
  std::optional<SymbolKind> kind;
  std::optional<std::string> file_path_filter;
};

struct SearchHit {
  SymbolId id = 0;
  std::string name;
  SymbolKind kind = SymbolKind::kFunction;
  std::string file_path;
  int start_line = 0;
  int end_line = 0;
  std::string code_text;
  std::optional<std::string> doc_text;
  float score = 0.0f;
  float similarity = 0.0f;
  float lexical = 0.0f;
};

struct Citation {
  SymbolId id = 0;
  std::string symbol;
  std::string file_path;
  int start_line = 0;
  int end_line = 0;
  // Combined ranking score of the cited hit.
  float similarity = 0.0f;
};

struct ContextBlock {
  std::string query;
  std::string text;
  std::vector<Citation> citations;
  // True when at least one section made it into text. False either because nothing ranked
  // above the threshold (dropped_results == 0) or because every hit exceeded the budget
  // (dropped_results > 0).
  bool grounded = false;
  std::size_t dropped_results = 0;
};

struct LexicalConfig {
  float k1 = 1.5f;
  float b = 0.75f;
  std::size_t min_token_length = 2;
  bool enable_query_expansion = true;
  float expanded_term_weight = 0.7f;
  bool enable_prefix_match = true;
  std::size_t prefix_min_length = 3;
  float prefix_match_weight = 0.5f;
};

// alpha weights the semantic channel: combined = alpha * similarity + (1 - alpha) * lexical.
// 1.0 ranks purely by embedding similarity, 0.0 purely by term score.
struct RankerConfig {
  float alpha = 0.7f;
  float min_similarity = 0.0f;
  int default_limit = 20;
  int min_vector_candidates = 50;
  int vector_oversample = 3;
};

struct ContextConfig {
  int limit = 5;
  float min_similarity = 0.3f;
  std::size_t max_context_chars = 6000;
};

struct PipelineConfig {
  int batch_size = 16;
  int min_batch_for_bulk = 2;
  int embed_concurrency = 2;
};

struct CorpusConfig {
  int dimensions = 0;
  // Empty keeps everything in memory and disables Persist().
  std::filesystem::path data_dir;
};

struct EngineConfig {
  CorpusConfig corpus{};
  LexicalConfig lexical{};
  RankerConfig ranker{};
  ContextConfig context{};
  PipelineConfig pipeline{};
};

[[nodiscard]] const char* SymbolKindName(SymbolKind kind);
[[nodiscard]] SymbolKind ParseSymbolKind(const std::string& name);
[[nodiscard]] const char* FailureCategoryName(FailureCategory category);

[[nodiscard]] SymbolId MakeSymbolId(const std::string& file_path, const std::string& name, int start_line);
[[nodiscard]] std::string ContentHash(const std::string& code_text);

void ValidateConfig(const EngineConfig& config);

}  // namespace codescope
