#include "codescope/completion.hpp"
#include "codescope/context_assembler.hpp"
#include "codescope/corpus.hpp"
#include "codescope/embeddings.hpp"
#include "codescope/indexing_pipeline.hpp"

#include "../test_logger.hpp"

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

codescope::SearchHit MakeHit(codescope::SymbolId id, const std::string& name, const std::string& code) {
  codescope::SearchHit hit{};
  hit.id = id;
  hit.name = name;
  hit.kind = codescope::SymbolKind::kFunction;
  hit.file_path = "src/" + name + ".py";
  hit.start_line = 10;
  hit.end_line = 12;
  hit.code_text = code;
  hit.score = 0.8F;
  hit.similarity = 0.6F;
  return hit;
}

void ScenarioSectionFormat() {
  codescope::tests::Log("scenario: section format");
  auto hit = MakeHit(1, "load_config", "def load_config():\n    pass");
  hit.doc_text = std::string("Reads settings");
  auto second = MakeHit(2, "save_config", "def save_config():\n    pass");
  second.kind = codescope::SymbolKind::kMethod;

  const auto block = codescope::AssembleContext("config", {hit, second}, 10000);
  const std::string expected =
      "[1] File: src/load_config.py:10-12\n"
      "Function/Class: load_config (function)\n"
      "Code:\n"
      "def load_config():\n    pass\n"
      "Description: Reads settings\n"
      "\n---\n"
      "[2] File: src/save_config.py:10-12\n"
      "Function/Class: save_config (method)\n"
      "Code:\n"
      "def save_config():\n    pass\n";
  Require(block.text == expected, "context text mismatch");
  Require(block.query == "config", "query must be echoed");
  Require(block.grounded && block.dropped_results == 0, "both hits must be kept");
  Require(block.citations.size() == 2, "one citation per hit");
  Require(block.citations[0].symbol == "load_config" && block.citations[0].start_line == 10 &&
              block.citations[0].end_line == 12 && block.citations[0].similarity == 0.8F,
          "citation fields mismatch");
}

void ScenarioBudgetDropsLowestRanked() {
  codescope::tests::Log("scenario: budget drops lowest ranked");
  const std::vector<codescope::SearchHit> hits = {
      MakeHit(1, "first", std::string(100, 'a')),
      MakeHit(2, "second", std::string(100, 'b')),
      MakeHit(3, "third", std::string(100, 'c')),
  };
  const auto full = codescope::AssembleContext("q", hits, 100000);
  const auto one_section = codescope::AssembleContext("q", {hits[0]}, 100000).text.size();

  const auto tight = codescope::AssembleContext("q", hits, one_section + 10);
  Require(tight.citations.size() == 1 && tight.citations[0].id == 1, "only the top hit may fit");
  Require(tight.dropped_results == 2, "dropped count mismatch");
  Require(tight.text.size() <= one_section + 10, "context must respect the budget");

  const auto exact = codescope::AssembleContext("q", hits, full.text.size());
  Require(exact.citations.size() == 3 && exact.text == full.text, "an exact fit must keep everything");

  const auto none = codescope::AssembleContext("q", hits, 5);
  Require(!none.grounded && none.text.empty() && none.dropped_results == 3, "nothing fits in 5 chars");
  const auto unmatched = codescope::AssembleContext("q", {}, 1000);
  Require(!unmatched.grounded && unmatched.dropped_results == 0,
          "no hits means no grounding, told apart from an over-budget block by dropped_results");
}

void ScenarioGroundedPrompt() {
  codescope::tests::Log("scenario: grounded prompt");
  const auto block = codescope::AssembleContext("how is config loaded?",
                                                {MakeHit(1, "load_config", "def load_config():\n    pass")}, 10000);
  const auto prompt = codescope::ComposeGroundedPrompt("how is config loaded?", block);
  Require(prompt.rfind("Question: how is config loaded?\n\nRelevant code from the codebase:\n", 0) == 0,
          "prompt header mismatch");
  Require(prompt.find(block.text) != std::string::npos, "prompt must embed the context");

  codescope::ContextBlock ungrounded{};
  ungrounded.query = "hello";
  Require(codescope::ComposeGroundedPrompt("hello", ungrounded) == "hello", "ungrounded prompt must be the question");

  const std::vector<codescope::ChatMessage> history = {{"user", "hi"}, {"assistant", "hello"}};
  const auto conversation = codescope::ComposeConversation(history, "how is config loaded?", block);
  Require(conversation.size() == 3, "conversation must append one turn");
  Require(conversation.back().role == "user" && conversation.back().content == prompt, "appended turn mismatch");
}

void ScenarioBuildAgainstCorpus() {
  codescope::tests::Log("scenario: build against corpus");
  constexpr int kDimensions = 64;
  codescope::CorpusConfig corpus_config{};
  corpus_config.dimensions = kDimensions;
  codescope::Corpus corpus(corpus_config, {});
  auto embedder = std::make_shared<codescope::HashingEmbeddingProvider>(kDimensions);
  codescope::IndexingPipeline pipeline(corpus, embedder, {});
  codescope::HybridRanker ranker(corpus, embedder, {});

  codescope::Symbol symbol{};
  symbol.name = "load_config";
  symbol.file_path = "app/config.py";
  symbol.start_line = 3;
  symbol.end_line = 9;
  symbol.doc_text = std::string("loads configuration settings from disk");
  symbol.code_text = "def load_config(path):\n    return parse_settings(open(path).read())";
  Require(pipeline.Run({symbol}).succeeded == 1, "fixture symbol must index");

  codescope::ContextConfig config{};
  config.limit = 3;
  codescope::ContextAssembler assembler(ranker, config);
  const auto block = assembler.Build("load config settings");
  Require(block.grounded, "matching query must be grounded");
  Require(block.citations.size() == 1 && block.citations[0].file_path == "app/config.py", "citation mismatch");
  Require(block.text.rfind("[1] File: app/config.py:3-9\n", 0) == 0, "context must start with the top hit");

  codescope::ContextConfig tiny = config;
  tiny.max_context_chars = 10;
  codescope::ContextAssembler tiny_assembler(ranker, tiny);
  const auto over_budget = tiny_assembler.Build("load config settings");
  Require(!over_budget.grounded && over_budget.text.empty() && over_budget.dropped_results == 1,
          "a match too large for the budget must report the dropped result");

  codescope::ContextConfig strict{};
  strict.min_similarity = 0.99F;
  codescope::ContextAssembler strict_assembler(ranker, strict);
  const auto empty = strict_assembler.Build("weather forecast");
  Require(!empty.grounded && empty.text.empty() && empty.citations.empty(), "unmatched query must not be grounded");
}

}  // namespace

int main() {
  try {
    codescope::tests::Log("context_assembler_test: start");
    ScenarioSectionFormat();
    ScenarioBudgetDropsLowestRanked();
    ScenarioGroundedPrompt();
    ScenarioBuildAgainstCorpus();
    codescope::tests::Log("context_assembler_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    codescope::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
