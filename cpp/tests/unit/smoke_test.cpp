#include "codescope/types.hpp"

#include "../test_logger.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

int main() {
  codescope::tests::Log("smoke_test: start");
  codescope::EngineConfig config;
  if (config.ranker.alpha < 0.0F || config.ranker.alpha > 1.0F) {
    std::cerr << "ranker alpha default out of range\n";
    return EXIT_FAILURE;
  }
  if (!config.lexical.enable_query_expansion) {
    std::cerr << "enable_query_expansion default mismatch\n";
    return EXIT_FAILURE;
  }
  if (config.pipeline.batch_size <= 0 || config.context.max_context_chars == 0) {
    std::cerr << "pipeline and context defaults must be positive\n";
    return EXIT_FAILURE;
  }
  if (std::string(codescope::SymbolKindName(codescope::ParseSymbolKind("method"))) != "method") {
    std::cerr << "symbol kind names must round-trip\n";
    return EXIT_FAILURE;
  }

  codescope::tests::Log("smoke_test: finished");
  std::cout << "codescope smoke test passed\n";
  return EXIT_SUCCESS;
}
