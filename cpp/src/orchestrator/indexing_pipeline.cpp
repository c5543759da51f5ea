#include "codescope/indexing_pipeline.hpp"

#include "codescope/errors.hpp"
#include "codescope/logging.hpp"
#include "codescope/tokenizer.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <iterator>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace codescope {
namespace {

constexpr std::size_t kCompactMinTombstones = 64;

struct PendingSymbol {
  std::size_t position = 0;
  Symbol symbol{};
  TermVector terms{};
  std::string text{};
  std::vector<float> embedding{};
};

struct Batch {
  std::vector<PendingSymbol> items{};
  std::exception_ptr error{};
};

std::optional<std::string> ValidateSymbol(const Symbol& symbol) {
  if (symbol.name.empty()) {
    return "missing name";
  }
  if (symbol.file_path.empty()) {
    return "missing file_path";
  }
  if (symbol.code_text.empty()) {
    return "missing code_text";
  }
  if (std::find(std::begin(kAllSymbolKinds), std::end(kAllSymbolKinds), symbol.kind) == std::end(kAllSymbolKinds)) {
    return "unknown kind";
  }
  if (symbol.start_line < 1) {
    return "start_line must be positive";
  }
  if (symbol.end_line < symbol.start_line) {
    return "end_line precedes start_line";
  }
  return std::nullopt;
}

void EmbedBatch(EmbeddingProvider& embedder, int dimensions, int min_batch_for_bulk, Batch& batch) {
  std::vector<std::string> texts{};
  texts.reserve(batch.items.size());
  for (const auto& item : batch.items) {
    texts.push_back(item.text);
  }

  std::vector<std::vector<float>> vectors{};
  auto* bulk = dynamic_cast<BatchEmbeddingProvider*>(&embedder);
  if (bulk != nullptr && texts.size() >= static_cast<std::size_t>(min_batch_for_bulk)) {
    vectors = bulk->EmbedBatch(texts);
    if (vectors.size() != texts.size()) {
      throw ProviderError("embedding provider returned " + std::to_string(vectors.size()) + " vectors for " +
                          std::to_string(texts.size()) + " texts");
    }
  } else {
    vectors.reserve(texts.size());
    for (const auto& text : texts) {
      vectors.push_back(embedder.Embed(text));
    }
  }

  for (std::size_t i = 0; i < vectors.size(); ++i) {
    if (vectors[i].size() != static_cast<std::size_t>(dimensions)) {
      throw ProviderError("embedding provider returned " + std::to_string(vectors[i].size()) +
                          " dimensions, corpus expects " + std::to_string(dimensions));
    }
    batch.items[i].embedding = std::move(vectors[i]);
  }
}

// Embeds batches [first, last) on up to embed_concurrency threads. Errors stay with their batch.
void EmbedWave(EmbeddingProvider& embedder,
               const PipelineConfig& config,
               int dimensions,
               std::vector<Batch>& batches,
               std::size_t first,
               std::size_t last) {
  auto embed_one = [&](Batch& batch) {
    try {
      EmbedBatch(embedder, dimensions, config.min_batch_for_bulk, batch);
    } catch (...) {
      batch.error = std::current_exception();
    }
  };

  const std::size_t count = last - first;
  const std::size_t worker_count = std::min(count, static_cast<std::size_t>(std::max(1, config.embed_concurrency)));
  if (worker_count <= 1) {
    for (std::size_t i = first; i < last; ++i) {
      embed_one(batches[i]);
    }
    return;
  }

  std::atomic<std::size_t> next_index{first};
  auto worker = [&]() {
    while (true) {
      const auto index = next_index.fetch_add(1);
      if (index >= last) {
        return;
      }
      embed_one(batches[index]);
    }
  };
  std::vector<std::thread> workers{};
  workers.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    workers.emplace_back(worker);
  }
  for (auto& thread : workers) {
    thread.join();
  }
}

SymbolFailure MakeFailure(const PendingSymbol& item, FailureCategory category, std::string message) {
  SymbolFailure failure{};
  failure.position = item.position;
  failure.id = item.symbol.id;
  failure.name = item.symbol.name;
  failure.category = category;
  failure.message = std::move(message);
  return failure;
}

void RecordBatchFailure(const Batch& batch, RunStats& stats) {
  FailureCategory category = FailureCategory::kProvider;
  std::string message;
  try {
    std::rethrow_exception(batch.error);
  } catch (const ConfigurationError& e) {
    category = FailureCategory::kConfiguration;
    message = e.what();
  } catch (const std::exception& e) {
    message = e.what();
  }
  Logger()->warn("indexing: embedding batch of {} symbols failed: {}", batch.items.size(), message);
  for (const auto& item : batch.items) {
    stats.failures.push_back(MakeFailure(item, category, message));
    ++stats.failed;
  }
}

void RestoreVector(FlatVectorIndex& vectors, SymbolId id, const std::optional<IndexEntry>& previous) {
  if (previous.has_value()) {
    vectors.Add(id, previous->embedding);
    return;
  }
  vectors.Remove(id);
}

void RestoreLexical(LexicalIndex& lexical, SymbolId id, const std::optional<IndexEntry>& previous) {
  if (previous.has_value()) {
    lexical.Index(id, previous->term_vector);
    return;
  }
  lexical.Remove(id);
}

// One symbol's mutation across the store and both indexes; either all of it lands or none.
template <typename StageFn>
void CommitAtomically(Corpus::WriteView& view,
                      SymbolId id,
                      const std::optional<IndexEntry>& previous,
                      bool bump_version,
                      StageFn&& stage) {
  auto& vectors = view.vectors();
  auto& lexical = view.lexical();
  SymbolStore::Transaction txn(view.store());
  bool vectors_committed = false;
  bool lexical_committed = false;
  bool version_bumped = false;
  bool mutation_recorded = false;
  try {
    stage(view.store(), vectors, lexical);
    view.RecordMutation();
    mutation_recorded = true;
    if (bump_version) {
      view.BumpVersion();
      version_bumped = true;
    }
    vectors.CommitStaged();
    vectors_committed = true;
    lexical.CommitStaged();
    lexical_committed = true;
    txn.Commit();
  } catch (...) {
    vectors.RollbackStaged();
    lexical.RollbackStaged();
    if (vectors_committed) {
      RestoreVector(vectors, id, previous);
    }
    if (lexical_committed) {
      RestoreLexical(lexical, id, previous);
    }
    if (version_bumped) {
      view.RollbackVersion();
    }
    if (mutation_recorded) {
      view.RollbackMutation();
    }
    throw;
  }
}

void MaybeCompact(Corpus::WriteView& view) {
  const auto tombstones = view.vectors().TombstoneCount();
  if (tombstones >= kCompactMinTombstones && tombstones > view.vectors().Size()) {
    Logger()->info("indexing: compacting vector index ({} tombstones)", tombstones);
    view.CompactVectors();
  }
}

}  // namespace

IndexingPipeline::IndexingPipeline(Corpus& corpus, std::shared_ptr<EmbeddingProvider> embedder, PipelineConfig config)
    : corpus_(corpus), embedder_(std::move(embedder)), config_(config) {
  if (embedder_ == nullptr) {
    throw ConfigurationError("indexing pipeline requires an embedding provider");
  }
  if (embedder_->dimensions() != corpus_.dimensions()) {
    throw DimensionMismatchError("indexing pipeline", static_cast<std::size_t>(corpus_.dimensions()),
                                 static_cast<std::size_t>(embedder_->dimensions()));
  }
}

RunStats IndexingPipeline::Run(const std::vector<Symbol>& symbols, const CancellationToken* cancel) {
  const auto started = std::chrono::steady_clock::now();
  RunStats stats{};

  std::vector<PendingSymbol> pending{};
  {
    const auto view = corpus_.Read();
    const auto min_token_length = view.lexical().config().min_token_length;
    for (std::size_t position = 0; position < symbols.size(); ++position) {
      PendingSymbol item{};
      item.position = position;
      item.symbol = symbols[position];
      ++stats.processed;

      if (const auto problem = ValidateSymbol(item.symbol); problem.has_value()) {
        auto failure = MakeFailure(item, FailureCategory::kMalformedSymbol, *problem);
        if (item.symbol.name.empty() || item.symbol.file_path.empty()) {
          failure.id.reset();
        } else {
          failure.id = MakeSymbolId(item.symbol.file_path, item.symbol.name, item.symbol.start_line);
        }
        Logger()->warn("indexing: rejecting symbol #{} '{}': {}", position, item.symbol.name, *problem);
        stats.failures.push_back(std::move(failure));
        ++stats.failed;
        continue;
      }

      item.symbol.id = MakeSymbolId(item.symbol.file_path, item.symbol.name, item.symbol.start_line);
      item.symbol.content_hash = ContentHash(item.symbol.code_text);
      const auto stored_hash = view.store().ContentHash(item.symbol.id);
      if (stored_hash.has_value() && *stored_hash == item.symbol.content_hash) {
        ++stats.skipped_unchanged;
        continue;
      }
      item.terms = BuildTermVector(item.symbol, min_token_length);
      item.text = EmbeddingText(item.symbol);
      pending.push_back(std::move(item));
    }
  }

  const auto batch_size = static_cast<std::size_t>(std::max(1, config_.batch_size));
  std::vector<Batch> batches{};
  for (std::size_t start = 0; start < pending.size(); start += batch_size) {
    Batch batch{};
    const auto end = std::min(pending.size(), start + batch_size);
    for (std::size_t i = start; i < end; ++i) {
      batch.items.push_back(std::move(pending[i]));
    }
    batches.push_back(std::move(batch));
  }

  bool committed_any = false;
  const auto wave = static_cast<std::size_t>(std::max(1, config_.embed_concurrency));
  std::size_t next_batch = 0;
  while (next_batch < batches.size()) {
    if (cancel != nullptr && cancel->cancelled()) {
      stats.cancelled = true;
      std::size_t abandoned = 0;
      for (std::size_t i = next_batch; i < batches.size(); ++i) {
        abandoned += batches[i].items.size();
      }
      stats.processed -= abandoned;
      Logger()->info("indexing: cancelled with {} symbols not processed", abandoned);
      break;
    }

    const auto wave_end = std::min(batches.size(), next_batch + wave);
    EmbedWave(*embedder_, config_, corpus_.dimensions(), batches, next_batch, wave_end);

    for (std::size_t b = next_batch; b < wave_end; ++b) {
      auto& batch = batches[b];
      if (batch.error != nullptr) {
        RecordBatchFailure(batch, stats);
        continue;
      }

      auto view = corpus_.Write();
      for (auto& item : batch.items) {
        const auto id = item.symbol.id;
        try {
          const auto stored_hash = view.store().ContentHash(id);
          if (stored_hash.has_value() && *stored_hash == item.symbol.content_hash) {
            ++stats.skipped_unchanged;
            continue;
          }
          std::optional<IndexEntry> previous{};
          if (stored_hash.has_value()) {
            previous = view.store().Entry(id);
          }
          IndexEntry entry{std::move(item.embedding), std::move(item.terms)};
          CommitAtomically(view, id, previous, !committed_any,
                           [&](SymbolStore& store, FlatVectorIndex& vectors, LexicalIndex& lexical) {
                             store.Put(item.symbol, entry);
                             if (previous.has_value()) {
                               vectors.StageRemove(id);
                               lexical.StageRemove(id);
                             }
                             vectors.StageAdd(id, entry.embedding);
                             lexical.StageIndex(id, entry.term_vector);
                           });
          committed_any = true;
          ++stats.succeeded;
          stats.by_kind.Add(item.symbol.kind);
          stats.total_lines += static_cast<std::uint64_t>(item.symbol.end_line - item.symbol.start_line + 1);
        } catch (const ConfigurationError& e) {
          Logger()->warn("indexing: symbol '{}' rolled back: {}", item.symbol.name, e.what());
          stats.failures.push_back(MakeFailure(item, FailureCategory::kConfiguration, e.what()));
          ++stats.failed;
        } catch (const std::exception& e) {
          Logger()->warn("indexing: symbol '{}' rolled back: {}", item.symbol.name, e.what());
          stats.failures.push_back(MakeFailure(item, FailureCategory::kStore, e.what()));
          ++stats.failed;
        }
      }
      MaybeCompact(view);
    }
    next_batch = wave_end;
  }

  std::stable_sort(stats.failures.begin(), stats.failures.end(), [](const auto& lhs, const auto& rhs) {
    return lhs.position < rhs.position;
  });
  stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  Logger()->info("indexing: {} processed, {} indexed, {} unchanged, {} failed in {} ms{}",
                 stats.processed, stats.succeeded, stats.skipped_unchanged, stats.failed, stats.elapsed.count(),
                 stats.cancelled ? " (cancelled)" : "");
  return stats;
}

std::uint64_t IndexingPipeline::Remove(const std::vector<SymbolId>& ids) {
  auto view = corpus_.Write();
  std::uint64_t removed = 0;
  for (const auto id : ids) {
    const auto previous = view.store().Entry(id);
    if (!previous.has_value() && !view.store().ContentHash(id).has_value()) {
      continue;
    }
    CommitAtomically(view, id, previous, removed == 0,
                     [&](SymbolStore& store, FlatVectorIndex& vectors, LexicalIndex& lexical) {
                       store.Delete(id);
                       vectors.StageRemove(id);
                       lexical.StageRemove(id);
                     });
    ++removed;
  }
  if (removed > 0) {
    MaybeCompact(view);
    Logger()->info("indexing: removed {} symbols", removed);
  }
  return removed;
}

std::uint64_t IndexingPipeline::RemoveFile(const std::string& file_path) {
  std::vector<SymbolId> ids{};
  {
    const auto view = corpus_.Read();
    ids = view.store().IdsForFile(file_path);
  }
  return Remove(ids);
}

void IndexingPipeline::Compact() {
  auto view = corpus_.Write();
  view.CompactVectors();
}

}  // namespace codescope
