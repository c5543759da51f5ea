#pragma once

#include "codescope/types.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace codescope {

// Durable record of every indexed symbol and the index entry derived from it, backed by SQLite.
// The indexes are caches of what lives here and can always be rebuilt from it.
class SymbolStore {
 public:
  SymbolStore(const SymbolStore&) = delete;
  SymbolStore& operator=(const SymbolStore&) = delete;
  SymbolStore(SymbolStore&&) noexcept;
  SymbolStore& operator=(SymbolStore&&) noexcept;
  ~SymbolStore();

  // ":memory:" opens a private in-memory database.
  static SymbolStore Open(const std::filesystem::path& path);

  // BEGIN IMMEDIATE on construction; ROLLBACK on destruction unless Commit() ran.
  class Transaction {
   public:
    explicit Transaction(SymbolStore& store);
    ~Transaction();
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void Commit();

   private:
    SymbolStore& store_;
    bool done_ = false;
  };

  void Put(const Symbol& symbol, const IndexEntry& entry);
  // Returns false when the id was not stored.
  bool Delete(SymbolId id);
  void Clear();

  [[nodiscard]] std::optional<Symbol> Get(SymbolId id) const;
  // Missing ids are skipped; order follows the request.
  [[nodiscard]] std::vector<Symbol> GetMany(const std::vector<SymbolId>& ids) const;
  [[nodiscard]] std::optional<std::string> ContentHash(SymbolId id) const;
  [[nodiscard]] std::optional<IndexEntry> Entry(SymbolId id) const;
  [[nodiscard]] std::vector<std::pair<SymbolId, IndexEntry>> Entries() const;
  [[nodiscard]] std::vector<Symbol> Symbols() const;
  [[nodiscard]] std::vector<SymbolId> IdsForFile(const std::string& file_path) const;
  // Case-insensitive substring match on the symbol name, shortest names first.
  [[nodiscard]] std::vector<Symbol> FindByName(std::string_view name, int limit) const;

  [[nodiscard]] std::uint64_t SymbolCount() const;
  [[nodiscard]] std::uint64_t FileCount() const;
  [[nodiscard]] KindCounts CountsByKind() const;

  [[nodiscard]] std::optional<std::string> GetMeta(const std::string& key) const;
  void SetMeta(const std::string& key, const std::string& value);

 private:
  struct SQLiteState;
  explicit SymbolStore(std::unique_ptr<SQLiteState> state);

  std::unique_ptr<SQLiteState> state_;
};

// Blob codecs for the index_entries table.
[[nodiscard]] std::vector<std::byte> EncodeEmbedding(const std::vector<float>& embedding);
[[nodiscard]] std::vector<float> DecodeEmbedding(const void* data, std::size_t size);
[[nodiscard]] std::vector<std::byte> EncodeTermVector(const TermVector& terms);
[[nodiscard]] TermVector DecodeTermVector(const void* data, std::size_t size);

}  // namespace codescope
