#include "codescope/symbol_store.hpp"

#include "codescope/errors.hpp"
#include "codescope/logging.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <sqlite3.h>

namespace codescope {
namespace {

constexpr const char* kMemoryPath = ":memory:";

StoreError SqliteError(sqlite3* db, const std::string& what) {
  return StoreError("symbol_store: " + what + ": " + sqlite3_errmsg(db));
}

class Statement final {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
      throw SqliteError(db_, "prepare failed");
    }
  }

  ~Statement() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
  }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void BindInt64(int index, std::int64_t value) {
    Check(sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)));
  }

  void BindText(int index, std::string_view value) {
    Check(sqlite3_bind_text(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
  }

  void BindOptionalText(int index, const std::optional<std::string>& value) {
    if (!value.has_value()) {
      Check(sqlite3_bind_null(stmt_, index));
      return;
    }
    BindText(index, *value);
  }

  void BindBlob(int index, const std::vector<std::byte>& value) {
    Check(sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
  }

  // True while a row is available.
  bool Step() {
    const int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) {
      return true;
    }
    if (rc == SQLITE_DONE) {
      return false;
    }
    throw SqliteError(db_, "step failed");
  }

  void Run() {
    while (Step()) {
    }
  }

  void Reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }

  std::int64_t ColumnInt64(int column) const { return sqlite3_column_int64(stmt_, column); }

  std::string ColumnText(int column) const {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, column));
    if (text == nullptr) {
      return {};
    }
    return std::string(text, static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
  }

  std::optional<std::string> ColumnOptionalText(int column) const {
    if (sqlite3_column_type(stmt_, column) == SQLITE_NULL) {
      return std::nullopt;
    }
    return ColumnText(column);
  }

  std::pair<const void*, std::size_t> ColumnBlob(int column) const {
    const void* data = sqlite3_column_blob(stmt_, column);
    const auto size = static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column));
    return {data, size};
  }

 private:
  void Check(int rc) {
    if (rc != SQLITE_OK) {
      throw SqliteError(db_, "bind failed");
    }
  }

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

void Exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
  if (rc == SQLITE_OK) {
    return;
  }
  std::string message = err != nullptr ? err : "sqlite exec failed";
  if (err != nullptr) {
    sqlite3_free(err);
  }
  throw StoreError("symbol_store: " + message);
}

constexpr const char* kSymbolColumns =
    "id, name, kind, file_path, start_line, end_line, code_text, doc_text, content_hash";

SymbolKind KindFromColumn(std::int64_t raw) {
  for (const auto kind : kAllSymbolKinds) {
    if (static_cast<std::int64_t>(kind) == raw) {
      return kind;
    }
  }
  throw CorruptionError("symbol_store: unknown symbol kind " + std::to_string(raw));
}

Symbol ReadSymbol(const Statement& stmt) {
  Symbol symbol{};
  symbol.id = static_cast<SymbolId>(stmt.ColumnInt64(0));
  symbol.name = stmt.ColumnText(1);
  symbol.kind = KindFromColumn(stmt.ColumnInt64(2));
  symbol.file_path = stmt.ColumnText(3);
  symbol.start_line = static_cast<int>(stmt.ColumnInt64(4));
  symbol.end_line = static_cast<int>(stmt.ColumnInt64(5));
  symbol.code_text = stmt.ColumnText(6);
  symbol.doc_text = stmt.ColumnOptionalText(7);
  symbol.content_hash = stmt.ColumnText(8);
  return symbol;
}

IndexEntry ReadEntry(const Statement& stmt, int embedding_column, int terms_column) {
  IndexEntry entry{};
  const auto [embedding_data, embedding_size] = stmt.ColumnBlob(embedding_column);
  entry.embedding = DecodeEmbedding(embedding_data, embedding_size);
  const auto [terms_data, terms_size] = stmt.ColumnBlob(terms_column);
  entry.term_vector = DecodeTermVector(terms_data, terms_size);
  return entry;
}

void AppendU32LE(std::vector<std::byte>& out, std::uint32_t value) {
  for (std::size_t i = 0; i < sizeof(value); ++i) {
    out.push_back(static_cast<std::byte>((value >> (8U * i)) & 0xFFU));
  }
}

std::uint32_t ReadU32LE(const unsigned char* bytes, std::size_t size, std::size_t offset) {
  if (offset + sizeof(std::uint32_t) > size) {
    throw CorruptionError("symbol_store: blob read out of bounds");
  }
  std::uint32_t out = 0;
  for (std::size_t i = 0; i < sizeof(out); ++i) {
    out |= static_cast<std::uint32_t>(bytes[offset + i]) << (8U * i);
  }
  return out;
}

}  // namespace

std::vector<std::byte> EncodeEmbedding(const std::vector<float>& embedding) {
  std::vector<std::byte> out{};
  out.reserve(embedding.size() * sizeof(float));
  for (const float value : embedding) {
    std::uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    AppendU32LE(out, bits);
  }
  return out;
}

std::vector<float> DecodeEmbedding(const void* data, std::size_t size) {
  if (size % sizeof(float) != 0) {
    throw CorruptionError("symbol_store: embedding blob length is not a multiple of 4");
  }
  const auto* bytes = static_cast<const unsigned char*>(data);
  std::vector<float> out{};
  out.reserve(size / sizeof(float));
  for (std::size_t offset = 0; offset < size; offset += sizeof(float)) {
    const auto bits = ReadU32LE(bytes, size, offset);
    float value = 0.0f;
    std::memcpy(&value, &bits, sizeof(value));
    out.push_back(value);
  }
  return out;
}

// u32 count, then per term (sorted): u32 length, bytes, u32 frequency.
std::vector<std::byte> EncodeTermVector(const TermVector& terms) {
  std::vector<std::pair<std::string, std::uint32_t>> sorted(terms.begin(), terms.end());
  std::sort(sorted.begin(), sorted.end());

  std::vector<std::byte> out{};
  AppendU32LE(out, static_cast<std::uint32_t>(sorted.size()));
  for (const auto& [term, frequency] : sorted) {
    AppendU32LE(out, static_cast<std::uint32_t>(term.size()));
    for (const char ch : term) {
      out.push_back(static_cast<std::byte>(ch));
    }
    AppendU32LE(out, frequency);
  }
  return out;
}

TermVector DecodeTermVector(const void* data, std::size_t size) {
  TermVector out{};
  if (size == 0) {
    return out;
  }
  const auto* bytes = static_cast<const unsigned char*>(data);
  const auto count = ReadU32LE(bytes, size, 0);
  std::size_t offset = sizeof(std::uint32_t);
  for (std::uint32_t i = 0; i < count; ++i) {
    const auto length = ReadU32LE(bytes, size, offset);
    offset += sizeof(std::uint32_t);
    if (length > size - offset) {
      throw CorruptionError("symbol_store: term vector term overruns blob");
    }
    std::string term(reinterpret_cast<const char*>(bytes + offset), length);
    offset += length;
    out[std::move(term)] = ReadU32LE(bytes, size, offset);
    offset += sizeof(std::uint32_t);
  }
  if (offset != size) {
    throw CorruptionError("symbol_store: trailing bytes after term vector");
  }
  return out;
}

struct SymbolStore::SQLiteState {
  sqlite3* db = nullptr;

  ~SQLiteState() {
    if (db != nullptr) {
      sqlite3_close(db);
      db = nullptr;
    }
  }
};

SymbolStore::SymbolStore(std::unique_ptr<SQLiteState> state) : state_(std::move(state)) {}
SymbolStore::SymbolStore(SymbolStore&&) noexcept = default;
SymbolStore& SymbolStore::operator=(SymbolStore&&) noexcept = default;
SymbolStore::~SymbolStore() = default;

SymbolStore SymbolStore::Open(const std::filesystem::path& path) {
  const bool in_memory = path.empty() || path == kMemoryPath;
  if (!in_memory && path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw StoreError("symbol_store: failed to create " + path.parent_path().string() + ": " + ec.message());
    }
  }

  auto state = std::make_unique<SQLiteState>();
  const std::string location = in_memory ? std::string(kMemoryPath) : path.string();
  if (sqlite3_open_v2(location.c_str(),
                      &state->db,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                      nullptr) != SQLITE_OK) {
    const std::string message = state->db != nullptr ? sqlite3_errmsg(state->db) : "out of memory";
    throw StoreError("symbol_store: failed to open " + location + ": " + message);
  }

  sqlite3* db = state->db;
  if (!in_memory) {
    Exec(db, "PRAGMA journal_mode=WAL;");
  }
  Exec(db, "PRAGMA foreign_keys=ON;");
  Exec(db,
       "CREATE TABLE IF NOT EXISTS symbols("
       "id INTEGER PRIMARY KEY,"
       "name TEXT NOT NULL,"
       "kind INTEGER NOT NULL,"
       "file_path TEXT NOT NULL,"
       "start_line INTEGER NOT NULL,"
       "end_line INTEGER NOT NULL,"
       "code_text TEXT NOT NULL,"
       "doc_text TEXT,"
       "content_hash TEXT NOT NULL"
       ");");
  Exec(db, "CREATE INDEX IF NOT EXISTS symbols_file_path ON symbols(file_path);");
  Exec(db,
       "CREATE TABLE IF NOT EXISTS index_entries("
       "symbol_id INTEGER PRIMARY KEY REFERENCES symbols(id) ON DELETE CASCADE,"
       "embedding BLOB NOT NULL,"
       "term_vector BLOB NOT NULL"
       ");");
  Exec(db,
       "CREATE TABLE IF NOT EXISTS corpus_meta("
       "key TEXT PRIMARY KEY,"
       "value TEXT NOT NULL"
       ");");

  Logger()->debug("symbol_store: opened {}", location);
  return SymbolStore(std::move(state));
}

SymbolStore::Transaction::Transaction(SymbolStore& store) : store_(store) {
  Exec(store_.state_->db, "BEGIN IMMEDIATE TRANSACTION;");
}

SymbolStore::Transaction::~Transaction() {
  if (done_) {
    return;
  }
  char* err = nullptr;
  if (sqlite3_exec(store_.state_->db, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    Logger()->error("symbol_store: rollback failed: {}", err != nullptr ? err : "unknown error");
  }
  if (err != nullptr) {
    sqlite3_free(err);
  }
}

void SymbolStore::Transaction::Commit() {
  if (done_) {
    throw StoreError("symbol_store: transaction already finished");
  }
  Exec(store_.state_->db, "COMMIT;");
  done_ = true;
}

void SymbolStore::Put(const Symbol& symbol, const IndexEntry& entry) {
  sqlite3* db = state_->db;
  Statement symbol_stmt(db,
                        "INSERT INTO symbols(id, name, kind, file_path, start_line, end_line, code_text, doc_text, "
                        "content_hash) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9) "
                        "ON CONFLICT(id) DO UPDATE SET name=excluded.name, kind=excluded.kind, "
                        "file_path=excluded.file_path, start_line=excluded.start_line, end_line=excluded.end_line, "
                        "code_text=excluded.code_text, doc_text=excluded.doc_text, "
                        "content_hash=excluded.content_hash;");
  symbol_stmt.BindInt64(1, static_cast<std::int64_t>(symbol.id));
  symbol_stmt.BindText(2, symbol.name);
  symbol_stmt.BindInt64(3, static_cast<std::int64_t>(symbol.kind));
  symbol_stmt.BindText(4, symbol.file_path);
  symbol_stmt.BindInt64(5, symbol.start_line);
  symbol_stmt.BindInt64(6, symbol.end_line);
  symbol_stmt.BindText(7, symbol.code_text);
  symbol_stmt.BindOptionalText(8, symbol.doc_text);
  symbol_stmt.BindText(9, symbol.content_hash);
  symbol_stmt.Run();

  Statement entry_stmt(db,
                       "INSERT INTO index_entries(symbol_id, embedding, term_vector) VALUES(?1, ?2, ?3) "
                       "ON CONFLICT(symbol_id) DO UPDATE SET embedding=excluded.embedding, "
                       "term_vector=excluded.term_vector;");
  entry_stmt.BindInt64(1, static_cast<std::int64_t>(symbol.id));
  entry_stmt.BindBlob(2, EncodeEmbedding(entry.embedding));
  entry_stmt.BindBlob(3, EncodeTermVector(entry.term_vector));
  entry_stmt.Run();
}

bool SymbolStore::Delete(SymbolId id) {
  sqlite3* db = state_->db;
  Statement entry_stmt(db, "DELETE FROM index_entries WHERE symbol_id = ?1;");
  entry_stmt.BindInt64(1, static_cast<std::int64_t>(id));
  entry_stmt.Run();

  Statement symbol_stmt(db, "DELETE FROM symbols WHERE id = ?1;");
  symbol_stmt.BindInt64(1, static_cast<std::int64_t>(id));
  symbol_stmt.Run();
  return sqlite3_changes(db) > 0;
}

void SymbolStore::Clear() {
  Transaction txn(*this);
  Exec(state_->db, "DELETE FROM index_entries;");
  Exec(state_->db, "DELETE FROM symbols;");
  txn.Commit();
}

std::optional<Symbol> SymbolStore::Get(SymbolId id) const {
  const std::string sql = std::string("SELECT ") + kSymbolColumns + " FROM symbols WHERE id = ?1;";
  Statement stmt(state_->db, sql.c_str());
  stmt.BindInt64(1, static_cast<std::int64_t>(id));
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return ReadSymbol(stmt);
}

std::vector<Symbol> SymbolStore::GetMany(const std::vector<SymbolId>& ids) const {
  const std::string sql = std::string("SELECT ") + kSymbolColumns + " FROM symbols WHERE id = ?1;";
  Statement stmt(state_->db, sql.c_str());
  std::vector<Symbol> out{};
  out.reserve(ids.size());
  for (const auto id : ids) {
    stmt.Reset();
    stmt.BindInt64(1, static_cast<std::int64_t>(id));
    if (stmt.Step()) {
      out.push_back(ReadSymbol(stmt));
    }
  }
  return out;
}

std::optional<std::string> SymbolStore::ContentHash(SymbolId id) const {
  Statement stmt(state_->db, "SELECT content_hash FROM symbols WHERE id = ?1;");
  stmt.BindInt64(1, static_cast<std::int64_t>(id));
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return stmt.ColumnText(0);
}

std::optional<IndexEntry> SymbolStore::Entry(SymbolId id) const {
  Statement stmt(state_->db, "SELECT embedding, term_vector FROM index_entries WHERE symbol_id = ?1;");
  stmt.BindInt64(1, static_cast<std::int64_t>(id));
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return ReadEntry(stmt, 0, 1);
}

std::vector<std::pair<SymbolId, IndexEntry>> SymbolStore::Entries() const {
  Statement stmt(state_->db, "SELECT symbol_id, embedding, term_vector FROM index_entries ORDER BY symbol_id;");
  std::vector<std::pair<SymbolId, IndexEntry>> out{};
  while (stmt.Step()) {
    out.emplace_back(static_cast<SymbolId>(stmt.ColumnInt64(0)), ReadEntry(stmt, 1, 2));
  }
  return out;
}

std::vector<Symbol> SymbolStore::Symbols() const {
  const std::string sql = std::string("SELECT ") + kSymbolColumns + " FROM symbols ORDER BY id;";
  Statement stmt(state_->db, sql.c_str());
  std::vector<Symbol> out{};
  while (stmt.Step()) {
    out.push_back(ReadSymbol(stmt));
  }
  return out;
}

std::vector<SymbolId> SymbolStore::IdsForFile(const std::string& file_path) const {
  Statement stmt(state_->db, "SELECT id FROM symbols WHERE file_path = ?1 ORDER BY id;");
  stmt.BindText(1, file_path);
  std::vector<SymbolId> out{};
  while (stmt.Step()) {
    out.push_back(static_cast<SymbolId>(stmt.ColumnInt64(0)));
  }
  return out;
}

std::vector<Symbol> SymbolStore::FindByName(std::string_view name, int limit) const {
  if (name.empty() || limit <= 0) {
    return {};
  }
  const std::string sql = std::string("SELECT ") + kSymbolColumns +
                          " FROM symbols WHERE instr(lower(name), lower(?1)) > 0 "
                          "ORDER BY length(name), name, id LIMIT ?2;";
  Statement stmt(state_->db, sql.c_str());
  stmt.BindText(1, name);
  stmt.BindInt64(2, limit);
  std::vector<Symbol> out{};
  while (stmt.Step()) {
    out.push_back(ReadSymbol(stmt));
  }
  return out;
}

std::uint64_t SymbolStore::SymbolCount() const {
  Statement stmt(state_->db, "SELECT COUNT(*) FROM symbols;");
  return stmt.Step() ? static_cast<std::uint64_t>(stmt.ColumnInt64(0)) : 0;
}

std::uint64_t SymbolStore::FileCount() const {
  Statement stmt(state_->db, "SELECT COUNT(DISTINCT file_path) FROM symbols;");
  return stmt.Step() ? static_cast<std::uint64_t>(stmt.ColumnInt64(0)) : 0;
}

KindCounts SymbolStore::CountsByKind() const {
  Statement stmt(state_->db, "SELECT kind, COUNT(*) FROM symbols GROUP BY kind;");
  KindCounts counts{};
  while (stmt.Step()) {
    counts.Add(KindFromColumn(stmt.ColumnInt64(0)), static_cast<std::uint64_t>(stmt.ColumnInt64(1)));
  }
  return counts;
}

std::optional<std::string> SymbolStore::GetMeta(const std::string& key) const {
  Statement stmt(state_->db, "SELECT value FROM corpus_meta WHERE key = ?1;");
  stmt.BindText(1, key);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return stmt.ColumnText(0);
}

void SymbolStore::SetMeta(const std::string& key, const std::string& value) {
  Statement stmt(state_->db,
                 "INSERT INTO corpus_meta(key, value) VALUES(?1, ?2) "
                 "ON CONFLICT(key) DO UPDATE SET value=excluded.value;");
  stmt.BindText(1, key);
  stmt.BindText(2, value);
  stmt.Run();
}

}  // namespace codescope
