#include "codescope/errors.hpp"
#include "codescope/symbol_store.hpp"

#include "../test_logger.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void Require(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

std::filesystem::path UniquePath() {
  const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() /
         ("codescope_symbol_store_test_" + std::to_string(static_cast<long long>(now)) + ".db");
}

void RemoveDatabase(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  std::filesystem::remove(std::filesystem::path(path.string() + "-wal"), ec);
  std::filesystem::remove(std::filesystem::path(path.string() + "-shm"), ec);
}

codescope::Symbol MakeSymbol(const std::string& name,
                             const std::string& file_path,
                             codescope::SymbolKind kind = codescope::SymbolKind::kFunction,
                             int start_line = 1) {
  codescope::Symbol symbol{};
  symbol.name = name;
  symbol.kind = kind;
  symbol.file_path = file_path;
  symbol.start_line = start_line;
  symbol.end_line = start_line + 4;
  symbol.code_text = "def " + name + "():\n    pass";
  symbol.id = codescope::MakeSymbolId(file_path, name, start_line);
  symbol.content_hash = codescope::ContentHash(symbol.code_text);
  return symbol;
}

codescope::IndexEntry MakeEntry(float seed) {
  codescope::IndexEntry entry{};
  entry.embedding = {seed, -seed, 0.5F};
  entry.term_vector = {{"alpha", 3}, {"beta", 1}};
  return entry;
}

void ScenarioPutGetAndUpsert() {
  codescope::tests::Log("scenario: put/get/upsert");
  auto store = codescope::SymbolStore::Open(":memory:");
  auto symbol = MakeSymbol("load_config", "src/config.py");
  symbol.doc_text = std::string("Loads the configuration file");
  store.Put(symbol, MakeEntry(1.0F));

  const auto loaded = store.Get(symbol.id);
  Require(loaded.has_value(), "stored symbol must be readable");
  Require(loaded->name == symbol.name && loaded->file_path == symbol.file_path, "symbol fields mismatch");
  Require(loaded->start_line == 1 && loaded->end_line == 5, "line range mismatch");
  Require(loaded->doc_text == symbol.doc_text, "doc text mismatch");
  Require(loaded->content_hash == symbol.content_hash, "content hash mismatch");
  Require(store.ContentHash(symbol.id) == symbol.content_hash, "ContentHash lookup mismatch");

  const auto entry = store.Entry(symbol.id);
  Require(entry.has_value() && entry->embedding == MakeEntry(1.0F).embedding, "embedding mismatch");
  Require(entry->term_vector == MakeEntry(1.0F).term_vector, "term vector mismatch");

  symbol.code_text = "def load_config():\n    return {}";
  symbol.content_hash = codescope::ContentHash(symbol.code_text);
  symbol.doc_text.reset();
  store.Put(symbol, MakeEntry(2.0F));
  Require(store.SymbolCount() == 1, "upsert must not duplicate");
  const auto updated = store.Get(symbol.id);
  Require(updated->code_text == symbol.code_text && !updated->doc_text.has_value(), "upsert must overwrite fields");
  Require(store.Entry(symbol.id)->embedding == MakeEntry(2.0F).embedding, "upsert must overwrite entry");

  Require(!store.Get(12345).has_value(), "unknown id must be empty");
  Require(!store.ContentHash(12345).has_value(), "unknown id has no hash");
}

void ScenarioDeleteAndClear() {
  codescope::tests::Log("scenario: delete and clear");
  auto store = codescope::SymbolStore::Open(":memory:");
  const auto a = MakeSymbol("a_func", "a.py");
  const auto b = MakeSymbol("b_func", "b.py");
  store.Put(a, MakeEntry(1.0F));
  store.Put(b, MakeEntry(2.0F));

  Require(store.Delete(a.id), "delete of stored id must report true");
  Require(!store.Delete(a.id), "second delete must report false");
  Require(!store.Get(a.id).has_value() && !store.Entry(a.id).has_value(), "delete must cascade to the entry");
  Require(store.Entries().size() == 1, "one entry must remain");

  store.SetMeta("version", "3");
  store.Clear();
  Require(store.SymbolCount() == 0 && store.Entries().empty(), "clear must remove everything");
  Require(store.GetMeta("version") == std::string("3"), "clear must keep corpus metadata");
}

void ScenarioQueriesAndCounts() {
  codescope::tests::Log("scenario: queries and counts");
  auto store = codescope::SymbolStore::Open(":memory:");
  const auto user = MakeSymbol("User", "models/user.py", codescope::SymbolKind::kClass);
  const auto get_user = MakeSymbol("get_user", "models/user.py", codescope::SymbolKind::kMethod, 10);
  const auto auth = MakeSymbol("authenticate_user", "auth/login.py");
  const auto db = MakeSymbol("connect_db", "db/conn.py");
  for (const auto* symbol : {&user, &get_user, &auth, &db}) {
    store.Put(*symbol, MakeEntry(1.0F));
  }

  Require(store.SymbolCount() == 4, "symbol count mismatch");
  Require(store.FileCount() == 3, "file count mismatch");
  const auto kinds = store.CountsByKind();
  Require(kinds.functions == 2 && kinds.classes == 1 && kinds.methods == 1, "kind counts mismatch");

  const auto found = store.FindByName("USER", 10);
  Require(found.size() == 3, "case-insensitive name match count mismatch");
  Require(found[0].name == "User" && found[1].name == "get_user", "shortest names must come first");
  Require(store.FindByName("user", 1).size() == 1, "FindByName must honour the limit");
  Require(store.FindByName("", 10).empty(), "empty name must match nothing");

  const auto file_ids = store.IdsForFile("models/user.py");
  Require(file_ids.size() == 2, "IdsForFile count mismatch");

  const auto many = store.GetMany({db.id, 999, user.id});
  Require(many.size() == 2, "GetMany must skip unknown ids");
  Require(many[0].id == db.id && many[1].id == user.id, "GetMany must keep request order");
  Require(store.Symbols().size() == 4, "Symbols must list every record");
}

void ScenarioTransactionRollback() {
  codescope::tests::Log("scenario: transaction rollback");
  auto store = codescope::SymbolStore::Open(":memory:");
  const auto kept = MakeSymbol("kept", "k.py");
  const auto dropped = MakeSymbol("dropped", "d.py");
  {
    codescope::SymbolStore::Transaction txn(store);
    store.Put(kept, MakeEntry(1.0F));
    txn.Commit();
    bool threw = false;
    try {
      txn.Commit();
    } catch (const codescope::StoreError&) {
      threw = true;
    }
    Require(threw, "double commit must throw");
  }
  {
    codescope::SymbolStore::Transaction txn(store);
    store.Put(dropped, MakeEntry(1.0F));
    store.Delete(kept.id);
  }
  Require(store.Get(kept.id).has_value(), "rolled back delete must keep the symbol");
  Require(!store.Get(dropped.id).has_value(), "rolled back put must not persist");
}

void ScenarioBlobCodecs() {
  codescope::tests::Log("scenario: blob codecs");
  const std::vector<float> embedding = {0.25F, -1.5F, 3.0F};
  const auto bytes = codescope::EncodeEmbedding(embedding);
  Require(bytes.size() == embedding.size() * sizeof(float), "embedding blob size mismatch");
  Require(codescope::DecodeEmbedding(bytes.data(), bytes.size()) == embedding, "embedding decode mismatch");

  bool odd_threw = false;
  try {
    (void)codescope::DecodeEmbedding(bytes.data(), bytes.size() - 1);
  } catch (const codescope::CorruptionError&) {
    odd_threw = true;
  }
  Require(odd_threw, "embedding blob of odd length must be rejected");

  const codescope::TermVector terms = {{"zeta", 1}, {"alpha", 4}};
  const auto term_bytes = codescope::EncodeTermVector(terms);
  Require(codescope::DecodeTermVector(term_bytes.data(), term_bytes.size()) == terms, "term vector decode mismatch");
  Require(codescope::EncodeTermVector({{"alpha", 4}, {"zeta", 1}}) == term_bytes,
          "term vector encoding must not depend on insertion order");

  bool truncated_threw = false;
  try {
    (void)codescope::DecodeTermVector(term_bytes.data(), term_bytes.size() - 2);
  } catch (const codescope::CorruptionError&) {
    truncated_threw = true;
  }
  Require(truncated_threw, "truncated term vector must be rejected");
}

void ScenarioFilePersistence(const std::filesystem::path& path) {
  codescope::tests::Log("scenario: file persistence");
  const auto symbol = MakeSymbol("persisted", "p.py");
  {
    auto store = codescope::SymbolStore::Open(path);
    store.Put(symbol, MakeEntry(4.0F));
    store.SetMeta("dimensions", "3");
  }
  auto reopened = codescope::SymbolStore::Open(path);
  Require(reopened.Get(symbol.id).has_value(), "symbol must survive reopen");
  Require(reopened.Entry(symbol.id)->embedding == MakeEntry(4.0F).embedding, "entry must survive reopen");
  Require(reopened.GetMeta("dimensions") == std::string("3"), "meta must survive reopen");
  Require(!reopened.GetMeta("missing").has_value(), "unknown meta key must be empty");
}

}  // namespace

int main() {
  const auto path = UniquePath();
  try {
    codescope::tests::Log("symbol_store_test: start");
    ScenarioPutGetAndUpsert();
    ScenarioDeleteAndClear();
    ScenarioQueriesAndCounts();
    ScenarioTransactionRollback();
    ScenarioBlobCodecs();
    ScenarioFilePersistence(path);
    RemoveDatabase(path);
    codescope::tests::Log("symbol_store_test: finished");
    return EXIT_SUCCESS;
  } catch (const std::exception& ex) {
    RemoveDatabase(path);
    codescope::tests::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
