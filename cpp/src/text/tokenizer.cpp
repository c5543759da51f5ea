#include "codescope/tokenizer.hpp"

#include <array>
#include <cctype>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace codescope {
namespace {

const std::unordered_set<std::string>& Stopwords() {
  static const std::unordered_set<std::string> kStopwords = {
      "self", "def",  "class", "return", "if",   "else", "elif", "for",  "while", "try",
      "except", "finally", "with", "as", "import", "from", "in", "is",   "not",  "and",
      "or",   "none", "true",  "false",  "the",  "a",    "an",   "of",   "to",   "that",
      "this", "it",   "be",    "are",
  };
  return kStopwords;
}

const std::unordered_map<std::string, std::vector<std::string>>& Synonyms() {
  static const std::unordered_map<std::string, std::vector<std::string>> kSynonyms = {
      {"audio", {"sound", "wav", "mp3", "music", "speaker", "volume"}},
      {"animation", {"animate", "animated", "animating", "motion", "transition"}},
      {"animate", {"animation", "animated", "animating", "motion"}},
      {"database", {"db", "sql", "sqlite", "postgres", "mysql", "query"}},
      {"db", {"database", "sql", "sqlite"}},
      {"auth", {"authentication", "authorize", "login", "credential"}},
      {"authentication", {"auth", "login", "credential", "password", "user"}},
      {"login", {"auth", "signin", "authentication"}},
      {"error", {"exception", "fail", "invalid", "problem"}},
      {"exception", {"error", "raise", "catch", "handle"}},
      {"config", {"configuration", "settings", "options", "preferences"}},
      {"configuration", {"config", "settings", "setup"}},
      {"http", {"request", "response", "api", "rest", "web"}},
      {"api", {"endpoint", "route", "http", "rest"}},
      {"file", {"path", "directory", "folder", "io"}},
      {"parse", {"parser", "parsing", "extract", "analyze"}},
      {"parser", {"parse", "parsing", "tokenize"}},
      {"test", {"testing", "unittest", "pytest", "spec"}},
      {"valid", {"validate", "validation", "validator", "check"}},
      {"validate", {"valid", "validation", "validator", "verify"}},
      {"connect", {"connection", "connected", "connecting", "link"}},
      {"connection", {"connect", "connected", "link", "socket"}},
      {"index", {"indexer", "indexing", "indexed"}},
      {"indexer", {"index", "indexing"}},
      {"search", {"find", "query", "lookup", "match"}},
      {"user", {"account", "profile", "member"}},
      {"create", {"make", "new", "add", "insert", "generate"}},
      {"delete", {"remove", "destroy", "drop"}},
      {"update", {"modify", "change", "edit", "patch"}},
      {"get", {"fetch", "retrieve", "read", "obtain"}},
      {"set", {"assign", "store", "write", "put"}},
      {"load", {"read", "import", "fetch", "retrieve"}},
      {"save", {"write", "store", "export", "persist"}},
      {"send", {"transmit", "emit", "dispatch", "post"}},
      {"receive", {"get", "accept", "handle"}},
      {"process", {"handle", "execute", "run", "perform"}},
      {"handle", {"process", "manage", "deal"}},
      {"cache", {"store", "buffer", "memory"}},
      {"encrypt", {"encryption", "hash", "secure", "crypto"}},
      {"decrypt", {"decryption", "decode"}},
  };
  return kSynonyms;
}

constexpr std::array<std::string_view, 13> kSuffixes = {
    "tion", "sion", "ment", "ness", "able", "ible", "ing", "ed", "er", "est", "ly", "es", "s",
};

bool IsUpper(char ch) {
  return std::isupper(static_cast<unsigned char>(ch)) != 0;
}

bool IsLower(char ch) {
  return std::islower(static_cast<unsigned char>(ch)) != 0;
}

bool IsDigit(char ch) {
  return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

bool IsAlpha(char ch) {
  return std::isalpha(static_cast<unsigned char>(ch)) != 0;
}

void EmitToken(std::string_view piece, std::size_t min_token_length, std::vector<std::string>& out) {
  if (piece.size() < min_token_length) {
    return;
  }
  std::string token;
  token.reserve(piece.size());
  for (const char ch : piece) {
    token.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  if (Stopwords().count(token) != 0) {
    return;
  }
  out.push_back(std::move(token));
}

// Splits one alphanumeric run at case and letter/digit boundaries.
void SplitWord(std::string_view word, std::size_t min_token_length, std::vector<std::string>& out) {
  std::size_t start = 0;
  for (std::size_t i = 1; i < word.size(); ++i) {
    const char prev = word[i - 1];
    const char cur = word[i];
    bool boundary = false;
    if (IsUpper(cur) && (IsLower(prev) || IsDigit(prev))) {
      boundary = true;  // fooBar, utf8Decode
    } else if (IsUpper(cur) && IsUpper(prev) && i + 1 < word.size() && IsLower(word[i + 1])) {
      boundary = true;  // HTTPServer
    } else if (IsAlpha(cur) && IsDigit(prev)) {
      boundary = true;  // v2beta
    }
    if (boundary) {
      EmitToken(word.substr(start, i - start), min_token_length, out);
      start = i;
    }
  }
  if (start < word.size()) {
    EmitToken(word.substr(start), min_token_length, out);
  }
}

void AppendTokens(TermVector& terms, std::string_view text, std::size_t min_token_length, std::uint32_t weight) {
  if (text.empty()) {
    return;
  }
  for (auto& token : Tokenize(text, min_token_length)) {
    terms[std::move(token)] += weight;
  }
}

}  // namespace

std::vector<std::string> Tokenize(std::string_view text, std::size_t min_token_length) {
  std::vector<std::string> tokens{};
  std::size_t start = 0;
  while (start < text.size()) {
    while (start < text.size() && std::isalnum(static_cast<unsigned char>(text[start])) == 0) {
      ++start;
    }
    std::size_t end = start;
    while (end < text.size() && std::isalnum(static_cast<unsigned char>(text[end])) != 0) {
      ++end;
    }
    if (end > start) {
      SplitWord(text.substr(start, end - start), min_token_length, tokens);
    }
    start = end;
  }
  return tokens;
}

std::string Stem(std::string_view word) {
  for (const auto suffix : kSuffixes) {
    if (word.size() >= suffix.size() + 3 && word.substr(word.size() - suffix.size()) == suffix) {
      return std::string(word.substr(0, word.size() - suffix.size()));
    }
  }
  return std::string(word);
}

std::vector<ExpandedTerm> ExpandQuery(const std::vector<std::string>& tokens) {
  std::vector<ExpandedTerm> out{};
  std::unordered_set<std::string> seen{};
  for (const auto& token : tokens) {
    if (seen.insert(token).second) {
      out.push_back(ExpandedTerm{token, true});
    }
  }

  auto add_expanded = [&](std::string term) {
    if (term.empty()) {
      return;
    }
    if (seen.insert(term).second) {
      out.push_back(ExpandedTerm{std::move(term), false});
    }
  };
  auto add_synonyms = [&](const std::string& key) {
    const auto it = Synonyms().find(key);
    if (it == Synonyms().end()) {
      return;
    }
    for (const auto& synonym : it->second) {
      add_expanded(synonym);
      add_expanded(Stem(synonym));
    }
  };

  for (const auto& token : tokens) {
    const auto stemmed = Stem(token);
    add_expanded(stemmed);
    add_synonyms(token);
    if (stemmed != token) {
      add_synonyms(stemmed);
    }
  }
  return out;
}

TermVector BuildTermVector(const Symbol& symbol, std::size_t min_token_length) {
  TermVector terms{};
  AppendTokens(terms, symbol.name, min_token_length, 3);
  if (symbol.doc_text.has_value()) {
    AppendTokens(terms, *symbol.doc_text, min_token_length, 2);
  }
  AppendTokens(terms, symbol.code_text, min_token_length, 1);
  AppendTokens(terms, SymbolKindName(symbol.kind), min_token_length, 1);
  return terms;
}

std::string EmbeddingText(const Symbol& symbol) {
  std::string text = symbol.name;
  text.push_back('\n');
  if (symbol.doc_text.has_value()) {
    text.append(*symbol.doc_text);
  }
  text.push_back('\n');
  text.append(symbol.code_text);
  return text;
}

}  // namespace codescope
