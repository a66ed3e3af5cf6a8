#include "bpevocab/token_catalog.hpp"

#include <algorithm>
#include <utility>

namespace bpevocab {

TokenCatalog TokenCatalog::Derive(const WordFrequencyTable& table) {
  TokenCatalog catalog;
  for (const auto& [key, entry] : table) {
    for (const auto& symbol : entry.symbols) {
      catalog.AddToken(symbol, entry.frequency);
    }
    catalog.word_to_symbols_[JoinSymbols(entry.symbols, "")] = entry.symbols;
  }
  return catalog;
}

void TokenCatalog::AddToken(const Symbol& token, std::uint64_t count) {
  auto it = token_frequencies_.find(token);
  if (it == token_frequencies_.end()) {
    token_frequencies_.emplace(token, count);
    return;
  }
  it->second += count;
}

std::uint64_t TokenCatalog::FrequencyOf(std::string_view token) const {
  auto it = token_frequencies_.find(std::string(token));
  return it == token_frequencies_.end() ? 0 : it->second;
}

std::vector<TokenEntry> TokenCatalog::Entries() const {
  std::vector<TokenEntry> out;
  out.reserve(token_frequencies_.size());
  for (const auto& [token, freq] : token_frequencies_) {
    out.push_back(TokenEntry{token, freq, MeasureLength(token)});
  }
  std::sort(out.begin(), out.end(), [](const TokenEntry& l, const TokenEntry& r) {
    if (l.length != r.length) return l.length > r.length;
    if (l.frequency != r.frequency) return l.frequency > r.frequency;
    return l.token < r.token;
  });
  return out;
}

std::vector<Symbol> TokenCatalog::SortedTokens() const {
  std::vector<Symbol> out;
  auto entries = Entries();
  out.reserve(entries.size());
  for (auto& e : entries) {
    out.push_back(std::move(e.token));
  }
  return out;
}

TokenCatalog DeriveTokens(const WordFrequencyTable& table) { return TokenCatalog::Derive(table); }

std::size_t MeasureLength(std::string_view token) {
  if (token.size() >= kEndOfWord.size() && token.substr(token.size() - kEndOfWord.size()) == kEndOfWord) {
    return token.size() - kEndOfWord.size() + 1;
  }
  return token.size();
}

}  // namespace bpevocab
