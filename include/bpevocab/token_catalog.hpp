#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "bpevocab/symbols.hpp"
#include "bpevocab/word_table.hpp"

namespace bpevocab {

struct TokenEntry {
  Symbol token;
  std::uint64_t frequency = 0;
  std::size_t length = 0;
};

class TokenCatalog {
 public:
  TokenCatalog() = default;

  // Token frequencies and the concatenated-word -> symbols map of `table`.
  // Two words that concatenate to the same string keep only the later one
  // (in key order).
  [[nodiscard]] static TokenCatalog Derive(const WordFrequencyTable& table);

  void AddToken(const Symbol& token, std::uint64_t count);
  [[nodiscard]] std::uint64_t FrequencyOf(std::string_view token) const;

  [[nodiscard]] const std::unordered_map<Symbol, std::uint64_t>& token_frequencies() const {
    return token_frequencies_;
  }
  [[nodiscard]] const std::unordered_map<std::string, Word>& word_to_symbols() const {
    return word_to_symbols_;
  }

  [[nodiscard]] std::size_t size() const { return token_frequencies_.size(); }

  // Sorted by length desc, frequency desc, then token asc.
  [[nodiscard]] std::vector<TokenEntry> Entries() const;
  [[nodiscard]] std::vector<Symbol> SortedTokens() const;

 private:
  std::unordered_map<Symbol, std::uint64_t> token_frequencies_;
  std::unordered_map<std::string, Word> word_to_symbols_;
};

[[nodiscard]] TokenCatalog DeriveTokens(const WordFrequencyTable& table);

// Byte length, except that a trailing end-of-word marker counts as one.
[[nodiscard]] std::size_t MeasureLength(std::string_view token);

}  // namespace bpevocab
