#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "bpevocab/symbols.hpp"
#include "bpevocab/token_catalog.hpp"

namespace bpevocab {

// Greedy longest-known-token-first segmentation. The first token of
// `sorted_tokens` that occurs in `text` decides the whole level: each of its
// non-overlapping left-to-right occurrences is emitted and the gaps are
// tokenized with the tokens after it only. Residue nothing matches becomes a
// single `unknown`. Matching is literal; empty tokens are ignored.
[[nodiscard]] std::vector<Symbol> Tokenize(std::string_view text,
                                           std::span<const Symbol> sorted_tokens,
                                           std::string_view unknown = kDefaultUnknown);

class GreedyTokenizer {
 public:
  using WordCache = std::unordered_map<std::string, Word>;

  explicit GreedyTokenizer(std::vector<Symbol> sorted_tokens,
                           Symbol unknown = Symbol(kDefaultUnknown),
                           WordCache cache = {});

  [[nodiscard]] static GreedyTokenizer FromCatalog(const TokenCatalog& catalog,
                                                   Symbol unknown = Symbol(kDefaultUnknown));

  // Tokenizes `word` + end-of-word marker; words seen in training come
  // straight from the cache.
  [[nodiscard]] std::vector<Symbol> EncodeWord(std::string_view word) const;
  [[nodiscard]] std::vector<Symbol> Encode(std::string_view text) const;
  [[nodiscard]] std::string Decode(std::span<const Symbol> tokens) const;

  [[nodiscard]] std::size_t VocabSize() const { return sorted_tokens_.size(); }
  [[nodiscard]] const std::vector<Symbol>& sorted_tokens() const { return sorted_tokens_; }
  [[nodiscard]] const Symbol& unknown() const { return unknown_; }

 private:
  std::vector<Symbol> sorted_tokens_;
  Symbol unknown_;
  WordCache cache_;
};

}  // namespace bpevocab
