#undef NDEBUG
#include <cassert>
#include <string>
#include <vector>

#include "bpevocab/learner.hpp"
#include "bpevocab/token_catalog.hpp"
#include "bpevocab/tokenizer.hpp"

namespace {
using bpevocab::Symbol;
using Tokens = std::vector<Symbol>;

bpevocab::WordFrequencyTable LowestLower() {
  bpevocab::WordFrequencyTable table;
  table.AddKey("l o w e s t </w>", 3);
  table.AddKey("l o w e r </w>", 2);
  return table;
}
}  // namespace

int main() {
  using namespace bpevocab;

  const Tokens some = {"low", "er</w>"};
  assert(Tokenize("", some).empty());
  assert((Tokenize("xyz", Tokens{}, "</u>") == Tokens{"</u>"}));
  assert((Tokenize("lower</w>", some) == Tokens{"low", "er</w>"}));

  // the first matching token fixes the level; gaps only see later tokens
  assert((Tokenize("cab", Tokens{"ab", "c", "a"}) == Tokens{"c", "ab"}));
  assert((Tokenize("abc", Tokens{"ab", "bc", "c"}) == Tokens{"ab", "c"}));
  assert((Tokenize("ab", Tokens{"b", "ab"}) == Tokens{"</u>", "b"}));

  // all non-overlapping occurrences, left to right
  assert((Tokenize("abxab", Tokens{"ab"}) == Tokens{"ab", "</u>", "ab"}));
  assert((Tokenize("aaa", Tokens{"aa", "a"}) == Tokens{"aa", "a"}));
  assert((Tokenize("xyz", Tokens{"q"}, "<unk>") == Tokens{"<unk>"}));

  // literal matching
  assert((Tokenize("abc", Tokens{"a.c"}) == Tokens{"</u>"}));
  assert((Tokenize("a.c", Tokens{"a.c"}) == Tokens{"a.c"}));
  assert((Tokenize("xyz", Tokens{".*", "[x]"}) == Tokens{"</u>"}));
  assert((Tokenize("x.y", Tokens{"."}) == Tokens{"</u>", ".", "</u>"}));

  assert((Tokenize("x", Tokens{"", "x"}) == Tokens{"x"}));

  // three merges: lowe s t </w> and lowe r </w>
  auto partial = BpeLearner().Train(LowestLower(), 3);
  auto partial_catalog = DeriveTokens(partial.table);
  assert((partial_catalog.SortedTokens() == Tokens{"lowe", "</w>", "s", "t", "r"}));

  auto tokenizer = GreedyTokenizer::FromCatalog(partial_catalog);
  assert(tokenizer.VocabSize() == 5);
  assert(tokenizer.unknown() == "</u>");
  assert((tokenizer.EncodeWord("lowest") == Tokens{"lowe", "s", "t", "</w>"}));
  assert((tokenizer.EncodeWord("lowers") == Tokens{"lowe", "r", "s", "</w>"}));
  assert((tokenizer.EncodeWord("slow") == Tokens{"s", "</u>", "</w>"}));
  assert((tokenizer.Encode(" lower  lowers ") == Tokens{"lowe", "r", "</w>", "lowe", "r", "s", "</w>"}));
  assert(tokenizer.Encode("").empty());

  const Tokens encoded = tokenizer.Encode("lowers lowest");
  assert(tokenizer.Decode(encoded) == "lowers lowest");

  // fully merged: whole words only
  auto full = BpeLearner().Train(LowestLower(), 100);
  auto whole = GreedyTokenizer::FromCatalog(DeriveTokens(full.table), "<unk>");
  assert((whole.sorted_tokens() == Tokens{"lowest</w>", "lower</w>"}));
  assert((whole.Encode("lowest lower") == Tokens{"lowest</w>", "lower</w>"}));
  assert((whole.EncodeWord("low") == Tokens{"<unk>"}));

  GreedyTokenizer bare(Tokens{});
  assert((bare.EncodeWord("a") == Tokens{"</u>"}));

  return 0;
}
