#undef NDEBUG
#include <cassert>

#include "bpevocab/pair_stats.hpp"
#include "bpevocab/word_table.hpp"

int main() {
  using namespace bpevocab;

  WordFrequencyTable table;
  table.AddKey("l o w </w>", 5);
  table.AddKey("l o w e r </w>", 2);

  auto stats = ComputePairStats(table);
  assert(stats.size() == 6);
  assert(stats.CountOf("l", "o") == 7);
  assert(stats.CountOf("o", "w") == 7);
  assert(stats.CountOf("w", "</w>") == 5);
  assert(stats.CountOf("w", "e") == 2);
  assert(stats.CountOf("e", "r") == 2);
  assert(stats.CountOf("r", "</w>") == 2);
  assert(stats.CountOf("o", "l") == 0);

  // (l, o) and (o, w) tie at 7; the smaller pair wins
  auto best = stats.Best();
  assert(best.has_value());
  assert((best->pair == SymbolPair{"l", "o"}));
  assert(best->count == 7);
  assert(!stats.Best(8).has_value());

  auto sorted = stats.Sorted();
  assert(sorted.size() == 6);
  assert((sorted[0].pair == SymbolPair{"l", "o"}));
  assert((sorted[1].pair == SymbolPair{"o", "w"}));
  assert((sorted[2].pair == SymbolPair{"w", "</w>"}));
  assert((sorted[5].pair == SymbolPair{"w", "e"}));

  // every pair counts 1: the lexicographically smallest one is chosen
  WordFrequencyTable ties;
  ties.AddKey("b a </w>", 1);
  ties.AddKey("a b </w>", 1);
  auto tie_best = ComputePairStats(ties).Best();
  assert(tie_best.has_value());
  assert((tie_best->pair == SymbolPair{"a", "</w>"}));

  // single-symbol words contribute nothing
  WordFrequencyTable singles;
  singles.AddKey("</w>", 3);
  singles.AddKey("lowest</w>", 2);
  auto none = ComputePairStats(singles);
  assert(none.empty());
  assert(!none.Best().has_value());

  assert(ComputePairStats(WordFrequencyTable{}).empty());

  PairStats manual;
  manual.Add("a", "b", 2);
  manual.Add("a", "b", 3);
  assert(manual.CountOf("a", "b") == 5);
  assert(manual.size() == 1);

  return 0;
}
