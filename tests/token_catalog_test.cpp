#undef NDEBUG
#include <cassert>
#include <vector>

#include "bpevocab/token_catalog.hpp"
#include "bpevocab/word_table.hpp"

int main() {
  using namespace bpevocab;

  assert(MeasureLength("</w>") == 1);
  assert(MeasureLength("hi</w>") == 3);
  assert(MeasureLength("abc") == 3);
  assert(MeasureLength("") == 0);
  assert(MeasureLength("w>") == 2);
  assert(MeasureLength("\xC3\xA9") == 2);

  WordFrequencyTable table;
  table.AddKey("lo w e s t </w>", 3);
  table.AddKey("lo w e r </w>", 2);

  auto catalog = DeriveTokens(table);
  assert(catalog.size() == 7);
  assert(catalog.FrequencyOf("lo") == 5);
  assert(catalog.FrequencyOf("w") == 5);
  assert(catalog.FrequencyOf("</w>") == 5);
  assert(catalog.FrequencyOf("s") == 3);
  assert(catalog.FrequencyOf("r") == 2);
  assert(catalog.FrequencyOf("l") == 0);

  const auto& words = catalog.word_to_symbols();
  assert(words.size() == 2);
  assert((words.at("lowest</w>") == Word{"lo", "w", "e", "s", "t", "</w>"}));
  assert((words.at("lower</w>") == Word{"lo", "w", "e", "r", "</w>"}));

  // length desc, frequency desc, then token
  const std::vector<Symbol> expected = {"lo", "</w>", "e", "w", "s", "t", "r"};
  assert(catalog.SortedTokens() == expected);

  auto entries = catalog.Entries();
  assert(entries.size() == 7);
  assert(entries[0].token == "lo" && entries[0].length == 2 && entries[0].frequency == 5);
  assert(entries[1].token == "</w>" && entries[1].length == 1);

  // a trailing marker counts as one unit when sorting
  WordFrequencyTable merged;
  merged.AddKey("lowest</w>", 1);
  merged.AddKey("lowes t </w>", 4);
  auto merged_sorted = DeriveTokens(merged).SortedTokens();
  assert((merged_sorted == std::vector<Symbol>{"lowest</w>", "lowes", "</w>", "t"}));

  // distinct words with the same concatenation: the later key wins
  WordFrequencyTable collide;
  collide.AddKey("a bc </w>", 1);
  collide.AddKey("ab c </w>", 1);
  auto lossy = DeriveTokens(collide);
  assert(lossy.word_to_symbols().size() == 1);
  assert((lossy.word_to_symbols().at("abc</w>") == Word{"ab", "c", "</w>"}));
  assert(lossy.FrequencyOf("</w>") == 2);

  assert(DeriveTokens(WordFrequencyTable{}).SortedTokens().empty());

  return 0;
}
