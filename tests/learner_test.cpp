#undef NDEBUG
#include <cassert>
#include <string>
#include <vector>

#include "bpevocab/learner.hpp"
#include "bpevocab/merger.hpp"
#include "bpevocab/word_table.hpp"

namespace {
bpevocab::WordFrequencyTable LowestLower() {
  bpevocab::WordFrequencyTable table;
  table.AddKey("l o w e s t </w>", 3);
  table.AddKey("l o w e r </w>", 2);
  return table;
}
}  // namespace

int main() {
  using namespace bpevocab;

  BpeLearner learner;

  // first merge is (l, o) with combined frequency 5
  auto first = learner.Train(LowestLower(), 1);
  assert(first.merges.size() == 1);
  assert((first.merges[0].pair == SymbolPair{"l", "o"}));
  assert(first.merges[0].rank == 0);
  assert(first.table.size() == 2);
  assert(first.table.FrequencyOf("lo w e s t </w>") == 3);
  assert(first.table.FrequencyOf("lo w e r </w>") == 2);

  // zero merges leave the table as it was
  auto none = learner.Train(LowestLower(), 0);
  assert(none.merges.empty());
  assert(none.table == LowestLower());

  // running out of pairs ends training early
  auto full = learner.Train(LowestLower(), 100);
  const std::vector<SymbolPair> expected = {
      {"l", "o"},     {"lo", "w"},    {"low", "e"},     {"lowe", "s"},
      {"lowes", "t"}, {"lowest", "</w>"}, {"lowe", "r"}, {"lower", "</w>"},
  };
  assert(full.merges.size() == expected.size());
  for (std::size_t i = 0; i < expected.size(); ++i) {
    assert(full.merges[i].pair == expected[i]);
    assert(full.merges[i].rank == i);
  }
  assert(full.table.FrequencyOf("lowest</w>") == 3);
  assert(full.table.FrequencyOf("lower</w>") == 2);

  // deterministic
  auto again = learner.Train(LowestLower(), 100);
  assert(again.merges == full.merges);
  assert(again.table == full.table);

  // every merge strictly shrinks the total symbol count
  auto replay = LowestLower();
  auto symbols = replay.TotalSymbols();
  for (const auto& rule : full.merges) {
    replay = MergeVocabulary(rule.pair, replay);
    assert(replay.TotalSymbols() < symbols);
    symbols = replay.TotalSymbols();
  }
  assert(replay == full.table);

  WordFrequencyTable tiny;
  tiny.AddKey("a b </w>", 1);
  auto short_run = learner.Train(tiny, 10);
  assert(short_run.merges.size() == 2);
  assert(short_run.table.FrequencyOf("ab</w>") == 1);

  assert(learner.Train(WordFrequencyTable{}, 5).merges.empty());

  // pairs rarer than min_pair_frequency are not merged
  LearnerOptions frequent;
  frequent.min_pair_frequency = 3;
  auto pruned = BpeLearner(frequent).Train(LowestLower(), 100);
  assert(pruned.merges.size() == 6);
  assert((pruned.merges.back().pair == SymbolPair{"lowest", "</w>"}));
  assert(pruned.table.FrequencyOf("lowe r </w>") == 2);

  // 8 initial symbols + 2 merges reach a vocabulary of 10
  LearnerOptions sized;
  sized.target_vocab_size = 10;
  auto capped = BpeLearner(sized).Train(LowestLower(), 100);
  assert(capped.merges.size() == 2);

  LearnerOptions counted;
  counted.num_merges = 3;
  auto by_options = BpeLearner(counted).Train(LowestLower());
  assert(by_options.merges.size() == 3);
  assert(by_options.table.FrequencyOf("lowe s t </w>") == 3);

  auto from_lines = BpeLearner(counted).TrainFromLines({"lowest lowest", "lower lowest", "", "lower"});
  assert(from_lines.merges == by_options.merges);
  assert(from_lines.table == by_options.table);

  return 0;
}
