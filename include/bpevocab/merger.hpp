#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "bpevocab/pair_stats.hpp"
#include "bpevocab/symbols.hpp"
#include "bpevocab/word_table.hpp"

namespace bpevocab {

// One learned merge. `rank` is the iteration that produced it; lower ranks
// take priority.
struct MergeRule {
  SymbolPair pair;
  std::size_t rank = 0;

  bool operator==(const MergeRule& other) const = default;
};

using MergeRules = std::vector<MergeRule>;

// Returns a new table in which every non-overlapping, left-to-right occurrence
// of `pair` as two whole adjacent symbols is fused into one symbol. Keys that
// collapse onto each other have their frequencies summed.
// Throws std::invalid_argument when a side of the pair is empty.
[[nodiscard]] WordFrequencyTable MergeVocabulary(const SymbolPair& pair,
                                                 const WordFrequencyTable& table);

// Same, for a pair given as a symbol list; anything other than exactly two
// symbols is rejected with std::invalid_argument.
[[nodiscard]] WordFrequencyTable MergeVocabulary(const std::vector<Symbol>& pair,
                                                 const WordFrequencyTable& table);

[[nodiscard]] Word MergeWord(const SymbolPair& pair, const Word& word);

// Re-segments new words with a learned rule list: the adjacent pair with the
// lowest rank is fused until no adjacent pair has a rule.
class MergeRanks {
 public:
  MergeRanks() = default;
  explicit MergeRanks(const MergeRules& rules);

  [[nodiscard]] Word Apply(Word symbols) const;
  [[nodiscard]] std::size_t size() const { return rank_.size(); }

 private:
  static std::string RankKey(const Symbol& left, const Symbol& right);

  std::unordered_map<std::string, std::size_t> rank_;
};

}  // namespace bpevocab
