#include "bpevocab/merger.hpp"

#include <limits>
#include <stdexcept>

namespace bpevocab {

Word MergeWord(const SymbolPair& pair, const Word& word) {
  Word merged;
  merged.reserve(word.size());
  for (std::size_t i = 0; i < word.size();) {
    if (i + 1 < word.size() && word[i] == pair.first && word[i + 1] == pair.second) {
      merged.push_back(pair.first + pair.second);
      i += 2;
    } else {
      merged.push_back(word[i]);
      ++i;
    }
  }
  return merged;
}

WordFrequencyTable MergeVocabulary(const SymbolPair& pair, const WordFrequencyTable& table) {
  if (pair.first.empty() || pair.second.empty()) {
    throw std::invalid_argument("merge pair has an empty symbol");
  }

  WordFrequencyTable out;
  for (const auto& [key, entry] : table) {
    if (entry.symbols.size() < 2) {
      out.Add(entry.symbols, entry.frequency);
      continue;
    }
    out.Add(MergeWord(pair, entry.symbols), entry.frequency);
  }
  return out;
}

WordFrequencyTable MergeVocabulary(const std::vector<Symbol>& pair, const WordFrequencyTable& table) {
  if (pair.size() != 2) {
    throw std::invalid_argument("merge pair must have exactly two symbols, got " +
                                std::to_string(pair.size()));
  }
  return MergeVocabulary(SymbolPair{pair[0], pair[1]}, table);
}

MergeRanks::MergeRanks(const MergeRules& rules) {
  for (const auto& rule : rules) {
    // the first rule for a pair keeps its rank
    rank_.emplace(RankKey(rule.pair.first, rule.pair.second), rule.rank);
  }
}

std::string MergeRanks::RankKey(const Symbol& left, const Symbol& right) {
  return left + "\t" + right;
}

Word MergeRanks::Apply(Word pieces) const {
  if (pieces.size() < 2 || rank_.empty()) return pieces;
  while (pieces.size() > 1) {
    std::size_t best_rank = std::numeric_limits<std::size_t>::max();
    std::size_t best_idx = pieces.size();
    for (std::size_t i = 0; i + 1 < pieces.size(); ++i) {
      auto it = rank_.find(RankKey(pieces[i], pieces[i + 1]));
      if (it != rank_.end() && it->second < best_rank) {
        best_rank = it->second;
        best_idx = i;
      }
    }
    if (best_idx == pieces.size()) break;
    pieces[best_idx] += pieces[best_idx + 1];
    pieces.erase(pieces.begin() + static_cast<std::ptrdiff_t>(best_idx + 1));
  }
  return pieces;
}

}  // namespace bpevocab
