#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "bpevocab/symbols.hpp"
#include "bpevocab/word_table.hpp"

namespace bpevocab {

using SymbolPair = std::pair<Symbol, Symbol>;

struct ScoredPair {
  SymbolPair pair;
  std::uint64_t count = 0;
};

// Aggregate frequency of every adjacent symbol pair, weighted by word
// frequency. Iteration order is unspecified; use Best() or Sorted() for
// anything order-dependent.
class PairStats {
 public:
  void Add(const Symbol& left, const Symbol& right, std::uint64_t count);
  [[nodiscard]] std::uint64_t CountOf(const Symbol& left, const Symbol& right) const;

  [[nodiscard]] std::size_t size() const { return counts_.size(); }
  [[nodiscard]] bool empty() const { return counts_.empty(); }

  // Highest count wins; equal counts go to the lexicographically smallest
  // (left, right). Nothing is returned when the table is empty or the best
  // count is below `min_count`.
  [[nodiscard]] std::optional<ScoredPair> Best(std::uint64_t min_count = 1) const;

  // All pairs, count descending then pair ascending.
  [[nodiscard]] std::vector<ScoredPair> Sorted() const;

 private:
  struct PairHash {
    std::size_t operator()(const SymbolPair& p) const noexcept;
  };

  std::unordered_map<SymbolPair, std::uint64_t, PairHash> counts_;
};

[[nodiscard]] PairStats ComputePairStats(const WordFrequencyTable& table);

}  // namespace bpevocab
