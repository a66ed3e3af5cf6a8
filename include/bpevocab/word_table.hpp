#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "bpevocab/symbols.hpp"

namespace bpevocab {

struct WordEntry {
  Word symbols;
  std::uint64_t frequency = 0;
};

// Distinct words keyed by their space-joined symbols. Iteration follows key
// order, so everything derived from a table is deterministic.
class WordFrequencyTable {
 public:
  using Map = std::map<std::string, WordEntry, std::less<>>;
  using const_iterator = Map::const_iterator;

  WordFrequencyTable() = default;

  // Adds `count` occurrences of `word`, inserting it when absent. Throws
  // std::invalid_argument for an empty word, an empty symbol or a zero count.
  void Add(Word word, std::uint64_t count = 1);
  void AddKey(std::string_view key, std::uint64_t count = 1);

  [[nodiscard]] std::uint64_t FrequencyOf(std::string_view key) const;
  [[nodiscard]] bool Contains(std::string_view key) const;

  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] bool empty() const { return entries_.empty(); }
  [[nodiscard]] const_iterator begin() const { return entries_.begin(); }
  [[nodiscard]] const_iterator end() const { return entries_.end(); }

  [[nodiscard]] std::uint64_t TotalSymbols() const;
  [[nodiscard]] std::size_t DistinctSymbols() const;

  bool operator==(const WordFrequencyTable& other) const;

 private:
  Map entries_;
};

}  // namespace bpevocab
