#include "bpevocab/word_table.hpp"

#include <stdexcept>
#include <unordered_set>

namespace bpevocab {

void WordFrequencyTable::Add(Word word, std::uint64_t count) {
  if (count == 0) {
    throw std::invalid_argument("word frequency must be positive");
  }
  if (word.empty()) {
    throw std::invalid_argument("word has no symbols");
  }
  for (const auto& symbol : word) {
    if (symbol.empty()) {
      throw std::invalid_argument("word contains an empty symbol");
    }
  }

  auto key = JoinSymbols(word);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    entries_.emplace(std::move(key), WordEntry{std::move(word), count});
    return;
  }
  it->second.frequency += count;
}

void WordFrequencyTable::AddKey(std::string_view key, std::uint64_t count) {
  Add(SplitSymbols(key), count);
}

std::uint64_t WordFrequencyTable::FrequencyOf(std::string_view key) const {
  auto it = entries_.find(key);
  return it == entries_.end() ? 0 : it->second.frequency;
}

bool WordFrequencyTable::Contains(std::string_view key) const {
  return entries_.find(key) != entries_.end();
}

std::uint64_t WordFrequencyTable::TotalSymbols() const {
  std::uint64_t total = 0;
  for (const auto& [key, entry] : entries_) {
    total += static_cast<std::uint64_t>(entry.symbols.size()) * entry.frequency;
  }
  return total;
}

std::size_t WordFrequencyTable::DistinctSymbols() const {
  std::unordered_set<std::string_view> seen;
  for (const auto& [key, entry] : entries_) {
    for (const auto& symbol : entry.symbols) {
      seen.insert(symbol);
    }
  }
  return seen.size();
}

bool WordFrequencyTable::operator==(const WordFrequencyTable& other) const {
  if (entries_.size() != other.entries_.size()) {
    return false;
  }
  auto it = other.entries_.begin();
  for (const auto& [key, entry] : entries_) {
    if (key != it->first || entry.frequency != it->second.frequency) {
      return false;
    }
    ++it;
  }
  return true;
}

}  // namespace bpevocab
