#include "bpevocab/pair_stats.hpp"

#include <algorithm>
#include <functional>
#include <string>

namespace bpevocab {

namespace {
bool Outranks(std::uint64_t count, const SymbolPair& pair, std::uint64_t other_count,
              const SymbolPair& other_pair) {
  if (count != other_count) {
    return count > other_count;
  }
  return pair < other_pair;
}
}  // namespace

std::size_t PairStats::PairHash::operator()(const SymbolPair& p) const noexcept {
  const std::size_t a = std::hash<std::string>{}(p.first);
  const std::size_t b = std::hash<std::string>{}(p.second);
  return a ^ (b + 0x9e3779b9u + (a << 6) + (a >> 2));
}

void PairStats::Add(const Symbol& left, const Symbol& right, std::uint64_t count) {
  auto key = std::make_pair(left, right);
  auto it = counts_.find(key);
  if (it == counts_.end()) {
    counts_.emplace(std::move(key), count);
    return;
  }
  it->second += count;
}

std::uint64_t PairStats::CountOf(const Symbol& left, const Symbol& right) const {
  auto it = counts_.find(std::make_pair(left, right));
  return it == counts_.end() ? 0 : it->second;
}

std::optional<ScoredPair> PairStats::Best(std::uint64_t min_count) const {
  const SymbolPair* best = nullptr;
  std::uint64_t best_count = 0;
  for (const auto& [pair, cnt] : counts_) {
    if (best == nullptr || Outranks(cnt, pair, best_count, *best)) {
      best = &pair;
      best_count = cnt;
    }
  }
  if (best == nullptr || best_count < min_count) {
    return std::nullopt;
  }
  return ScoredPair{*best, best_count};
}

std::vector<ScoredPair> PairStats::Sorted() const {
  std::vector<ScoredPair> out;
  out.reserve(counts_.size());
  for (const auto& [pair, cnt] : counts_) {
    out.push_back(ScoredPair{pair, cnt});
  }
  std::sort(out.begin(), out.end(), [](const ScoredPair& l, const ScoredPair& r) {
    return Outranks(l.count, l.pair, r.count, r.pair);
  });
  return out;
}

PairStats ComputePairStats(const WordFrequencyTable& table) {
  PairStats stats;
  for (const auto& [key, entry] : table) {
    const auto& seq = entry.symbols;
    for (std::size_t j = 0; j + 1 < seq.size(); ++j) {
      stats.Add(seq[j], seq[j + 1], entry.frequency);
    }
  }
  return stats;
}

}  // namespace bpevocab
