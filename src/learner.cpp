#include "bpevocab/learner.hpp"

#include <iostream>
#include <utility>

#include "bpevocab/pair_stats.hpp"
#include "bpevocab/word_counter.hpp"

namespace bpevocab {

BpeLearner::BpeLearner(LearnerOptions options) : options_(options) {}

TrainResult BpeLearner::Train(WordFrequencyTable table) const {
  return Train(std::move(table), options_.num_merges);
}

TrainResult BpeLearner::Train(WordFrequencyTable table, std::size_t num_merges) const {
  TrainResult result;
  const std::size_t alphabet = options_.target_vocab_size > 0 ? table.DistinctSymbols() : 0;

  for (std::size_t iter = 0; iter < num_merges; ++iter) {
    if (options_.target_vocab_size > 0 && alphabet + result.merges.size() >= options_.target_vocab_size) {
      break;
    }

    const auto stats = ComputePairStats(table);
    const auto best = stats.Best(options_.min_pair_frequency);
    if (!best) {
      break;
    }

    table = MergeVocabulary(best->pair, table);
    result.merges.push_back(MergeRule{best->pair, iter});

    if (options_.progress_every > 0 && (iter + 1) % options_.progress_every == 0) {
      std::cerr << "merge " << (iter + 1) << "/" << num_merges << " (" << best->pair.first << ", "
                << best->pair.second << ") freq=" << best->count
                << " symbols=" << table.TotalSymbols() << "\n";
    }
  }

  result.table = std::move(table);
  return result;
}

TrainResult BpeLearner::TrainFromLines(const std::vector<std::string>& lines) const {
  return Train(CountWords(lines, options_.split_mode));
}

TrainResult BpeLearner::TrainFromFiles(const std::vector<std::string>& files,
                                       const CorpusReader& reader) const {
  return Train(CountWordsFromFiles(files, reader, options_.split_mode));
}

}  // namespace bpevocab
