#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "bpevocab/corpus_reader.hpp"
#include "bpevocab/merger.hpp"
#include "bpevocab/word_table.hpp"

namespace bpevocab {

struct LearnerOptions {
  std::size_t num_merges = 1000;
  std::size_t target_vocab_size = 0;  // initial symbols + merges; 0 -> off
  std::uint64_t min_pair_frequency = 1;
  std::size_t progress_every = 0;     // 0 -> quiet
  SplitMode split_mode = SplitMode::kCodepoint;
};

struct TrainResult {
  MergeRules merges;
  WordFrequencyTable table;
};

class BpeLearner {
 public:
  explicit BpeLearner(LearnerOptions options = {});

  // Runs at most options.num_merges iterations. Fewer rules come back when the
  // table runs out of pairs, when the best pair falls below
  // min_pair_frequency, or when target_vocab_size is reached.
  [[nodiscard]] TrainResult Train(WordFrequencyTable table) const;
  [[nodiscard]] TrainResult Train(WordFrequencyTable table, std::size_t num_merges) const;

  [[nodiscard]] TrainResult TrainFromLines(const std::vector<std::string>& lines) const;
  [[nodiscard]] TrainResult TrainFromFiles(const std::vector<std::string>& files,
                                           const CorpusReader& reader = CorpusReader{}) const;

  [[nodiscard]] const LearnerOptions& options() const { return options_; }

 private:
  LearnerOptions options_;
};

}  // namespace bpevocab
