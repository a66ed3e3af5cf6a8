#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "bpevocab/corpus_reader.hpp"
#include "bpevocab/symbols.hpp"
#include "bpevocab/word_table.hpp"

namespace bpevocab {

class SourceUnreadableError : public std::runtime_error {
 public:
  explicit SourceUnreadableError(const std::string& path)
      : std::runtime_error("unable to read file: " + path), path_(path) {}

  [[nodiscard]] const std::string& path() const { return path_; }

 private:
  std::string path_;
};

void CountLine(const std::string& line, SplitMode mode, WordFrequencyTable& table);

// Initial table: every whitespace-delimited word, symbolized and counted.
[[nodiscard]] WordFrequencyTable CountWords(const std::vector<std::string>& lines,
                                            SplitMode mode = SplitMode::kCodepoint);

// Throws SourceUnreadableError for the first file that cannot be read.
[[nodiscard]] WordFrequencyTable CountWordsFromFiles(const std::vector<std::string>& files,
                                                     const CorpusReader& reader = CorpusReader{},
                                                     SplitMode mode = SplitMode::kCodepoint);

}  // namespace bpevocab
