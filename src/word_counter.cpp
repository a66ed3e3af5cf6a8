#include "bpevocab/word_counter.hpp"

namespace bpevocab {

void CountLine(const std::string& line, SplitMode mode, WordFrequencyTable& table) {
  for (const auto& word : SplitWhitespace(line)) {
    table.Add(Symbolize(word, mode));
  }
}

WordFrequencyTable CountWords(const std::vector<std::string>& lines, SplitMode mode) {
  WordFrequencyTable table;
  for (const auto& line : lines) {
    CountLine(line, mode, table);
  }
  return table;
}

WordFrequencyTable CountWordsFromFiles(const std::vector<std::string>& files, const CorpusReader& reader,
                                       SplitMode mode) {
  WordFrequencyTable table;
  for (const auto& file : files) {
    const bool ok = reader.for_each_record(file, [&](const std::string& record) {
      CountLine(record, mode, table);
    });
    if (!ok) {
      throw SourceUnreadableError(file);
    }
  }
  return table;
}

}  // namespace bpevocab
