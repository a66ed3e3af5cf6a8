#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "bpevocab/formats.hpp"
#include "bpevocab/learner.hpp"
#include "bpevocab/merger.hpp"
#include "bpevocab/pair_stats.hpp"
#include "bpevocab/token_catalog.hpp"
#include "bpevocab/tokenizer.hpp"
#include "bpevocab/word_counter.hpp"

namespace py = pybind11;
using namespace bpevocab;

namespace {
// Byte-split symbols need not be valid UTF-8, so they cross as bytes.
py::list ToBytesList(const std::vector<Symbol>& symbols) {
  py::list out;
  for (const auto& s : symbols) out.append(py::bytes(s));
  return out;
}

py::tuple ToBytesPair(const SymbolPair& pair) {
  return py::make_tuple(py::bytes(pair.first), py::bytes(pair.second));
}
}  // namespace

PYBIND11_MODULE(pybpevocab, m) {
  py::enum_<SplitMode>(m, "SplitMode")
      .value("CODEPOINT", SplitMode::kCodepoint)
      .value("BYTE", SplitMode::kByte);

  py::class_<WordFrequencyTable>(m, "WordFrequencyTable")
      .def(py::init<>())
      .def("add", &WordFrequencyTable::Add, py::arg("word"), py::arg("count") = 1)
      .def("add_key", &WordFrequencyTable::AddKey, py::arg("key"), py::arg("count") = 1)
      .def("frequency_of", &WordFrequencyTable::FrequencyOf)
      .def("total_symbols", &WordFrequencyTable::TotalSymbols)
      .def("distinct_symbols", &WordFrequencyTable::DistinctSymbols)
      .def("items", [](const WordFrequencyTable& self) {
        py::list out;
        for (const auto& [key, entry] : self) out.append(py::make_tuple(py::bytes(key), entry.frequency));
        return out;
      })
      .def("__len__", &WordFrequencyTable::size);

  py::class_<MergeRule>(m, "MergeRule")
      .def_property_readonly("pair", [](const MergeRule& self) { return ToBytesPair(self.pair); })
      .def_readonly("rank", &MergeRule::rank);

  py::class_<LearnerOptions>(m, "LearnerOptions")
      .def(py::init<>())
      .def_readwrite("num_merges", &LearnerOptions::num_merges)
      .def_readwrite("target_vocab_size", &LearnerOptions::target_vocab_size)
      .def_readwrite("min_pair_frequency", &LearnerOptions::min_pair_frequency)
      .def_readwrite("progress_every", &LearnerOptions::progress_every)
      .def_readwrite("split_mode", &LearnerOptions::split_mode);

  py::class_<TrainResult>(m, "TrainResult")
      .def_readonly("merges", &TrainResult::merges)
      .def_readonly("table", &TrainResult::table);

  py::class_<BpeLearner>(m, "BpeLearner")
      .def(py::init<LearnerOptions>(), py::arg("options") = LearnerOptions{})
      .def("train", [](const BpeLearner& self, const WordFrequencyTable& table, std::size_t num_merges) {
        return self.Train(table, num_merges);
      })
      .def("train_from_lines", &BpeLearner::TrainFromLines)
      .def("train_from_files", [](const BpeLearner& self, const std::vector<std::string>& files) {
        return self.TrainFromFiles(files);
      });

  py::class_<TokenCatalog>(m, "TokenCatalog")
      .def_static("derive", &TokenCatalog::Derive)
      .def("frequency_of", &TokenCatalog::FrequencyOf)
      .def("sorted_tokens", [](const TokenCatalog& self) { return ToBytesList(self.SortedTokens()); })
      .def_property_readonly("word_to_symbols", [](const TokenCatalog& self) {
        py::dict out;
        for (const auto& [word, symbols] : self.word_to_symbols()) out[py::bytes(word)] = ToBytesList(symbols);
        return out;
      })
      .def("__len__", &TokenCatalog::size);

  py::class_<GreedyTokenizer>(m, "GreedyTokenizer")
      .def(py::init([](std::vector<Symbol> tokens, Symbol unknown) {
             return GreedyTokenizer(std::move(tokens), std::move(unknown));
           }),
           py::arg("sorted_tokens"), py::arg("unknown") = Symbol(kDefaultUnknown))
      .def_static("from_catalog", &GreedyTokenizer::FromCatalog, py::arg("catalog"),
                  py::arg("unknown") = Symbol(kDefaultUnknown))
      .def("encode_word", [](const GreedyTokenizer& self, const std::string& word) {
        return ToBytesList(self.EncodeWord(word));
      })
      .def("encode", [](const GreedyTokenizer& self, const std::string& text) {
        return ToBytesList(self.Encode(text));
      })
      .def("decode", [](const GreedyTokenizer& self, const std::vector<Symbol>& tokens) {
        return py::bytes(self.Decode(tokens));
      });

  m.def("count_words", &CountWords, py::arg("lines"), py::arg("mode") = SplitMode::kCodepoint);
  m.def("compute_pair_stats", [](const WordFrequencyTable& table) {
    py::list out;
    for (const auto& scored : ComputePairStats(table).Sorted()) {
      out.append(py::make_tuple(ToBytesPair(scored.pair), scored.count));
    }
    return out;
  });
  m.def("merge_vocabulary",
        py::overload_cast<const std::vector<Symbol>&, const WordFrequencyTable&>(&MergeVocabulary));
  m.def("measure_length", &MeasureLength);
  m.def("tokenize", [](const std::string& text, const std::vector<Symbol>& tokens, const std::string& unknown) {
    return ToBytesList(Tokenize(text, tokens, unknown));
  }, py::arg("text"), py::arg("sorted_tokens"), py::arg("unknown") = std::string(kDefaultUnknown));
  m.def("save_merges", &SaveMerges);
  m.def("load_merges", &LoadMerges);
}
