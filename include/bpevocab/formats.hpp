#pragma once

#include <string>
#include <vector>

#include "bpevocab/learner.hpp"
#include "bpevocab/merger.hpp"
#include "bpevocab/symbols.hpp"
#include "bpevocab/token_catalog.hpp"

namespace bpevocab {

struct SavedModel {
  MergeRules merges;
  std::vector<Symbol> sorted_tokens;
  Symbol unknown = Symbol(kDefaultUnknown);
};

void SaveMerges(const MergeRules& merges, const std::string& merges_path);
[[nodiscard]] MergeRules LoadMerges(const std::string& merges_path);

// Vocabulary ids follow the catalog's sorted order, so the greedy tokenizer's
// priority list can be rebuilt from the file alone.
void SaveTokenizerJson(const TrainResult& result,
                       const TokenCatalog& catalog,
                       const std::string& tokenizer_json_path,
                       const std::string& unknown = std::string(kDefaultUnknown));

[[nodiscard]] SavedModel LoadTokenizerJson(const std::string& tokenizer_json_path);

}  // namespace bpevocab
