#include <iostream>
#include <vector>

#include "bpevocab/formats.hpp"
#include "bpevocab/learner.hpp"
#include "bpevocab/token_catalog.hpp"
#include "bpevocab/tokenizer.hpp"

int main() {
  using namespace bpevocab;

  std::vector<std::string> corpus = {
      "low low low low low",
      "lower lower newest newest newest",
      "newest newest newest widest widest widest",
  };

  LearnerOptions opts;
  opts.num_merges = 10;
  opts.progress_every = 1;
  BpeLearner learner(opts);

  auto result = learner.TrainFromLines(corpus);
  auto catalog = DeriveTokens(result.table);
  SaveMerges(result.merges, "merges.txt");

  std::cout << "Merges:";
  for (const auto& rule : result.merges) {
    std::cout << " (" << rule.pair.first << ' ' << rule.pair.second << ')';
  }

  auto tokenizer = GreedyTokenizer::FromCatalog(catalog);
  auto tokens = tokenizer.Encode("lowest newer mystery");
  std::cout << "\nTokens:";
  for (const auto& t : tokens) {
    std::cout << ' ' << t;
  }
  std::cout << "\nDecoded: " << tokenizer.Decode(tokens) << '\n';
  return 0;
}
