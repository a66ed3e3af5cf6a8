#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "bpevocab/corpus_reader.hpp"
#include "bpevocab/learner.hpp"
#include "bpevocab/symbols.hpp"

namespace bpevocab
{

struct Config
{
    std::string env_path = ".env";
    std::vector<std::string> data_files;
    std::vector<std::string> text_fields = {"text", "content"};
    std::string output_merges = "merges.txt";
    std::string output_json = "tokenizer.json";
    std::string unk_token = "</u>";
    SplitMode split_mode = SplitMode::kCodepoint;

    std::size_t num_merges = 1000;
    std::size_t vocab_size = 0; // 0 -> bounded by num_merges only
    std::size_t min_pair_freq = 1;
    std::size_t progress_every = 0; // 0 -> quiet
    bool write_merges = true;
    bool write_json = true;
};

std::unordered_map<std::string, std::string> read_env_file(const std::string &path);
void apply_env_overrides(Config &cfg, const std::unordered_map<std::string, std::string> &env);

std::string detect_env_path_arg(int argc, char **argv, const std::string &default_path = ".env");

// Parses the options of the `train` command starting at argv[first].
// Positional arguments are corpus files.
bool parse_train_args(int argc, char **argv, int first, Config &cfg, std::string &err, bool &show_help);
void print_train_usage();

LearnerOptions learner_options(const Config &cfg);
CorpusReadOptions corpus_read_options(const Config &cfg);

} // namespace bpevocab
