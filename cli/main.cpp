#include "bpevocab/config.hpp"
#include "bpevocab/formats.hpp"
#include "bpevocab/learner.hpp"
#include "bpevocab/merger.hpp"
#include "bpevocab/token_catalog.hpp"
#include "bpevocab/tokenizer.hpp"
#include "bpevocab/word_counter.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <vector>

using namespace bpevocab;

namespace {

void print_usage() {
    std::cerr << "Usage:\n"
              << "  bpevocab_cli train [options] <files...>\n"
              << "  bpevocab_cli tokenize <tokenizer.json> <text...>\n"
              << "  bpevocab_cli segment <merges.txt> <words...>\n"
              << "  bpevocab_cli vocab <tokenizer.json> [top_n]\n"
              << "Run 'bpevocab_cli train --help' for training options.\n";
}

std::string join_args(int argc, char** argv, int first) {
    std::string out;
    for (int i = first; i < argc; ++i) {
        if (!out.empty()) out.push_back(' ');
        out += argv[i];
    }
    return out;
}

void print_tokens(const std::vector<Symbol>& tokens) {
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (i > 0) std::cout << ' ';
        std::cout << tokens[i];
    }
    std::cout << "\n";
}

int run_train(int argc, char** argv) {
    Config cfg;
    cfg.env_path = detect_env_path_arg(argc, argv, cfg.env_path);
    apply_env_overrides(cfg, read_env_file(cfg.env_path));

    std::string err;
    bool show_help = false;
    if (!parse_train_args(argc, argv, 2, cfg, err, show_help)) {
        if (show_help) {
            print_train_usage();
            return 0;
        }
        std::cerr << err << "\n";
        print_train_usage();
        return 1;
    }
    if (cfg.data_files.empty()) {
        std::cerr << "DATA_PATH not set in .env and no corpus files given.\n";
        return 1;
    }

    std::cerr << "Files: " << cfg.data_files.size() << "\n";
    std::cerr << "Split: " << SplitModeName(cfg.split_mode) << "\n";
    std::cerr << "Merges requested: " << cfg.num_merges << "\n";
    if (cfg.vocab_size > 0) {
        std::cerr << "Target vocab size: " << cfg.vocab_size << "\n";
    }

    CorpusReader reader(corpus_read_options(cfg));
    auto table = CountWordsFromFiles(cfg.data_files, reader, cfg.split_mode);
    std::cerr << "Unique words: " << table.size() << "\n";
    std::cerr << "Initial symbols: " << table.DistinctSymbols() << "\n";

    BpeLearner learner(learner_options(cfg));
    auto result = learner.Train(std::move(table));
    auto catalog = DeriveTokens(result.table);

    if (result.merges.size() < cfg.num_merges) {
        std::cerr << "Stopped early after " << result.merges.size() << " merges\n";
    }
    if (cfg.write_merges) {
        SaveMerges(result.merges, cfg.output_merges);
        std::cerr << "Saved merges: " << cfg.output_merges << "\n";
    }
    if (cfg.write_json) {
        SaveTokenizerJson(result, catalog, cfg.output_json, cfg.unk_token);
        std::cerr << "Saved tokenizer: " << cfg.output_json << "\n";
    }

    std::cout << "merges=" << result.merges.size() << " vocab=" << catalog.size() << "\n";
    return 0;
}

int run_tokenize(int argc, char** argv) {
    if (argc < 4) {
        print_usage();
        return 1;
    }
    auto model = LoadTokenizerJson(argv[2]);
    GreedyTokenizer tokenizer(std::move(model.sorted_tokens), model.unknown);
    print_tokens(tokenizer.Encode(join_args(argc, argv, 3)));
    return 0;
}

int run_segment(int argc, char** argv) {
    if (argc < 4) {
        print_usage();
        return 1;
    }
    MergeRanks ranks(LoadMerges(argv[2]));
    for (int i = 3; i < argc; ++i) {
        for (const auto& word : SplitWhitespace(argv[i])) {
            print_tokens(ranks.Apply(Symbolize(word)));
        }
    }
    return 0;
}

int run_vocab(int argc, char** argv) {
    if (argc < 3) {
        print_usage();
        return 1;
    }
    std::size_t top_n = 0;
    if (argc > 3) top_n = static_cast<std::size_t>(std::stoul(argv[3]));
    auto model = LoadTokenizerJson(argv[2]);
    std::size_t shown = 0;
    for (const auto& token : model.sorted_tokens) {
        if (top_n > 0 && shown == top_n) break;
        std::cout << shown << "\t" << token << "\t" << MeasureLength(token) << "\n";
        ++shown;
    }
    std::cerr << "vocab=" << model.sorted_tokens.size() << " merges=" << model.merges.size() << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string cmd = argv[1];
    try {
        if (cmd == "train") return run_train(argc, argv);
        if (cmd == "tokenize") return run_tokenize(argc, argv);
        if (cmd == "segment") return run_segment(argc, argv);
        if (cmd == "vocab") return run_vocab(argc, argv);
    } catch (const SourceUnreadableError& e) {
        std::cerr << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << cmd << " failed: " << e.what() << "\n";
        return 3;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    print_usage();
    return 1;
}
