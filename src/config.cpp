#include "bpevocab/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <utility>

namespace bpevocab
{

namespace
{
std::string trim(const std::string &s)
{
    std::size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
    {
        ++start;
    }
    std::size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
    {
        --end;
    }
    return s.substr(start, end - start);
}

std::vector<std::string> split_csv(const std::string &s)
{
    std::vector<std::string> out;
    std::string cur;
    for (char c : s)
    {
        if (c == ',')
        {
            out.push_back(trim(cur));
            cur.clear();
        }
        else
        {
            cur.push_back(c);
        }
    }
    out.push_back(trim(cur));
    out.erase(std::remove_if(out.begin(), out.end(), [](const std::string &v) { return v.empty(); }), out.end());
    return out;
}

bool parse_size_value(const std::string &s, std::size_t &out)
{
    if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0])))
    {
        return false;
    }
    try
    {
        std::size_t pos = 0;
        unsigned long long v = std::stoull(s, &pos, 10);
        if (pos != s.size() || v > std::numeric_limits<std::size_t>::max())
        {
            return false;
        }
        out = static_cast<std::size_t>(v);
        return true;
    }
    catch (const std::logic_error &)
    {
        return false;
    }
}

std::size_t parse_size(const std::string &s, std::size_t def_val)
{
    std::size_t v = 0;
    return parse_size_value(s, v) ? v : def_val;
}

bool parse_bool(const std::string &s, bool def_val)
{
    std::string v;
    v.reserve(s.size());
    for (char c : s)
    {
        v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on")
    {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off")
    {
        return false;
    }
    return def_val;
}
} // namespace

std::unordered_map<std::string, std::string> read_env_file(const std::string &path)
{
    std::unordered_map<std::string, std::string> env;
    std::ifstream in(path);
    if (!in)
    {
        return env;
    }
    bool first_line = true;
    std::string line;
    while (std::getline(in, line))
    {
        if (first_line)
        {
            first_line = false;
            if (line.size() >= 3 && static_cast<unsigned char>(line[0]) == 0xEF &&
                static_cast<unsigned char>(line[1]) == 0xBB && static_cast<unsigned char>(line[2]) == 0xBF)
            {
                line.erase(0, 3);
            }
        }
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        auto trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#')
        {
            continue;
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos)
        {
            continue;
        }
        std::string key = trim(trimmed.substr(0, eq));
        std::string val = trim(trimmed.substr(eq + 1));
        if (val.size() >= 2 &&
            ((val.front() == '"' && val.back() == '"') || (val.front() == '\'' && val.back() == '\'')))
        {
            val = val.substr(1, val.size() - 2);
        }
        env[key] = val;
    }
    return env;
}

void apply_env_overrides(Config &cfg, const std::unordered_map<std::string, std::string> &env)
{
    auto get = [&](const std::string &key) -> const std::string * {
        auto it = env.find(key);
        if (it == env.end())
        {
            return nullptr;
        }
        return &it->second;
    };
    if (auto v = get("DATA_PATH"))
    {
        auto files = split_csv(*v);
        if (!files.empty())
        {
            cfg.data_files = std::move(files);
        }
    }
    if (auto v = get("TEXT_FIELDS"))
    {
        auto fields = split_csv(*v);
        if (!fields.empty())
        {
            cfg.text_fields = std::move(fields);
        }
    }
    if (auto v = get("NUM_MERGES"))
        cfg.num_merges = parse_size(*v, cfg.num_merges);
    if (auto v = get("VOCAB_SIZE"))
        cfg.vocab_size = parse_size(*v, cfg.vocab_size);
    if (auto v = get("MIN_PAIR_FREQ"))
        cfg.min_pair_freq = parse_size(*v, cfg.min_pair_freq);
    if (auto v = get("PROGRESS_EVERY"))
        cfg.progress_every = parse_size(*v, cfg.progress_every);
    if (auto v = get("SPLIT_MODE"))
    {
        SplitMode mode = cfg.split_mode;
        if (ParseSplitMode(*v, mode))
        {
            cfg.split_mode = mode;
        }
    }
    if (auto v = get("UNK_TOKEN"))
        cfg.unk_token = *v;
    if (auto v = get("OUTPUT_MERGES"))
        cfg.output_merges = *v;
    if (auto v = get("OUTPUT_JSON"))
        cfg.output_json = *v;
    if (auto v = get("WRITE_MERGES"))
        cfg.write_merges = parse_bool(*v, cfg.write_merges);
    if (auto v = get("WRITE_JSON"))
        cfg.write_json = parse_bool(*v, cfg.write_json);
}

std::string detect_env_path_arg(int argc, char **argv, const std::string &default_path)
{
    std::string path = default_path;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--env" && i + 1 < argc)
        {
            path = argv[i + 1];
            ++i;
        }
    }
    return path;
}

void print_train_usage()
{
    std::cerr << "BPE vocabulary trainer\n"
              << "Usage:\n"
              << "  bpevocab_cli train [options] <files...>\n\n"
              << "Options:\n"
              << "  --env <path>             Path to .env (default: .env)\n"
              << "  --merges-count <n>       Number of merges to learn (default: 1000)\n"
              << "  --vocab-size <n>         Stop once initial symbols + merges reach n (default: 0=off)\n"
              << "  --min-pair-freq <n>      Stop when the best pair is rarer than this (default: 1)\n"
              << "  --split <mode>           codepoint | byte (default: codepoint)\n"
              << "  --text-fields <csv>      JSON fields holding text (default: text,content)\n"
              << "  --unk-token <s>          Unknown marker (default: </u>)\n"
              << "  --merges <path>          merges.txt output (default: merges.txt)\n"
              << "  --output <path>          tokenizer.json output (default: tokenizer.json)\n"
              << "  --no-merges              Do not write merges.txt\n"
              << "  --no-json                Do not write tokenizer.json\n"
              << "  --progress-every <n>     Log every n merges (default: 0=quiet)\n"
              << "  --help                   Show this help\n";
}

bool parse_train_args(int argc, char **argv, int first, Config &cfg, std::string &err, bool &show_help)
{
    show_help = false;
    std::vector<std::string> files;
    for (int i = first; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto require_value = [&](const std::string &name) -> const char * {
            if (i + 1 >= argc)
            {
                err = "missing value for " + name;
                return nullptr;
            }
            return argv[++i];
        };
        auto require_size = [&](const std::string &name, std::size_t &out) -> bool {
            const char *v = require_value(name);
            if (!v)
            {
                return false;
            }
            if (!parse_size_value(v, out))
            {
                err = "invalid " + name + ": " + v;
                return false;
            }
            return true;
        };

        if (arg == "--help" || arg == "-h")
        {
            show_help = true;
            return false;
        }
        if (arg == "--env")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            cfg.env_path = v;
            continue;
        }
        if (arg == "--merges-count")
        {
            if (!require_size(arg, cfg.num_merges))
            {
                return false;
            }
            continue;
        }
        if (arg == "--vocab-size")
        {
            if (!require_size(arg, cfg.vocab_size))
            {
                return false;
            }
            continue;
        }
        if (arg == "--min-pair-freq")
        {
            if (!require_size(arg, cfg.min_pair_freq))
            {
                return false;
            }
            continue;
        }
        if (arg == "--progress-every")
        {
            if (!require_size(arg, cfg.progress_every))
            {
                return false;
            }
            continue;
        }
        if (arg == "--split")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            if (!ParseSplitMode(v, cfg.split_mode))
            {
                err = "invalid --split: " + std::string(v);
                return false;
            }
            continue;
        }
        if (arg == "--text-fields")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            auto fields = split_csv(v);
            if (fields.empty())
            {
                err = "invalid --text-fields";
                return false;
            }
            cfg.text_fields = std::move(fields);
            continue;
        }
        if (arg == "--unk-token")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            cfg.unk_token = v;
            continue;
        }
        if (arg == "--merges")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            cfg.output_merges = v;
            continue;
        }
        if (arg == "--output")
        {
            const char *v = require_value(arg);
            if (!v)
            {
                return false;
            }
            cfg.output_json = v;
            continue;
        }
        if (arg == "--no-merges")
        {
            cfg.write_merges = false;
            continue;
        }
        if (arg == "--no-json")
        {
            cfg.write_json = false;
            continue;
        }
        if (arg.rfind("--", 0) == 0)
        {
            err = "unknown argument: " + arg;
            return false;
        }
        files.push_back(arg);
    }

    if (!files.empty())
    {
        cfg.data_files = std::move(files);
    }
    if (cfg.min_pair_freq == 0)
    {
        cfg.min_pair_freq = 1;
    }
    if (cfg.unk_token.empty())
    {
        err = "--unk-token must not be empty";
        return false;
    }
    return true;
}

LearnerOptions learner_options(const Config &cfg)
{
    LearnerOptions opts;
    opts.num_merges = cfg.num_merges;
    opts.target_vocab_size = cfg.vocab_size;
    opts.min_pair_frequency = cfg.min_pair_freq;
    opts.progress_every = cfg.progress_every;
    opts.split_mode = cfg.split_mode;
    return opts;
}

CorpusReadOptions corpus_read_options(const Config &cfg)
{
    CorpusReadOptions opts;
    opts.json_text_fields = cfg.text_fields;
    return opts;
}

} // namespace bpevocab
