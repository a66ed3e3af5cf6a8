#include "bpevocab/corpus_reader.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>
#include <zlib.h>

namespace bpevocab {

namespace {
void emit_field(const nlohmann::json& j, const std::vector<std::string>& fields,
                const CorpusReader::RecordFn& fn) {
    if (!j.is_object()) return;
    for (const auto& field : fields) {
        if (j.contains(field) && j[field].is_string()) {
            fn(j[field].get<std::string>());
            break;
        }
    }
}
} // namespace

CorpusReader::CorpusReader(CorpusReadOptions options) : options_(std::move(options)) {}

bool CorpusReader::for_each_record(const std::string& path, const RecordFn& fn) const {
    auto ext = std::filesystem::path(path).extension().string();
    if (ext == ".txt") return read_text_like(path, fn);
    if (ext == ".jsonl") return read_jsonl(path, fn);
    if (ext == ".json") return read_json(path, fn);
    if (ext == ".gz") return read_gz(path, fn);
    return read_text_like(path, fn);
}

bool CorpusReader::read_text_like(const std::string& path, const RecordFn& fn) const {
    std::ifstream in(path);
    if (!in) return false;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() && options_.skip_empty_lines) continue;
        fn(line);
    }
    return true;
}

bool CorpusReader::read_jsonl(const std::string& path, const RecordFn& fn) const {
    std::ifstream in(path);
    if (!in) return false;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        auto j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded()) continue;
        emit_field(j, options_.json_text_fields, fn);
    }
    return true;
}

bool CorpusReader::read_json(const std::string& path, const RecordFn& fn) const {
    std::ifstream in(path);
    if (!in) return false;
    std::stringstream buf;
    buf << in.rdbuf();
    emit_text_fields(buf.str(), fn);
    return true;
}

bool CorpusReader::read_gz(const std::string& path, const RecordFn& fn) const {
    gzFile gz = gzopen(path.c_str(), "rb");
    if (!gz) return false;
    std::string payload;
    char buf[1 << 15];
    int read_n = 0;
    while ((read_n = gzread(gz, buf, sizeof(buf))) > 0) {
        payload.append(buf, static_cast<size_t>(read_n));
    }
    const bool failed = read_n < 0;
    gzclose(gz);
    if (failed) return false;

    // data.txt.gz -> ".txt"
    auto inner = std::filesystem::path(path).stem().extension().string();
    if (inner == ".json" || inner == ".jsonl") {
        emit_text_fields(payload, fn);
    } else {
        emit_lines(payload, fn);
    }
    return true;
}

void CorpusReader::emit_text_fields(const std::string& payload, const RecordFn& fn) const {
    auto j = nlohmann::json::parse(payload, nullptr, false);
    if (j.is_discarded()) {
        std::istringstream iss(payload);
        std::string line;
        while (std::getline(iss, line)) {
            if (line.empty()) continue;
            auto jl = nlohmann::json::parse(line, nullptr, false);
            if (jl.is_discarded()) continue;
            emit_field(jl, options_.json_text_fields, fn);
        }
        return;
    }

    if (j.is_array()) {
        for (const auto& item : j) {
            emit_field(item, options_.json_text_fields, fn);
        }
    } else {
        emit_field(j, options_.json_text_fields, fn);
    }
}

void CorpusReader::emit_lines(const std::string& payload, const RecordFn& fn) const {
    std::istringstream iss(payload);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() && options_.skip_empty_lines) continue;
        fn(line);
    }
}

} // namespace bpevocab
