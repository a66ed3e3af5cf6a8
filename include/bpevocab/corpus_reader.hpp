#pragma once

#include <functional>
#include <string>
#include <vector>

namespace bpevocab {

struct CorpusReadOptions {
    std::vector<std::string> json_text_fields = {"text", "content"};
    bool skip_empty_lines = true;
};

// Streams the text records of one corpus file. The format is chosen by
// extension: .txt (and anything unknown) line by line, .jsonl, .json, and .gz
// holding either JSON/JSONL or plain text.
class CorpusReader {
public:
    using RecordFn = std::function<void(const std::string&)>;

    explicit CorpusReader(CorpusReadOptions options = {});

    // false when the source cannot be opened
    bool for_each_record(const std::string& path, const RecordFn& fn) const;

    const CorpusReadOptions& options() const { return options_; }

private:
    bool read_text_like(const std::string& path, const RecordFn& fn) const;
    bool read_jsonl(const std::string& path, const RecordFn& fn) const;
    bool read_json(const std::string& path, const RecordFn& fn) const;
    bool read_gz(const std::string& path, const RecordFn& fn) const;

    void emit_text_fields(const std::string& payload, const RecordFn& fn) const;
    void emit_lines(const std::string& payload, const RecordFn& fn) const;

    CorpusReadOptions options_;
};

} // namespace bpevocab
