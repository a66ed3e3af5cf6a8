#undef NDEBUG
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <zlib.h>

#include "bpevocab/corpus_reader.hpp"
#include "bpevocab/word_counter.hpp"

namespace {
std::filesystem::path WriteFile(const std::filesystem::path& dir, const std::string& name,
                                const std::string& body) {
  auto path = dir / name;
  std::ofstream out(path, std::ios::binary);
  out << body;
  return path;
}

std::vector<std::string> Records(const bpevocab::CorpusReader& reader, const std::filesystem::path& path) {
  std::vector<std::string> out;
  const bool ok = reader.for_each_record(path.string(), [&](const std::string& r) { out.push_back(r); });
  assert(ok);
  return out;
}
}  // namespace

int main() {
  using namespace bpevocab;

  const auto dir = std::filesystem::temp_directory_path() / "bpevocab_corpus_test";
  std::filesystem::create_directories(dir);

  CorpusReader reader;

  auto txt = WriteFile(dir, "corpus.txt", "low lower\r\n\nlow\n");
  assert((Records(reader, txt) == std::vector<std::string>{"low lower", "low"}));

  auto jsonl = WriteFile(dir, "corpus.jsonl",
                         "{\"text\": \"a b\"}\nnot json\n{\"content\": \"a\"}\n{\"other\": \"z\"}\n");
  assert((Records(reader, jsonl) == std::vector<std::string>{"a b", "a"}));

  auto json = WriteFile(dir, "corpus.json", "[{\"text\": \"x\"}, {\"other\": \"y\"}, {\"content\": \"y y\"}]");
  assert((Records(reader, json) == std::vector<std::string>{"x", "y y"}));

  CorpusReader custom(CorpusReadOptions{{"other"}, true});
  assert((Records(custom, json) == std::vector<std::string>{"y"}));

  const auto gz_path = dir / "corpus.txt.gz";
  {
    gzFile gz = gzopen(gz_path.string().c_str(), "wb");
    assert(gz != nullptr);
    const std::string body = "hello world\nhello\n";
    assert(gzwrite(gz, body.data(), static_cast<unsigned>(body.size())) == static_cast<int>(body.size()));
    gzclose(gz);
  }
  assert((Records(reader, gz_path) == std::vector<std::string>{"hello world", "hello"}));

  const auto missing = (dir / "missing.txt").string();
  assert(!reader.for_each_record(missing, [](const std::string&) {}));

  // word counting
  auto table = CountWords({"low lower", "  low\t"});
  assert(table.size() == 2);
  assert(table.FrequencyOf("l o w </w>") == 2);
  assert(table.FrequencyOf("l o w e r </w>") == 1);

  auto from_files = CountWordsFromFiles({txt.string(), jsonl.string()});
  assert(from_files.FrequencyOf("l o w </w>") == 2);
  assert(from_files.FrequencyOf("a </w>") == 2);
  assert(from_files.FrequencyOf("b </w>") == 1);

  auto bytes = CountWords({"\xC3\xA9t\xC3\xA9"}, SplitMode::kByte);
  assert(bytes.FrequencyOf("\xC3 \xA9 t \xC3 \xA9 </w>") == 1);
  auto codepoints = CountWords({"\xC3\xA9t\xC3\xA9"});
  assert(codepoints.FrequencyOf("\xC3\xA9 t \xC3\xA9 </w>") == 1);

  bool threw = false;
  try {
    (void)CountWordsFromFiles({txt.string(), missing});
  } catch (const SourceUnreadableError& e) {
    threw = true;
    assert(e.path() == missing);
    assert(std::string(e.what()).find("missing.txt") != std::string::npos);
  }
  assert(threw);

  std::filesystem::remove_all(dir);
  return 0;
}
