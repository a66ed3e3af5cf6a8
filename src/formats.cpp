#include "bpevocab/formats.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <unordered_map>
#include <utility>

#include <nlohmann/json.hpp>

namespace bpevocab {

namespace {
constexpr const char* kMergesHeader = "#version: 0.2";
constexpr const char* kByteLevelEncoding = "byte_level";

// GPT-2 byte -> codepoint table: printable bytes map to themselves, the rest
// to 256 + n in byte order.
std::array<std::uint32_t, 256> BuildByteToCodepoint() {
  std::array<std::uint32_t, 256> map{};
  std::array<bool, 256> printable{};
  for (int b = 33; b <= 126; ++b) printable[b] = true;
  for (int b = 161; b <= 172; ++b) printable[b] = true;
  for (int b = 174; b <= 255; ++b) printable[b] = true;
  std::uint32_t n = 0;
  for (int b = 0; b < 256; ++b) {
    map[b] = printable[b] ? static_cast<std::uint32_t>(b) : 256 + n++;
  }
  return map;
}

const std::array<std::uint32_t, 256>& ByteToCodepoint() {
  static const auto map = BuildByteToCodepoint();
  return map;
}

void AppendUtf8(std::uint32_t cp, std::string& out) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else {
    // every mapped codepoint is below 0x800
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Any byte string becomes valid UTF-8 without spaces, so symbols from byte
// splitting or malformed input can be stored as JSON strings.
std::string ByteLevelEncode(std::string_view symbol) {
  const auto& map = ByteToCodepoint();
  std::string out;
  out.reserve(symbol.size() * 2);
  for (unsigned char b : symbol) AppendUtf8(map[b], out);
  return out;
}

std::string ByteLevelDecode(std::string_view encoded) {
  static const auto reverse = [] {
    std::unordered_map<std::uint32_t, char> r;
    const auto& map = ByteToCodepoint();
    for (int b = 0; b < 256; ++b) r.emplace(map[b], static_cast<char>(b));
    return r;
  }();

  std::string out;
  out.reserve(encoded.size());
  for (std::size_t i = 0; i < encoded.size();) {
    const auto lead = static_cast<unsigned char>(encoded[i]);
    std::uint32_t cp = 0;
    if (lead < 0x80) {
      cp = lead;
      i += 1;
    } else if ((lead & 0xE0) == 0xC0 && i + 1 < encoded.size() &&
               (static_cast<unsigned char>(encoded[i + 1]) & 0xC0) == 0x80) {
      cp = ((lead & 0x1Fu) << 6) | (static_cast<unsigned char>(encoded[i + 1]) & 0x3Fu);
      i += 2;
    } else {
      throw std::runtime_error("symbol is not byte-level encoded: " + std::string(encoded));
    }
    auto it = reverse.find(cp);
    if (it == reverse.end()) {
      throw std::runtime_error("symbol is not byte-level encoded: " + std::string(encoded));
    }
    out.push_back(it->second);
  }
  return out;
}

SymbolPair ParseMergeLine(const std::string& line, std::size_t line_no) {
  std::istringstream iss(line);
  std::string a, b, extra;
  if (!(iss >> a >> b) || (iss >> extra)) {
    throw std::runtime_error("malformed merge rule at line " + std::to_string(line_no) + ": " + line);
  }
  return {std::move(a), std::move(b)};
}
}  // namespace

void SaveMerges(const MergeRules& merges, const std::string& merges_path) {
  std::ofstream out(merges_path);
  if (!out) {
    throw std::runtime_error("failed to create merges file: " + merges_path);
  }
  out << kMergesHeader << '\n';
  for (const auto& rule : merges) {
    out << rule.pair.first << ' ' << rule.pair.second << '\n';
  }
}

MergeRules LoadMerges(const std::string& merges_path) {
  std::ifstream in(merges_path);
  if (!in) {
    throw std::runtime_error("unable to read merges file: " + merges_path);
  }
  MergeRules merges;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty() || (line_no == 1 && line == kMergesHeader)) continue;
    merges.push_back(MergeRule{ParseMergeLine(line, line_no), merges.size()});
  }
  return merges;
}

void SaveTokenizerJson(const TrainResult& result,
                       const TokenCatalog& catalog,
                       const std::string& tokenizer_json_path,
                       const std::string& unknown) {
  nlohmann::json vocab_json = nlohmann::json::object();
  const auto tokens = catalog.SortedTokens();
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    vocab_json[ByteLevelEncode(tokens[i])] = i;
  }

  nlohmann::json merges_json = nlohmann::json::array();
  for (const auto& rule : result.merges) {
    merges_json.push_back(ByteLevelEncode(rule.pair.first) + " " + ByteLevelEncode(rule.pair.second));
  }

  nlohmann::json j;
  j["version"] = "1.0";
  j["model"] = {
      {"type", "BPE"},
      {"unk_token", unknown},
      {"end_of_word_suffix", std::string(kEndOfWord)},
      {"symbol_encoding", kByteLevelEncoding},
      {"vocab", std::move(vocab_json)},
      {"merges", std::move(merges_json)},
  };

  // dump before opening, so a failure leaves an existing file untouched
  std::string text;
  try {
    text = j.dump(2);
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("failed to serialize tokenizer json: " + std::string(e.what()));
  }

  std::ofstream out(tokenizer_json_path);
  if (!out) {
    throw std::runtime_error("failed to create tokenizer json: " + tokenizer_json_path);
  }
  out << text << '\n';
}

SavedModel LoadTokenizerJson(const std::string& tokenizer_json_path) {
  std::ifstream in(tokenizer_json_path);
  if (!in) {
    throw std::runtime_error("unable to read tokenizer json: " + tokenizer_json_path);
  }
  auto j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded() || !j.contains("model") || !j["model"].is_object()) {
    throw std::runtime_error("malformed tokenizer json: " + tokenizer_json_path);
  }
  const auto& model = j["model"];

  const bool byte_level = model.contains("symbol_encoding") && model["symbol_encoding"] == kByteLevelEncoding;
  auto decode = [byte_level](const std::string& symbol) {
    return byte_level ? ByteLevelDecode(symbol) : symbol;
  };

  SavedModel saved;
  if (model.contains("unk_token") && model["unk_token"].is_string()) {
    saved.unknown = model["unk_token"].get<std::string>();
  }

  if (model.contains("vocab") && model["vocab"].is_object()) {
    std::vector<std::pair<std::size_t, std::string>> id_token;
    id_token.reserve(model["vocab"].size());
    for (auto it = model["vocab"].begin(); it != model["vocab"].end(); ++it) {
      if (!it.value().is_number_unsigned()) {
        throw std::runtime_error("malformed vocab id for token: " + it.key());
      }
      id_token.emplace_back(it.value().get<std::size_t>(), decode(it.key()));
    }
    std::sort(id_token.begin(), id_token.end());
    saved.sorted_tokens.reserve(id_token.size());
    for (auto& [id, tok] : id_token) {
      saved.sorted_tokens.push_back(std::move(tok));
    }
  }

  if (model.contains("merges") && model["merges"].is_array()) {
    std::size_t idx = 0;
    for (const auto& m : model["merges"]) {
      ++idx;
      if (!m.is_string()) {
        throw std::runtime_error("malformed merge rule #" + std::to_string(idx));
      }
      auto pair = ParseMergeLine(m.get<std::string>(), idx);
      saved.merges.push_back(MergeRule{SymbolPair{decode(pair.first), decode(pair.second)}, saved.merges.size()});
    }
  }
  return saved;
}

}  // namespace bpevocab
