#include "bpevocab/symbols.hpp"

#include <cctype>
#include <utility>

namespace bpevocab {

namespace {
std::size_t Utf8SequenceLength(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 1;
}

bool IsContinuation(unsigned char c) { return (c & 0xC0) == 0x80; }

std::string ToLowerAscii(std::string_view s) {
  std::string out(s);
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}
}  // namespace

Word Symbolize(std::string_view word, SplitMode mode) {
  Word symbols;
  symbols.reserve(word.size() + 1);
  for (std::size_t i = 0; i < word.size();) {
    std::size_t len = 1;
    if (mode == SplitMode::kCodepoint) {
      len = Utf8SequenceLength(static_cast<unsigned char>(word[i]));
      if (i + len > word.size()) {
        len = 1;
      }
      for (std::size_t k = 1; k < len; ++k) {
        if (!IsContinuation(static_cast<unsigned char>(word[i + k]))) {
          len = 1;
          break;
        }
      }
    }
    symbols.emplace_back(word.substr(i, len));
    i += len;
  }
  symbols.emplace_back(kEndOfWord);
  return symbols;
}

std::string JoinSymbols(const Word& word, std::string_view separator) {
  std::string out;
  for (std::size_t i = 0; i < word.size(); ++i) {
    if (i > 0) {
      out.append(separator);
    }
    out.append(word[i]);
  }
  return out;
}

Word SplitSymbols(std::string_view key) {
  Word out;
  for (auto& piece : SplitWhitespace(key)) {
    out.push_back(std::move(piece));
  }
  return out;
}

std::vector<std::string> SplitWhitespace(std::string_view text) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : text) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (!cur.empty()) {
        out.push_back(cur);
        cur.clear();
      }
    } else {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) {
    out.push_back(cur);
  }
  return out;
}

std::string_view SplitModeName(SplitMode mode) {
  switch (mode) {
    case SplitMode::kCodepoint:
      return "codepoint";
    case SplitMode::kByte:
      return "byte";
  }
  return "codepoint";
}

bool ParseSplitMode(std::string_view text, SplitMode& mode) {
  const std::string v = ToLowerAscii(text);
  if (v == "codepoint" || v == "char" || v == "utf8") {
    mode = SplitMode::kCodepoint;
    return true;
  }
  if (v == "byte" || v == "bytes") {
    mode = SplitMode::kByte;
    return true;
  }
  return false;
}

}  // namespace bpevocab
