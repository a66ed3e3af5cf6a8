#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace bpevocab {

using Symbol = std::string;
using Word = std::vector<Symbol>;

inline constexpr std::string_view kEndOfWord = "</w>";
inline constexpr std::string_view kDefaultUnknown = "</u>";

enum class SplitMode {
  kCodepoint = 0,
  kByte,
};

// Splits a whitespace-free surface word into its initial symbols and appends
// the end-of-word marker. In codepoint mode a malformed UTF-8 byte becomes a
// symbol of its own.
[[nodiscard]] Word Symbolize(std::string_view word, SplitMode mode = SplitMode::kCodepoint);

[[nodiscard]] std::string JoinSymbols(const Word& word, std::string_view separator = " ");
[[nodiscard]] Word SplitSymbols(std::string_view key);

[[nodiscard]] inline bool IsEndOfWord(std::string_view symbol) { return symbol == kEndOfWord; }

[[nodiscard]] std::vector<std::string> SplitWhitespace(std::string_view text);

[[nodiscard]] std::string_view SplitModeName(SplitMode mode);
bool ParseSplitMode(std::string_view text, SplitMode& mode);

}  // namespace bpevocab
