#include "bpevocab/tokenizer.hpp"

#include <iterator>
#include <utility>

namespace bpevocab {

namespace {
void TokenizeInto(std::string_view text, std::span<const Symbol> tokens, std::string_view unknown,
                  std::vector<Symbol>& out) {
  if (text.empty()) {
    return;
  }
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    const auto& token = tokens[i];
    if (token.empty()) {
      continue;
    }
    auto pos = text.find(token);
    if (pos == std::string_view::npos) {
      continue;
    }

    const auto rest = tokens.subspan(i + 1);
    std::size_t cursor = 0;
    while (pos != std::string_view::npos) {
      TokenizeInto(text.substr(cursor, pos - cursor), rest, unknown, out);
      out.push_back(token);
      cursor = pos + token.size();
      pos = text.find(token, cursor);
    }
    TokenizeInto(text.substr(cursor), rest, unknown, out);
    return;
  }
  out.emplace_back(unknown);
}
}  // namespace

std::vector<Symbol> Tokenize(std::string_view text, std::span<const Symbol> sorted_tokens,
                             std::string_view unknown) {
  std::vector<Symbol> out;
  TokenizeInto(text, sorted_tokens, unknown, out);
  return out;
}

GreedyTokenizer::GreedyTokenizer(std::vector<Symbol> sorted_tokens, Symbol unknown, WordCache cache)
    : sorted_tokens_(std::move(sorted_tokens)), unknown_(std::move(unknown)), cache_(std::move(cache)) {}

GreedyTokenizer GreedyTokenizer::FromCatalog(const TokenCatalog& catalog, Symbol unknown) {
  return GreedyTokenizer(catalog.SortedTokens(), std::move(unknown), catalog.word_to_symbols());
}

std::vector<Symbol> GreedyTokenizer::EncodeWord(std::string_view word) const {
  std::string key(word);
  key.append(kEndOfWord);
  auto it = cache_.find(key);
  if (it != cache_.end()) {
    return it->second;
  }
  return Tokenize(key, sorted_tokens_, unknown_);
}

std::vector<Symbol> GreedyTokenizer::Encode(std::string_view text) const {
  std::vector<Symbol> out;
  for (const auto& word : SplitWhitespace(text)) {
    auto pieces = EncodeWord(word);
    out.insert(out.end(), std::make_move_iterator(pieces.begin()), std::make_move_iterator(pieces.end()));
  }
  return out;
}

std::string GreedyTokenizer::Decode(std::span<const Symbol> tokens) const {
  std::string out;
  for (const auto& token : tokens) {
    std::string_view piece = token;
    if (piece.size() >= kEndOfWord.size() && piece.substr(piece.size() - kEndOfWord.size()) == kEndOfWord) {
      out.append(piece.substr(0, piece.size() - kEndOfWord.size()));
      out.push_back(' ');
    } else {
      out.append(piece);
    }
  }
  if (!out.empty() && out.back() == ' ') {
    out.pop_back();
  }
  return out;
}

}  // namespace bpevocab
