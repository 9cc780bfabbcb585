#include "Lexer.hpp"

#include <cctype>

#include "Logger.hpp"

Token::Token() : type(T_WORD), value() {}

Token::Token(TokenType t, const std::string& v) : type(t), value(v) {}

bool Token::isStructural() const {
  switch (type) {
    case T_LBRACE:
    case T_RBRACE:
    case T_SEMICOLON:
      return true;
    case T_WORD:
    case T_STRING:
      return false;
  }
  return false;
}

Lexer::Lexer(const std::string& content) : content_(content) {}

std::vector<Token> Lexer::tokenize() {
  std::vector<Token> tokens;
  std::string word;
  bool quoted = false;
  size_t i = 0;

  while (i < content_.size()) {
    char c = content_[i];

    // a quoted section extends the pending word: /var/"my dir" is one token
    if (c == '"' || c == '\'') {
      i = readQuoted(i, word);
      quoted = true;
      continue;
    }
    if (c == '#') {
      flushWord(word, quoted, tokens);
      while (i < content_.size() && content_[i] != '\n') {
        ++i;
      }
      continue;
    }
    size_t ws = whitespaceLength(i);
    if (ws > 0) {
      flushWord(word, quoted, tokens);
      i += ws;
      continue;
    }
    if (c == '{' || c == '}' || c == ';') {
      flushWord(word, quoted, tokens);
      TokenType t = (c == '{') ? T_LBRACE : (c == '}') ? T_RBRACE : T_SEMICOLON;
      tokens.push_back(Token(t, std::string(1, c)));
      ++i;
      continue;
    }
    word += c;
    ++i;
  }
  flushWord(word, quoted, tokens);

  LOG(DEBUG) << "Lexer: " << tokens.size() << " token(s) from "
             << content_.size() << " byte(s)";
  return tokens;
}

// Appends the quoted section opening at `pos` to `value`. Returns the index
// just past the closing quote (or the end of input).
size_t Lexer::readQuoted(size_t pos, std::string& value) const {
  char quote = content_[pos];
  size_t i = pos + 1;
  bool closed = false;

  while (i < content_.size()) {
    char c = content_[i];
    if (c == quote) {
      closed = true;
      ++i;
      break;
    }
    if (c == '\\' && i + 1 < content_.size()) {
      value += content_[i + 1];
      i += 2;
      continue;
    }
    value += c;
    ++i;
  }
  if (!closed) {
    LOG(DEBUG) << "Lexer: unterminated " << quote << " quote at offset "
               << pos;
  }
  return i;
}

size_t Lexer::whitespaceLength(size_t pos) const {
  unsigned char c0 = static_cast<unsigned char>(content_[pos]);
  if (c0 < 0x80) {
    return std::isspace(c0) ? 1 : 0;
  }

  size_t left = content_.size() - pos;
  unsigned char c1 = left > 1 ? static_cast<unsigned char>(content_[pos + 1]) : 0;
  unsigned char c2 = left > 2 ? static_cast<unsigned char>(content_[pos + 2]) : 0;

  // U+00A0 NBSP
  if (c0 == 0xC2 && c1 == 0xA0) {
    return 2;
  }
  // U+1680 OGHAM SPACE MARK
  if (c0 == 0xE1 && c1 == 0x9A && c2 == 0x80) {
    return 3;
  }
  if (c0 == 0xE2 && c1 == 0x80) {
    // U+2000..U+200A, U+2028, U+2029, U+202F
    if ((c2 >= 0x80 && c2 <= 0x8A) || c2 == 0xA8 || c2 == 0xA9 || c2 == 0xAF) {
      return 3;
    }
    return 0;
  }
  // U+205F MEDIUM MATHEMATICAL SPACE
  if (c0 == 0xE2 && c1 == 0x81 && c2 == 0x9F) {
    return 3;
  }
  // U+3000 IDEOGRAPHIC SPACE
  if (c0 == 0xE3 && c1 == 0x80 && c2 == 0x80) {
    return 3;
  }
  // U+FEFF BOM
  if (c0 == 0xEF && c1 == 0xBB && c2 == 0xBF) {
    return 3;
  }
  return 0;
}

void Lexer::flushWord(std::string& word, bool& quoted,
                      std::vector<Token>& tokens) {
  if (!word.empty()) {
    tokens.push_back(Token(quoted ? T_STRING : T_WORD, word));
    word.clear();
  }
  quoted = false;
}
