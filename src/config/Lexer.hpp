#pragma once

#include <string>
#include <vector>

enum TokenType { T_WORD, T_STRING, T_LBRACE, T_RBRACE, T_SEMICOLON };

struct Token {
  Token();
  Token(TokenType type, const std::string& value);

  // True for unquoted '{', '}' and ';'.
  bool isStructural() const;

  TokenType type;
  std::string value;
};

// Splits configuration text into tokens.
// Example: `root "a b";` -> [WORD root] [STRING a b] [SEMICOLON]
//
// Tokenizing never fails: an unterminated quote emits what was read so far.
class Lexer {
 public:
  explicit Lexer(const std::string& content);

  std::vector<Token> tokenize();

 private:
  // Byte length of the whitespace sequence starting at `pos`, 0 if none.
  size_t whitespaceLength(size_t pos) const;
  size_t readQuoted(size_t pos, std::string& value) const;
  // Emit the pending word, as T_STRING when any part of it was quoted.
  static void flushWord(std::string& word, bool& quoted,
                        std::vector<Token>& tokens);

  std::string content_;
};
