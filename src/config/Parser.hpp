#pragma once

#include <cstddef>
#include <vector>

#include "ConfigNode.hpp"
#include "Lexer.hpp"

// Output of Parser::parse. The node list is always usable; the remaining
// fields describe how far the input was from being well formed.
struct ParseResult {
  ParseResult();

  NodeList nodes;
  bool complete;
  std::size_t unclosed_blocks;  // blocks still open at end of input
  std::size_t stray_closers;    // '}' with no block to close
};

// Builds the AST from a token list in a single pass. Never throws on
// malformed input: unbalanced braces and dangling words are tolerated.
class Parser {
 public:
  explicit Parser(const std::vector<Token>& tokens);

  ParseResult parse();

 private:
  NodeList parseLevel(std::size_t depth, ParseResult& result);

  std::vector<Token> tokens_;
  std::size_t idx_;
};
