#include "Parser.hpp"

#include <string>

#include "Logger.hpp"

ParseResult::ParseResult()
    : nodes(), complete(true), unclosed_blocks(0), stray_closers(0) {}

Parser::Parser(const std::vector<Token>& tokens) : tokens_(tokens), idx_(0) {}

ParseResult Parser::parse() {
  ParseResult result;
  idx_ = 0;
  result.nodes = parseLevel(0, result);
  if (!result.complete) {
    LOG(DEBUG) << "Parser: best-effort AST (unclosed blocks: "
               << result.unclosed_blocks
               << ", stray '}': " << result.stray_closers << ")";
  }
  return result;
}

NodeList Parser::parseLevel(std::size_t depth, ParseResult& result) {
  NodeList items;

  while (idx_ < tokens_.size()) {
    if (tokens_[idx_].type == T_RBRACE) {
      ++idx_;
      if (depth > 0) {
        return items;
      }
      // an extra '}' closes the top level: the rest of the input is ignored
      ++result.stray_closers;
      result.complete = false;
      LOG(DEBUG) << "Parser: stray '}' at top level, ignoring "
                 << (tokens_.size() - idx_) << " remaining token(s)";
      return items;
    }

    std::vector<std::string> parts;
    while (idx_ < tokens_.size() && !tokens_[idx_].isStructural()) {
      parts.push_back(tokens_[idx_].value);
      ++idx_;
    }
    if (idx_ >= tokens_.size()) {
      if (!parts.empty()) {
        // no terminator before end of input: the group is dropped
        LOG(DEBUG) << "Parser: dropping unterminated '" << parts[0] << "'";
        result.complete = false;
      }
      break;
    }
    if (parts.empty()) {
      // lone ';' or '{'
      ++idx_;
      continue;
    }

    std::string name = parts[0];
    std::vector<std::string> args(parts.begin() + 1, parts.end());
    switch (tokens_[idx_].type) {
      case T_SEMICOLON:
        ++idx_;
        items.push_back(ConfigNode(ConfigNode::DIRECTIVE, name, args));
        break;
      case T_LBRACE: {
        ++idx_;
        NodeList children = parseLevel(depth + 1, result);
        items.push_back(ConfigNode(ConfigNode::BLOCK, name, args));
        items.back().children.swap(children);
        break;
      }
      case T_RBRACE:
        // left in place: it closes the current level on the next turn
        items.push_back(ConfigNode(ConfigNode::DIRECTIVE, name, args));
        break;
      case T_WORD:
      case T_STRING:
        break;
    }
  }

  if (depth > 0) {
    ++result.unclosed_blocks;
    result.complete = false;
  }
  return items;
}
