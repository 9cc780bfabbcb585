#include "Parser.hpp"

#include <gtest/gtest.h>

#include <string>

#include "Lexer.hpp"

static ParseResult parseText(const std::string& text) {
  Lexer lexer(text);
  Parser parser(lexer.tokenize());
  return parser.parse();
}

// ==================== WELL-FORMED INPUT ====================

TEST(ParserBasic, EmptyInput) {
  ParseResult r = parseText("");
  EXPECT_TRUE(r.nodes.empty());
  EXPECT_TRUE(r.complete);
}

TEST(ParserBasic, TopLevelDirectives) {
  ParseResult r = parseText("worker_processes 4;\nuser nobody nogroup;");
  ASSERT_EQ(r.nodes.size(), 2u);
  EXPECT_EQ(r.nodes[0].kind, ConfigNode::DIRECTIVE);
  EXPECT_EQ(r.nodes[0].name, "worker_processes");
  ASSERT_EQ(r.nodes[0].args.size(), 1u);
  EXPECT_EQ(r.nodes[0].args[0], "4");
  ASSERT_EQ(r.nodes[1].args.size(), 2u);
  EXPECT_EQ(r.nodes[1].args[1], "nogroup");
  EXPECT_TRUE(r.complete);
}

TEST(ParserBasic, NestedBlocks) {
  ParseResult r = parseText(
      "http {\n"
      "  server {\n"
      "    listen 8080;\n"
      "    location = /health { proxy_pass http://127.0.0.1:9000; }\n"
      "  }\n"
      "}\n");
  ASSERT_EQ(r.nodes.size(), 1u);
  const ConfigNode& http = r.nodes[0];
  EXPECT_TRUE(http.isBlock());
  ASSERT_EQ(http.children.size(), 1u);
  const ConfigNode& server = http.children[0];
  EXPECT_EQ(server.name, "server");
  ASSERT_EQ(server.children.size(), 2u);
  EXPECT_TRUE(server.children[0].isDirective());
  const ConfigNode& loc = server.children[1];
  EXPECT_TRUE(loc.isBlock());
  ASSERT_EQ(loc.args.size(), 2u);
  EXPECT_EQ(loc.args[0], "=");
  EXPECT_EQ(loc.args[1], "/health");
  ASSERT_EQ(loc.children.size(), 1u);
  EXPECT_EQ(loc.children[0].args[0], "http://127.0.0.1:9000");
  EXPECT_TRUE(r.complete);
  EXPECT_EQ(r.unclosed_blocks, 0u);
  EXPECT_EQ(r.stray_closers, 0u);
}

TEST(ParserBasic, EmptyBlock) {
  ParseResult r = parseText("events {}");
  ASSERT_EQ(r.nodes.size(), 1u);
  EXPECT_TRUE(r.nodes[0].isBlock());
  EXPECT_TRUE(r.nodes[0].children.empty());
}

TEST(ParserBasic, QuotedSemicolonIsAnArgument) {
  ParseResult r = parseText("add_header X \";\";");
  ASSERT_EQ(r.nodes.size(), 1u);
  ASSERT_EQ(r.nodes[0].args.size(), 2u);
  EXPECT_EQ(r.nodes[0].args[1], ";");
}

// ==================== LENIENCY ====================

TEST(ParserLenient, EmptyStatementsAreSkipped) {
  ParseResult r = parseText(";; listen 80;;");
  ASSERT_EQ(r.nodes.size(), 1u);
  EXPECT_EQ(r.nodes[0].name, "listen");
  EXPECT_TRUE(r.complete);
}

TEST(ParserLenient, DirectiveBeforeClosingBraceIsKept) {
  ParseResult r = parseText("server { listen 80 }");
  ASSERT_EQ(r.nodes.size(), 1u);
  ASSERT_EQ(r.nodes[0].children.size(), 1u);
  const ConfigNode& listen = r.nodes[0].children[0];
  EXPECT_TRUE(listen.isDirective());
  EXPECT_EQ(listen.name, "listen");
  ASSERT_EQ(listen.args.size(), 1u);
  EXPECT_EQ(listen.args[0], "80");
  EXPECT_TRUE(r.complete);
}

TEST(ParserLenient, UnclosedBlocksAreReturned) {
  ParseResult r = parseText("http { server { listen 80;");
  ASSERT_EQ(r.nodes.size(), 1u);
  ASSERT_EQ(r.nodes[0].children.size(), 1u);
  ASSERT_EQ(r.nodes[0].children[0].children.size(), 1u);
  EXPECT_FALSE(r.complete);
  EXPECT_EQ(r.unclosed_blocks, 2u);
}

TEST(ParserLenient, StrayCloserEndsTopLevel) {
  ParseResult r = parseText("a 1; } b 2;");
  ASSERT_EQ(r.nodes.size(), 1u);
  EXPECT_EQ(r.nodes[0].name, "a");
  EXPECT_FALSE(r.complete);
  EXPECT_EQ(r.stray_closers, 1u);
}

TEST(ParserLenient, ExtraCloserAfterBlockDropsTheRest) {
  ParseResult r = parseText("events { } } http { server { } }");
  ASSERT_EQ(r.nodes.size(), 1u);
  EXPECT_EQ(r.nodes[0].name, "events");
  EXPECT_EQ(r.stray_closers, 1u);
}

TEST(ParserLenient, UnterminatedTrailingDirectiveIsDropped) {
  ParseResult r = parseText("a 1; b 2");
  ASSERT_EQ(r.nodes.size(), 1u);
  EXPECT_EQ(r.nodes[0].name, "a");
  EXPECT_FALSE(r.complete);
}

TEST(ParserLenient, DeepNesting) {
  std::string text;
  for (int i = 0; i < 200; ++i) {
    text += "b {";
  }
  text += "leaf 1;";
  for (int i = 0; i < 200; ++i) {
    text += "}";
  }
  ParseResult r = parseText(text);
  ASSERT_EQ(r.nodes.size(), 1u);
  const ConfigNode* node = &r.nodes[0];
  int depth = 1;
  while (!node->children.empty() && node->children[0].isBlock()) {
    node = &node->children[0];
    ++depth;
  }
  EXPECT_EQ(depth, 200);
  ASSERT_EQ(node->children.size(), 1u);
  EXPECT_EQ(node->children[0].name, "leaf");
  EXPECT_TRUE(r.complete);
}
