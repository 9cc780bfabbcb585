#pragma once

#include <string>
#include <vector>

// One node of the configuration AST. A node is either a directive
// (`name args;`) or a block (`name args { children }`); `children` is only
// meaningful for blocks.
class ConfigNode {
 public:
  enum Kind { DIRECTIVE, BLOCK };

  ConfigNode();
  ConfigNode(Kind kind, const std::string& name,
             const std::vector<std::string>& args);
  ConfigNode(const ConfigNode& other);
  ConfigNode& operator=(const ConfigNode& other);
  ~ConfigNode();

  bool isBlock() const;
  bool isDirective() const;

  Kind kind;
  std::string name;
  std::vector<std::string> args;
  std::vector<ConfigNode> children;
};

typedef std::vector<ConfigNode> NodeList;
