#include "ConfigNode.hpp"

ConfigNode::ConfigNode() : kind(DIRECTIVE), name(), args(), children() {}

ConfigNode::ConfigNode(Kind k, const std::string& n,
                       const std::vector<std::string>& a)
    : kind(k), name(n), args(a), children() {}

ConfigNode::ConfigNode(const ConfigNode& other)
    : kind(other.kind),
      name(other.name),
      args(other.args),
      children(other.children) {}

ConfigNode& ConfigNode::operator=(const ConfigNode& other) {
  if (this != &other) {
    kind = other.kind;
    name = other.name;
    args = other.args;
    children = other.children;
  }
  return *this;
}

ConfigNode::~ConfigNode() {}

bool ConfigNode::isBlock() const {
  return kind == BLOCK;
}

bool ConfigNode::isDirective() const {
  return kind == DIRECTIVE;
}
