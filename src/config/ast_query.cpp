#include "ast_query.hpp"

namespace ast {

namespace {

std::vector<const ConfigNode*> findByKind(const NodeList& nodes,
                                          ConfigNode::Kind kind,
                                          const std::string& name) {
  std::vector<const ConfigNode*> out;
  for (NodeList::const_iterator it = nodes.begin(); it != nodes.end(); ++it) {
    if (it->kind == kind && it->name == name) {
      out.push_back(&*it);
    }
  }
  return out;
}

const ConfigNode* firstByKind(const NodeList& nodes, ConfigNode::Kind kind,
                              const std::string& name) {
  for (NodeList::const_iterator it = nodes.begin(); it != nodes.end(); ++it) {
    if (it->kind == kind && it->name == name) {
      return &*it;
    }
  }
  return NULL;
}

}  // anonymous namespace

std::vector<const ConfigNode*> findBlocks(const NodeList& nodes,
                                          const std::string& name) {
  return findByKind(nodes, ConfigNode::BLOCK, name);
}

std::vector<const ConfigNode*> findDirectives(const NodeList& nodes,
                                              const std::string& name) {
  return findByKind(nodes, ConfigNode::DIRECTIVE, name);
}

const ConfigNode* firstBlock(const NodeList& nodes, const std::string& name) {
  return firstByKind(nodes, ConfigNode::BLOCK, name);
}

const ConfigNode* firstDirective(const NodeList& nodes,
                                 const std::string& name) {
  return firstByKind(nodes, ConfigNode::DIRECTIVE, name);
}

}  // namespace ast
