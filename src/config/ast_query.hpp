#pragma once

#include <string>
#include <vector>

#include "ConfigNode.hpp"

// Shallow lookups over a list of sibling nodes. Grandchildren are never
// visited and a missing name is an empty result, not an error.
namespace ast {

std::vector<const ConfigNode*> findBlocks(const NodeList& nodes,
                                          const std::string& name);
std::vector<const ConfigNode*> findDirectives(const NodeList& nodes,
                                              const std::string& name);

// First match or NULL; later duplicates are ignored.
const ConfigNode* firstBlock(const NodeList& nodes, const std::string& name);
const ConfigNode* firstDirective(const NodeList& nodes,
                                 const std::string& name);

}  // namespace ast
