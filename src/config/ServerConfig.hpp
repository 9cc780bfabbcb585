#pragma once

#include <string>
#include <vector>

#include "Location.hpp"

// Flat, typed view of the first `server` block of an nginx-style config.
class ServerConfig {
 public:
  ServerConfig();
  ServerConfig(const ServerConfig& other);
  ServerConfig& operator=(const ServerConfig& other);
  ~ServerConfig();

  // Select the rule that handles `path`:
  //   1. first `=` rule equal to the path
  //   2. longest matching prefix (first one on ties); returned at once if it
  //      was declared with `^~`
  //   3. first regex rule, in declaration order, matching the path
  //   4. the prefix from step 2
  // Returns NULL when no rule applies.
  const Location* matchLocation(const std::string& path) const;

  int listen_port;
  std::string document_root;
  std::vector<std::string> index_files;
  std::vector<Location> locations;  // source order
};
