#pragma once

#include <string>
#include <vector>

#include "ConfigNode.hpp"
#include "Parser.hpp"
#include "ServerConfig.hpp"

class Config {
 public:
  Config();
  ~Config();
  Config(const Config& other);
  Config& operator=(const Config& other);

  // Read and parse a config file. Throws std::runtime_error when the file
  // cannot be read; malformed content never throws.
  void loadFile(const std::string& path);
  void loadString(const std::string& text);

  // Build the server configuration from the first `server` block of the
  // first `http` block. Returns false when either block is missing.
  // Throws ConfigError on an invalid location regex.
  bool buildServer(const std::string& base_dir, ServerConfig& out) const;

  // Log the parsed tree at DEBUG level.
  void dumpTree() const;

  const ParseResult& parseResult() const;

  // Choose the config file to use: `explicit_path` when it is readable,
  // else `<base_dir>/nginx.conf`, else the shortest `nginx.conf` path found
  // below `base_dir` outside dist/, build/, out/, .git/ and node_modules/.
  // Returns false if none is found.
  static bool findConfigFile(const std::string& explicit_path,
                             const std::string& base_dir, std::string& out);

  // Port from the first `listen` argument: "<host>:<port>" or "<port>".
  // Anything else, or a value outside 1..65535, gives 80.
  static int parseListenPort(const std::vector<std::string>& args);

 private:
  Location translateLocationBlock_(const ConfigNode& block) const;
  static std::vector<std::string> trimmedArgs_(
      const std::vector<std::string>& args);

  ParseResult result_;
};
