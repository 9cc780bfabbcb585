#include "Config.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "ConfigError.hpp"
#include "Lexer.hpp"
#include "Logger.hpp"
#include "ast_query.hpp"
#include "constants.hpp"
#include "file_utils.hpp"
#include "utils.hpp"

// ==================== PUBLIC METHODS ====================

Config::Config() : result_() {}

Config::~Config() {}

Config::Config(const Config& other) : result_(other.result_) {}

Config& Config::operator=(const Config& other) {
  if (this != &other) {
    result_ = other.result_;
  }
  return *this;
}

void Config::loadFile(const std::string& path) {
  LOG(INFO) << "Reading config file: " << path;

  std::ifstream file(path.c_str());
  if (!file.is_open()) {
    std::string msg = "Unable to open config file: " + path + ": " +
                      std::strerror(errno);
    LOG(ERROR) << msg;
    throw std::runtime_error(msg);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    std::string msg = "Unable to read config file: " + path;
    LOG(ERROR) << msg;
    throw std::runtime_error(msg);
  }

  LOG(DEBUG) << "File content size: " << buffer.str().size() << " bytes";
  loadString(buffer.str());
}

void Config::loadString(const std::string& text) {
  Lexer lexer(text);
  std::vector<Token> tokens = lexer.tokenize();
  Parser parser(tokens);
  result_ = parser.parse();

  LOG(DEBUG) << "Parsed " << result_.nodes.size() << " top-level node(s)";
  if (!result_.complete) {
    LOG(INFO) << "Config is not well formed (unclosed blocks: "
              << result_.unclosed_blocks
              << ", stray '}': " << result_.stray_closers
              << "), using what could be read";
  }
}

bool Config::buildServer(const std::string& base_dir, ServerConfig& out) const {
  const ConfigNode* http = ast::firstBlock(result_.nodes, "http");
  if (http == NULL) {
    LOG(DEBUG) << "No 'http' block found";
    return false;
  }
  const ConfigNode* server = ast::firstBlock(http->children, "server");
  if (server == NULL) {
    LOG(DEBUG) << "No 'server' block found inside 'http'";
    return false;
  }

  std::string base = file_utils::absolutePath(base_dir);
  ServerConfig srv;

  const ConfigNode* listen = ast::firstDirective(server->children, "listen");
  srv.listen_port =
      parseListenPort(listen ? listen->args : std::vector<std::string>());

  const ConfigNode* root = ast::firstDirective(server->children, "root");
  if (root != NULL && !root->args.empty()) {
    srv.document_root = file_utils::resolvePath(base, root->args[0]);
  } else {
    srv.document_root = base;
  }

  const ConfigNode* index = ast::firstDirective(server->children, "index");
  if (index != NULL) {
    std::vector<std::string> names = trimmedArgs_(index->args);
    if (!names.empty()) {
      srv.index_files = names;
    }
  }

  std::vector<const ConfigNode*> blocks =
      ast::findBlocks(server->children, "location");
  for (size_t i = 0; i < blocks.size(); ++i) {
    srv.locations.push_back(translateLocationBlock_(*blocks[i]));
    LOG(DEBUG) << "Location #" << i << ": '"
               << srv.locations.back().describe() << "'";
  }

  LOG(DEBUG) << "Server built - Port: " << srv.listen_port
             << ", Root: " << srv.document_root
             << ", Locations: " << srv.locations.size();
  out = srv;
  return true;
}

// ==================== DEBUG ====================

static void _printNodeRec(const ConfigNode& node, int indent) {
  std::string pad(indent, ' ');
  std::ostringstream ss;
  switch (node.kind) {
    case ConfigNode::BLOCK:
      ss << pad << "Block: name='" << node.name << "'";
      break;
    case ConfigNode::DIRECTIVE:
      ss << pad << "Directive: name='" << node.name << "'";
      break;
  }
  ss << " args=[";
  for (size_t j = 0; j < node.args.size(); ++j) {
    if (j) {
      ss << ", ";
    }
    ss << "'" << node.args[j] << "'";
  }
  ss << "]";
  LOG(DEBUG) << ss.str();

  if (node.isBlock()) {
    for (size_t i = 0; i < node.children.size(); ++i) {
      _printNodeRec(node.children[i], indent + 2);
    }
  }
}

void Config::dumpTree() const {
  for (size_t i = 0; i < result_.nodes.size(); ++i) {
    _printNodeRec(result_.nodes[i], 0);
  }
}

const ParseResult& Config::parseResult() const {
  return result_;
}

// ==================== LOOKUP HELPERS ====================

static bool isReadableFile(const std::string& path) {
  int err = 0;
  return file_utils::probePath(path, err) == file_utils::PATH_FILE &&
         access(path.c_str(), R_OK) == 0;
}

bool Config::findConfigFile(const std::string& explicit_path,
                            const std::string& base_dir, std::string& out) {
  if (!explicit_path.empty()) {
    if (isReadableFile(explicit_path)) {
      out = explicit_path;
      return true;
    }
    LOG(INFO) << "Config file '" << explicit_path
              << "' is not readable, looking in " << base_dir;
  }
  std::string root = file_utils::absolutePath(base_dir);
  std::string direct = file_utils::resolvePath(root, DEFAULT_CONFIG_NAME);
  if (isReadableFile(direct)) {
    out = direct;
    return true;
  }

  std::vector<std::string> skip;
  skip.push_back("dist");
  skip.push_back("build");
  skip.push_back("out");
  skip.push_back(".git");
  skip.push_back("node_modules");
  std::string nested;
  if (file_utils::findFile(root, DEFAULT_CONFIG_NAME, skip,
                           MAX_CONFIG_MATCHES, nested) &&
      isReadableFile(nested)) {
    LOG(INFO) << "Using nested config file " << nested;
    out = nested;
    return true;
  }
  return false;
}

// ==================== ARGUMENT PARSERS ====================

int Config::parseListenPort(const std::vector<std::string>& args) {
  if (args.empty()) {
    return DEFAULT_LISTEN_PORT;
  }
  const std::string& s = args[0];
  std::string digits;
  std::string::size_type colon = s.rfind(':');
  if (colon != std::string::npos && is_digits(s.substr(colon + 1))) {
    digits = s.substr(colon + 1);
  } else if (is_digits(s)) {
    digits = s;
  } else {
    return DEFAULT_LISTEN_PORT;
  }

  // longer values overflow the port range anyway
  if (digits.size() > 5) {
    LOG(DEBUG) << "listen '" << s << "' out of range, using default";
    return DEFAULT_LISTEN_PORT;
  }
  int port = std::atoi(digits.c_str());
  if (port < 1 || port > 65535) {
    LOG(DEBUG) << "listen '" << s << "' out of range, using default";
    return DEFAULT_LISTEN_PORT;
  }
  return port;
}

std::vector<std::string> Config::trimmedArgs_(
    const std::vector<std::string>& args) {
  std::vector<std::string> out;
  for (size_t i = 0; i < args.size(); ++i) {
    std::string v = trim_copy(args[i]);
    if (!v.empty()) {
      out.push_back(v);
    }
  }
  return out;
}

// ==================== TRANSLATION ====================

Location Config::translateLocationBlock_(const ConfigNode& block) const {
  const std::vector<std::string>& args = block.args;
  std::string modifier = args.empty() ? "" : args[0];
  std::string next = args.size() > 1 ? args[1] : "";

  Location loc;
  if (modifier == "=") {
    loc = Location(Location::EXACT, next.empty() ? "/" : next);
  } else if (modifier == "~" || modifier == "~*") {
    loc = Location(Location::REGEX, next);
    loc.case_insensitive = (modifier == "~*");
  } else if (modifier == "^~") {
    loc = Location(Location::PREFIX, next.empty() ? "/" : next);
    loc.stop_on_match = true;
  } else {
    loc = Location(Location::PREFIX, modifier.empty() ? "/" : modifier);
  }

  std::string error;
  if (!loc.compilePattern(error)) {
    std::ostringstream oss;
    oss << "Configuration error in location '" << loc.describe()
        << "': invalid regular expression: " << error;
    std::string msg = oss.str();
    LOG(ERROR) << msg;
    throw ConfigError(msg);
  }

  const ConfigNode* proxy = ast::firstDirective(block.children, "proxy_pass");
  if (proxy != NULL && !proxy->args.empty()) {
    loc.proxy_pass = proxy->args[0];
  }
  const ConfigNode* root = ast::firstDirective(block.children, "root");
  if (root != NULL && !root->args.empty()) {
    loc.root = root->args[0];
  }
  const ConfigNode* try_files =
      ast::firstDirective(block.children, "try_files");
  if (try_files != NULL) {
    loc.try_files = trimmedArgs_(try_files->args);
  }
  return loc;
}
