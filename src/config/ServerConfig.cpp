#include "ServerConfig.hpp"

#include "Logger.hpp"
#include "constants.hpp"

ServerConfig::ServerConfig()
    : listen_port(DEFAULT_LISTEN_PORT),
      document_root(),
      index_files(),
      locations() {
  index_files.push_back(DEFAULT_INDEX_PRIMARY);
  index_files.push_back(DEFAULT_INDEX_SECONDARY);
}

ServerConfig::ServerConfig(const ServerConfig& other)
    : listen_port(other.listen_port),
      document_root(other.document_root),
      index_files(other.index_files),
      locations(other.locations) {}

ServerConfig& ServerConfig::operator=(const ServerConfig& other) {
  if (this != &other) {
    listen_port = other.listen_port;
    document_root = other.document_root;
    index_files = other.index_files;
    locations = other.locations;
  }
  return *this;
}

ServerConfig::~ServerConfig() {}

const Location* ServerConfig::matchLocation(const std::string& path) const {
  LOG(DEBUG) << "Matching path '" << path << "' against " << locations.size()
             << " location(s)";

  for (size_t i = 0; i < locations.size(); ++i) {
    if (locations[i].matchesExactly(path)) {
      LOG(DEBUG) << "Exact match: '" << locations[i].describe() << "'";
      return &locations[i];
    }
  }

  const Location* best_prefix = NULL;
  for (size_t i = 0; i < locations.size(); ++i) {
    const Location& loc = locations[i];
    if (loc.isPrefixOf(path) &&
        (best_prefix == NULL || loc.matcher.size() > best_prefix->matcher.size())) {
      best_prefix = &loc;
    }
  }
  if (best_prefix != NULL && best_prefix->stop_on_match) {
    LOG(DEBUG) << "Prefix match stops regex search: '"
               << best_prefix->describe() << "'";
    return best_prefix;
  }

  for (size_t i = 0; i < locations.size(); ++i) {
    if (locations[i].matchesPattern(path)) {
      LOG(DEBUG) << "Regex match: '" << locations[i].describe() << "'";
      return &locations[i];
    }
  }

  if (best_prefix != NULL) {
    LOG(DEBUG) << "Prefix match: '" << best_prefix->describe() << "'";
  } else {
    LOG(DEBUG) << "No location matched";
  }
  return best_prefix;
}
