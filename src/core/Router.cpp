#include "Router.hpp"

#include <cerrno>
#include <cstring>
#include <vector>

#include "Logger.hpp"
#include "file_utils.hpp"

RouteResult::RouteResult()
    : outcome(NOT_FOUND),
      path(),
      content_type(),
      proxy_target(),
      rule("default"),
      detail() {}

http::Status RouteResult::status() const {
  switch (outcome) {
    case SERVE_FILE:
    case PROXY:
      return http::S_200_OK;
    case NOT_FOUND:
      return http::S_404_NOT_FOUND;
    case FORBIDDEN:
      return http::S_403_FORBIDDEN;
    case INTERNAL_ERROR:
      return http::S_500_INTERNAL_SERVER_ERROR;
  }
  return http::S_500_INTERNAL_SERVER_ERROR;
}

Router::Router() : config_(), base_dir_() {}

Router::Router(const ServerConfig& config, const std::string& base_dir)
    : config_(config), base_dir_(base_dir) {}

Router::Router(const Router& other)
    : config_(other.config_), base_dir_(other.base_dir_) {}

Router& Router::operator=(const Router& other) {
  if (this != &other) {
    config_ = other.config_;
    base_dir_ = other.base_dir_;
  }
  return *this;
}

Router::~Router() {}

const ServerConfig& Router::config() const {
  return config_;
}

const std::string& Router::baseDir() const {
  return base_dir_;
}

std::string Router::effectiveRoot(const Location* loc) const {
  if (loc != NULL && !loc->root.empty()) {
    return file_utils::resolvePath(base_dir_, loc->root);
  }
  return config_.document_root;
}

RouteResult Router::route(const std::string& method,
                          const std::string& path) const {
  const Location* loc = config_.matchLocation(path);

  RouteResult result;
  std::string rule = loc != NULL ? loc->describe() : "default";
  LOG(INFO) << method << " " << path << " -> " << rule;

  if (loc != NULL && !loc->proxy_pass.empty()) {
    result.outcome = RouteResult::PROXY;
    result.proxy_target = loc->proxy_pass;
    result.rule = rule;
    return result;
  }

  std::string root = effectiveRoot(loc);
  std::string candidate;
  if (!file_utils::safeJoin(root, path, candidate)) {
    LOG(INFO) << "Rejected path outside of " << root << ": " << path;
    result.outcome = RouteResult::FORBIDDEN;
    result.rule = rule;
    return result;
  }

  result = resolveStatic(candidate, loc, root);
  result.rule = rule;
  return result;
}

RouteResult Router::resolveStatic(const std::string& candidate,
                                  const Location* loc,
                                  const std::string& root) const {
  RouteResult result;
  int err = 0;
  file_utils::PathKind kind = file_utils::probePath(candidate, err);

  switch (kind) {
    case file_utils::PATH_FILE:
      result.outcome = RouteResult::SERVE_FILE;
      result.path = candidate;
      result.content_type = file_utils::guessMime(candidate);
      return result;

    case file_utils::PATH_DIRECTORY: {
      Probe p = probeIndex_(candidate, result);
      if (p == PROBE_MISS) {
        p = probeTryFiles_(loc, root, result);
      }
      if (p == PROBE_MISS) {
        result.outcome = RouteResult::NOT_FOUND;
        result.detail = "Directory index not found";
      }
      return result;
    }

    case file_utils::PATH_MISSING:
      if (probeTryFiles_(loc, root, result) == PROBE_MISS) {
        result.outcome = RouteResult::NOT_FOUND;
      }
      return result;

    case file_utils::PATH_OTHER:
      LOG(DEBUG) << "Not a regular file or directory: " << candidate;
      result.outcome = RouteResult::NOT_FOUND;
      return result;

    case file_utils::PATH_ERROR:
      LOG(ERROR) << "stat " << candidate << ": " << std::strerror(err);
      result.outcome = RouteResult::INTERNAL_ERROR;
      return result;
  }

  result.outcome = RouteResult::INTERNAL_ERROR;
  return result;
}

Router::Probe Router::probeFile_(const std::string& path,
                                 RouteResult& out) const {
  int err = 0;
  switch (file_utils::probePath(path, err)) {
    case file_utils::PATH_FILE:
      out.outcome = RouteResult::SERVE_FILE;
      out.path = path;
      out.content_type = file_utils::guessMime(path);
      return PROBE_HIT;
    case file_utils::PATH_ERROR:
      LOG(ERROR) << "stat " << path << ": " << std::strerror(err);
      out.outcome = RouteResult::INTERNAL_ERROR;
      return PROBE_FAILED;
    case file_utils::PATH_MISSING:
    case file_utils::PATH_DIRECTORY:
    case file_utils::PATH_OTHER:
      break;
  }
  return PROBE_MISS;
}

Router::Probe Router::probeIndex_(const std::string& dir,
                                  RouteResult& out) const {
  for (std::vector<std::string>::const_iterator it =
           config_.index_files.begin();
       it != config_.index_files.end(); ++it) {
    std::string index_path;
    // index names are confined to the directory they are looked up in
    if (!file_utils::safeJoin(dir, *it, index_path)) {
      LOG(DEBUG) << "Skipping index name outside of " << dir << ": " << *it;
      continue;
    }
    Probe p = probeFile_(index_path, out);
    if (p != PROBE_MISS) {
      return p;
    }
  }
  return PROBE_MISS;
}

Router::Probe Router::probeTryFiles_(const Location* loc,
                                     const std::string& root,
                                     RouteResult& out) const {
  if (loc == NULL) {
    return PROBE_MISS;
  }
  for (std::vector<std::string>::const_iterator it = loc->try_files.begin();
       it != loc->try_files.end(); ++it) {
    // $uri, =404 and other non-absolute entries are not probed
    if (it->empty() || (*it)[0] != '/') {
      continue;
    }
    std::string fallback;
    if (!file_utils::safeJoin(root, *it, fallback)) {
      LOG(DEBUG) << "Skipping try_files entry outside of " << root << ": "
                 << *it;
      continue;
    }
    Probe p = probeFile_(fallback, out);
    if (p != PROBE_MISS) {
      return p;
    }
  }
  return PROBE_MISS;
}
