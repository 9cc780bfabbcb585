#pragma once

#include <string>

#include "HttpStatus.hpp"
#include "Location.hpp"
#include "ServerConfig.hpp"

// What the listener should answer for one request.
struct RouteResult {
  enum Outcome { SERVE_FILE, NOT_FOUND, FORBIDDEN, PROXY, INTERNAL_ERROR };

  RouteResult();

  http::Status status() const;

  Outcome outcome;
  std::string path;          // SERVE_FILE: file to send
  std::string content_type;  // SERVE_FILE
  std::string proxy_target;  // PROXY
  std::string rule;          // matched location description or "default"
  std::string detail;        // extra text for the error body, may be empty
};

// Maps decoded request paths onto the document tree of one ServerConfig.
class Router {
 public:
  Router();
  Router(const ServerConfig& config, const std::string& base_dir);
  Router(const Router& other);
  Router& operator=(const Router& other);
  ~Router();

  // Match a location, log the request line and resolve it. Never touches
  // the filesystem for proxy rules.
  RouteResult route(const std::string& method, const std::string& path) const;

  // Resolve an already confined filesystem path: the file itself, a
  // directory index, then `try_files` candidates under `root`.
  RouteResult resolveStatic(const std::string& candidate, const Location* loc,
                            const std::string& root) const;

  // Root used for `loc`: its own root resolved against the base directory,
  // or the server document root.
  std::string effectiveRoot(const Location* loc) const;

  const ServerConfig& config() const;
  const std::string& baseDir() const;

 private:
  enum Probe { PROBE_HIT, PROBE_MISS, PROBE_FAILED };

  Probe probeFile_(const std::string& path, RouteResult& out) const;
  Probe probeIndex_(const std::string& dir, RouteResult& out) const;
  Probe probeTryFiles_(const Location* loc, const std::string& root,
                       RouteResult& out) const;

  ServerConfig config_;
  std::string base_dir_;
};
