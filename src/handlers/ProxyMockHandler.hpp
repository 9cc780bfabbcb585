#pragma once

#include <string>

#include "IHandler.hpp"

// Stands in for an upstream: answers 200 text/plain naming the proxy_pass
// target the request was matched to. Nothing is forwarded.
class ProxyMockHandler : public IHandler {
 public:
  explicit ProxyMockHandler(const std::string& target);
  virtual ~ProxyMockHandler();

  virtual HandlerResult start(Connection& conn);
  virtual HandlerResult resume(Connection& conn);

  static std::string bodyFor(const std::string& target);

 private:
  std::string target_;
};
