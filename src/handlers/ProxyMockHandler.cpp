#include "ProxyMockHandler.hpp"

#include "Connection.hpp"
#include "Logger.hpp"

ProxyMockHandler::ProxyMockHandler(const std::string& target)
    : target_(target) {}

ProxyMockHandler::~ProxyMockHandler() {}

std::string ProxyMockHandler::bodyFor(const std::string& target) {
  return "[Mock] matched proxy path: " + target;
}

HandlerResult ProxyMockHandler::start(Connection& conn) {
  LOG(INFO) << "Proxy " << target_ << " (mock response)";

  conn.response.setStatus(http::S_200_OK);
  conn.response.setBodyWithContentType(bodyFor(target_),
                                       "text/plain; charset=utf-8");
  if (conn.request.isHead()) {
    conn.write_buffer = conn.response.serializeHead();
  } else {
    conn.write_buffer = conn.response.serialize();
  }
  conn.write_offset = 0;
  return HR_DONE;
}

HandlerResult ProxyMockHandler::resume(Connection& conn) {
  (void)conn;
  return HR_DONE;  // the whole response was buffered by start()
}
