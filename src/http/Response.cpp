#include "Response.hpp"

#include <sstream>

#include "constants.hpp"

Response::Response()
    : Message(), version(HTTP_VERSION), status(http::S_200_OK), reason("OK") {}

Response::Response(const Response& other)
    : Message(other),
      version(other.version),
      status(other.status),
      reason(other.reason) {}

Response& Response::operator=(const Response& other) {
  if (this != &other) {
    Message::operator=(other);
    version = other.version;
    status = other.status;
    reason = other.reason;
  }
  return *this;
}

Response::~Response() {}

std::string Response::startLine() const {
  std::ostringstream o;
  o << version << " " << static_cast<int>(status) << " " << reason;
  return o.str();
}

void Response::setStatus(http::Status s) {
  status = s;
  reason = http::reasonPhrase(s);
}

void Response::setBodyWithContentType(const std::string& data,
                                      const std::string& contentType) {
  body = data;
  setHeader("Content-Type", contentType);
  std::ostringstream oss;
  oss << body.size();
  setHeader("Content-Length", oss.str());
}

std::string Response::serializeHead() const {
  std::ostringstream o;
  o << startLine() << CRLF;
  o << serializeHeaders();
  std::string tmp;
  if (!getHeader("Content-Length", tmp)) {
    o << "Content-Length: " << body.size() << CRLF;
  }
  if (!getHeader("Connection", tmp)) {
    o << "Connection: close" << CRLF;
  }
  o << CRLF;
  return o.str();
}

std::string Response::serialize() const {
  return serializeHead() + body;
}
