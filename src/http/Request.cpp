#include "Request.hpp"

#include <cctype>
#include <sstream>
#include <vector>

Request::Request() : Message(), method(), target(), version(), url() {}

Request::Request(const Request& other)
    : Message(other),
      method(other.method),
      target(other.target),
      version(other.version),
      url(other.url) {}

Request& Request::operator=(const Request& other) {
  if (this != &other) {
    Message::operator=(other);
    method = other.method;
    target = other.target;
    version = other.version;
    url = other.url;
  }
  return *this;
}

Request::~Request() {}

std::string Request::startLine() const {
  std::ostringstream o;
  o << method << " " << target << " " << version;
  return o.str();
}

bool Request::isHead() const {
  return method == "HEAD";
}

static bool isMethodToken(const std::string& m) {
  if (m.empty()) {
    return false;
  }
  for (std::size_t i = 0; i < m.size(); ++i) {
    if (!std::isupper(static_cast<unsigned char>(m[i]))) {
      return false;
    }
  }
  return true;
}

Request::ParseStatus Request::parse(const std::string& buffer,
                                    std::size_t headers_end) {
  if (headers_end == std::string::npos || headers_end > buffer.size()) {
    return PARSE_BAD_REQUEST;
  }

  std::vector<std::string> lines;
  std::string temp;
  for (std::size_t i = 0; i < headers_end; ++i) {
    char ch = buffer[i];
    if (ch == '\r') {
      continue;
    }
    if (ch == '\n') {
      lines.push_back(temp);
      temp.clear();
    } else {
      temp.push_back(ch);
    }
  }
  if (!temp.empty()) {
    lines.push_back(temp);
  }
  if (lines.empty()) {
    return PARSE_BAD_REQUEST;
  }

  std::istringstream in(lines[0]);
  std::string extra;
  if (!(in >> method >> target >> version) || (in >> extra)) {
    return PARSE_BAD_REQUEST;
  }
  if (!isMethodToken(method)) {
    return PARSE_BAD_REQUEST;
  }
  if (version.compare(0, 5, "HTTP/") != 0) {
    return PARSE_BAD_REQUEST;
  }
  if (version != "HTTP/1.1" && version != "HTTP/1.0") {
    return PARSE_BAD_VERSION;
  }
  if (!url.parse(target)) {
    return PARSE_BAD_REQUEST;
  }

  parseHeaders(lines, 1);
  return PARSE_OK;
}
