#pragma once

#include <cstddef>
#include <string>

#include "Message.hpp"
#include "Url.hpp"

class Request : public Message {
 public:
  enum ParseStatus { PARSE_OK, PARSE_BAD_REQUEST, PARSE_BAD_VERSION };

  Request();
  Request(const Request& other);
  Request& operator=(const Request& other);
  virtual ~Request();

  // Parse the request line and headers found in buffer[0, headers_end).
  // A target that is not a path, or a malformed request line, is
  // PARSE_BAD_REQUEST. Versions other than HTTP/1.0 and HTTP/1.1 are
  // PARSE_BAD_VERSION.
  ParseStatus parse(const std::string& buffer, std::size_t headers_end);

  virtual std::string startLine() const;
  bool isHead() const;

  std::string method;
  std::string target;
  std::string version;
  http::Url url;
};
