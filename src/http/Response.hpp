#pragma once

#include <string>

#include "HttpStatus.hpp"
#include "Message.hpp"

class Response : public Message {
 public:
  Response();
  Response(const Response& other);
  Response& operator=(const Response& other);
  virtual ~Response();

  virtual std::string startLine() const;

  void setStatus(http::Status status);
  // Set the body and its Content-Type and Content-Length headers.
  void setBodyWithContentType(const std::string& data,
                              const std::string& contentType);

  // Status line and headers followed by the empty line. Content-Length
  // (from the body when not set) and "Connection: close" are always present.
  std::string serializeHead() const;
  std::string serialize() const;

  std::string version;
  http::Status status;
  std::string reason;
};
