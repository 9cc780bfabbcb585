#pragma once

#include <string>
#include <vector>

struct Header {
  Header();
  Header(const std::string& n, const std::string& v);

  std::string name;
  std::string value;
};

// Common part of requests and responses: ordered headers and a body.
class Message {
 public:
  Message();
  Message(const Message& other);
  Message& operator=(const Message& other);
  virtual ~Message();

  void addHeader(const std::string& name, const std::string& value);
  // Replace every header with this name (case-insensitive) by one value.
  void setHeader(const std::string& name, const std::string& value);
  bool getHeader(const std::string& name, std::string& out) const;

  std::string serializeHeaders() const;
  static bool parseHeaderLine(const std::string& line, Header& out);

  virtual std::string startLine() const = 0;

  std::vector<Header> headers;
  std::string body;

 protected:
  std::size_t parseHeaders(const std::vector<std::string>& lines,
                           std::size_t start);
};
