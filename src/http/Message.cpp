#include "Message.hpp"

#include <sstream>

#include "constants.hpp"
#include "utils.hpp"

Header::Header() : name(), value() {}

Header::Header(const std::string& n, const std::string& v)
    : name(n), value(v) {}

Message::Message() : headers(), body() {}

Message::Message(const Message& other)
    : headers(other.headers), body(other.body) {}

Message& Message::operator=(const Message& other) {
  if (this != &other) {
    headers = other.headers;
    body = other.body;
  }
  return *this;
}

Message::~Message() {}

void Message::addHeader(const std::string& name, const std::string& value) {
  headers.push_back(Header(name, value));
}

void Message::setHeader(const std::string& name, const std::string& value) {
  std::string key = to_lower_copy(name);
  std::vector<Header> kept;
  for (std::vector<Header>::const_iterator it = headers.begin();
       it != headers.end(); ++it) {
    if (to_lower_copy(it->name) != key) {
      kept.push_back(*it);
    }
  }
  kept.push_back(Header(name, value));
  headers.swap(kept);
}

bool Message::getHeader(const std::string& name, std::string& out) const {
  std::string key = to_lower_copy(name);
  for (std::vector<Header>::const_iterator it = headers.begin();
       it != headers.end(); ++it) {
    if (to_lower_copy(it->name) == key) {
      out = it->value;
      return true;
    }
  }
  return false;
}

std::string Message::serializeHeaders() const {
  std::ostringstream o;
  for (std::vector<Header>::const_iterator it = headers.begin();
       it != headers.end(); ++it) {
    o << it->name << ": " << it->value << CRLF;
  }
  return o.str();
}

bool Message::parseHeaderLine(const std::string& line, Header& out) {
  std::string::size_type pos = line.find(':');
  if (pos == std::string::npos || pos == 0) {
    return false;
  }
  out.name = trim_copy(line.substr(0, pos));
  out.value = trim_copy(line.substr(pos + 1));
  return !out.name.empty();
}

std::size_t Message::parseHeaders(const std::vector<std::string>& lines,
                                  std::size_t start) {
  std::size_t count = 0;
  for (std::size_t i = start; i < lines.size(); ++i) {
    if (lines[i].empty()) {
      continue;
    }
    Header h;
    if (parseHeaderLine(lines[i], h)) {
      headers.push_back(h);
      ++count;
    }
  }
  return count;
}
