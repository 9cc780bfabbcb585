#include "Url.hpp"

#include <cctype>

namespace http {

Url::Url() : valid_(false) {}

Url::Url(const std::string& url) : valid_(false) {
  parse(url);
}

Url::Url(const Url& other) : path_(other.path_), valid_(other.valid_) {}

Url& Url::operator=(const Url& other) {
  if (this != &other) {
    path_ = other.path_;
    valid_ = other.valid_;
  }
  return *this;
}

Url::~Url() {}

bool Url::parse(const std::string& url) {
  path_.clear();
  valid_ = false;

  if (url.empty()) {
    return false;
  }

  std::string remaining = url;
  std::size_t pos = remaining.find("://");
  if (pos != std::string::npos && remaining[0] != '/') {
    remaining = remaining.substr(pos + 3);

    std::size_t path_start = remaining.find_first_of("/?#");
    std::string authority = remaining.substr(0, path_start);
    remaining = path_start == std::string::npos ? std::string()
                                                : remaining.substr(path_start);
    if (!validAuthority(authority)) {
      return false;
    }
    if (remaining.empty() || remaining[0] != '/') {
      remaining = "/" + remaining;
    }
  }

  // fragment first: a '?' after '#' belongs to the fragment
  pos = remaining.find('#');
  if (pos != std::string::npos) {
    remaining.erase(pos);
  }
  pos = remaining.find('?');
  if (pos != std::string::npos) {
    remaining.erase(pos);
  }

  path_ = remaining;
  valid_ = !path_.empty() && path_[0] == '/';
  return valid_;
}

std::string Url::getPath() const {
  return path_;
}

std::string Url::getDecodedPath() const {
  return decode(path_);
}

bool Url::isValid() const {
  return valid_;
}

// "host", "host:port" or "[v6]:port"; the port must be 1 to 5 digits.
bool Url::validAuthority(const std::string& authority) {
  std::size_t port_pos = authority.rfind(':');
  if (port_pos == std::string::npos ||
      authority.find(']', port_pos) != std::string::npos) {
    return true;
  }
  std::string port_str = authority.substr(port_pos + 1);
  if (port_str.empty() || port_str.size() > 5) {
    return false;
  }
  for (std::size_t i = 0; i < port_str.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(port_str[i]))) {
      return false;
    }
  }
  return true;
}

int Url::hexToInt(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  return -1;
}

std::string Url::decode(const std::string& str) {
  std::string result;
  result.reserve(str.size());

  for (std::size_t i = 0; i < str.size(); ++i) {
    if (str[i] == '%' && i + 2 < str.size()) {
      int high = hexToInt(str[i + 1]);
      int low = hexToInt(str[i + 2]);
      if (high >= 0 && low >= 0) {
        result += static_cast<char>((high << 4) | low);
        i += 2;
        continue;
      }
    }
    result += str[i];
  }
  return result;
}

}  // namespace http
