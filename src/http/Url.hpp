#pragma once

#include <string>

namespace http {

/**
 * Request target of an HTTP request line.
 *
 * Accepts the origin form ("/path?query") and the absolute form
 * ("http://host:port/path?query"). Only the path is kept: the authority,
 * query and fragment are checked and dropped.
 */
class Url {
 public:
  Url();
  explicit Url(const std::string& url);
  Url(const Url& other);
  Url& operator=(const Url& other);
  ~Url();

  /**
   * Parse a request target into components.
   * @param url The target as it appears in the request line
   * @return true if the target has a path starting with '/'
   */
  bool parse(const std::string& url);

  std::string getPath() const;

  /**
   * Get the percent-decoded path. Decoding happens exactly once, so "%252e"
   * becomes "%2e" and not ".".
   */
  std::string getDecodedPath() const;

  bool isValid() const;

  /**
   * Percent-decode a path. Malformed escapes are kept as they are and '+'
   * is not a space in paths.
   */
  static std::string decode(const std::string& str);

 private:
  std::string path_;
  bool valid_;

  static bool validAuthority(const std::string& authority);
  static int hexToInt(char c);
};

}  // namespace http
