#pragma once

#include <regex>
#include <string>

// Location pattern compiled with the ECMAScript grammar (`\d`, `(?:...)`,
// lookahead). Matching searches anywhere in the subject, anchors included.
class Regex {
 public:
  Regex();
  Regex(const Regex& other);
  Regex& operator=(const Regex& other);
  ~Regex();

  // Compile `pattern`. On failure returns false, fills `error` with the
  // regex_error text and leaves the object uncompiled.
  bool compile(const std::string& pattern, bool case_insensitive,
               std::string& error);
  bool matches(const std::string& subject) const;
  bool isCompiled() const;

  const std::string& pattern() const;
  bool caseInsensitive() const;

 private:
  std::regex re_;
  bool compiled_;
  std::string pattern_;
  bool case_insensitive_;
};
