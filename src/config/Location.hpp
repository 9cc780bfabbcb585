#pragma once

#include <string>
#include <vector>

#include "Regex.hpp"

// One `location` rule of a server block.
//
// Optional values are empty when absent: `proxy_pass`, `root` (kept as
// written, resolved per request) and `try_files`.
class Location {
 public:
  enum Kind { EXACT, PREFIX, REGEX };

  Location();
  Location(Kind kind, const std::string& matcher);
  Location(const Location& other);
  Location& operator=(const Location& other);
  ~Location();

  // Compile `matcher` for a REGEX rule. Returns false and fills `error` if
  // the pattern is invalid. No-op for other kinds.
  bool compilePattern(std::string& error);

  bool matchesExactly(const std::string& path) const;
  bool isPrefixOf(const std::string& path) const;
  bool matchesPattern(const std::string& path) const;

  // Human readable form used in request logs, e.g. "^~ /api".
  std::string describe() const;

  Kind kind;
  std::string matcher;
  bool case_insensitive;
  bool stop_on_match;  // `^~` prefix: skip regex rules when this one wins

  std::string proxy_pass;
  std::string root;
  std::vector<std::string> try_files;

 private:
  Regex regex_;
};
