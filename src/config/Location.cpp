#include "Location.hpp"

Location::Location()
    : kind(PREFIX),
      matcher("/"),
      case_insensitive(false),
      stop_on_match(false),
      proxy_pass(),
      root(),
      try_files(),
      regex_() {}

Location::Location(Kind k, const std::string& m)
    : kind(k),
      matcher(m),
      case_insensitive(false),
      stop_on_match(false),
      proxy_pass(),
      root(),
      try_files(),
      regex_() {}

Location::Location(const Location& other)
    : kind(other.kind),
      matcher(other.matcher),
      case_insensitive(other.case_insensitive),
      stop_on_match(other.stop_on_match),
      proxy_pass(other.proxy_pass),
      root(other.root),
      try_files(other.try_files),
      regex_(other.regex_) {}

Location& Location::operator=(const Location& other) {
  if (this != &other) {
    kind = other.kind;
    matcher = other.matcher;
    case_insensitive = other.case_insensitive;
    stop_on_match = other.stop_on_match;
    proxy_pass = other.proxy_pass;
    root = other.root;
    try_files = other.try_files;
    regex_ = other.regex_;
  }
  return *this;
}

Location::~Location() {}

bool Location::compilePattern(std::string& error) {
  if (kind != REGEX) {
    return true;
  }
  return regex_.compile(matcher, case_insensitive, error);
}

bool Location::matchesExactly(const std::string& path) const {
  return kind == EXACT && matcher == path;
}

bool Location::isPrefixOf(const std::string& path) const {
  return kind == PREFIX && path.compare(0, matcher.size(), matcher) == 0;
}

bool Location::matchesPattern(const std::string& path) const {
  return kind == REGEX && regex_.matches(path);
}

std::string Location::describe() const {
  switch (kind) {
    case EXACT:
      return "= " + matcher;
    case REGEX:
      return (case_insensitive ? "~* " : "~ ") + matcher;
    case PREFIX:
      return stop_on_match ? "^~ " + matcher : matcher;
  }
  return matcher;
}
