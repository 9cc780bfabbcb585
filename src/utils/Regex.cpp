#include "Regex.hpp"

Regex::Regex() : re_(), compiled_(false), pattern_(), case_insensitive_(false) {}

Regex::Regex(const Regex& other)
    : re_(other.re_),
      compiled_(other.compiled_),
      pattern_(other.pattern_),
      case_insensitive_(other.case_insensitive_) {}

Regex& Regex::operator=(const Regex& other) {
  if (this != &other) {
    re_ = other.re_;
    compiled_ = other.compiled_;
    pattern_ = other.pattern_;
    case_insensitive_ = other.case_insensitive_;
  }
  return *this;
}

Regex::~Regex() {}

bool Regex::compile(const std::string& pattern, bool case_insensitive,
                    std::string& error) {
  compiled_ = false;
  pattern_ = pattern;
  case_insensitive_ = case_insensitive;

  std::regex::flag_type flags =
      std::regex::ECMAScript | std::regex::nosubs;
  if (case_insensitive) {
    flags |= std::regex::icase;
  }
  try {
    re_.assign(pattern, flags);
  } catch (const std::regex_error& e) {
    error = e.what();
    re_ = std::regex();
    return false;
  }
  compiled_ = true;
  return true;
}

bool Regex::matches(const std::string& subject) const {
  if (!compiled_) {
    return false;
  }
  return std::regex_search(subject, re_);
}

bool Regex::isCompiled() const {
  return compiled_;
}

const std::string& Regex::pattern() const {
  return pattern_;
}

bool Regex::caseInsensitive() const {
  return case_insensitive_;
}
