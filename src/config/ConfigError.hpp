#pragma once

#include <stdexcept>
#include <string>

// Thrown when a configuration cannot be turned into a usable ServerConfig.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};
