#pragma once

#include <string>

int set_nonblocking(int file_descriptor);

// Trim whitespace (space, tab, CR, LF) from both ends of a string.
// Returns a copy with the trimmed content.
std::string trim_copy(const std::string& str);

std::string to_lower_copy(const std::string& str);

// True if `str` is non-empty and made of ASCII digits only.
bool is_digits(const std::string& str);

// Command line settings supplied by the caller of the preview server.
struct Options {
  Options();

  std::string config_path;  // empty: look for nginx.conf in base_dir
  std::string base_dir;     // empty: current working directory
  std::string host;
  int port_override;  // 0 keeps the port from the config file
  int log_level;
};

// Parse log level flag (e.g., "-l:0" for DEBUG, "-l:1" for INFO, "-l:2" for
// ERROR)
int parseLogLevelFlag(const std::string& arg);

// Parse program arguments:
//   [-l:N] [-H host] [-p port] [-b base_dir] [config_path]
// Throws std::invalid_argument on malformed input.
void processArgs(int argc, char** argv, Options& opts);
