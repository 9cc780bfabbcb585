#include "utils.hpp"

#include <fcntl.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <string>

#include "constants.hpp"

int set_nonblocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0) {
    return -1;
  }
  return fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

std::string trim_copy(const std::string& s) {
  std::string::size_type begin = 0;
  while (begin < s.size() &&
         std::isspace(static_cast<unsigned char>(s[begin]))) {
    ++begin;
  }
  std::string::size_type end = s.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  return s.substr(begin, end - begin);
}

std::string to_lower_copy(const std::string& s) {
  std::string res(s);
  for (std::string::size_type i = 0; i < res.size(); ++i) {
    res[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(res[i])));
  }
  return res;
}

bool is_digits(const std::string& s) {
  if (s.empty()) {
    return false;
  }
  for (std::string::size_type i = 0; i < s.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
  }
  return true;
}

Options::Options()
    : config_path(),
      base_dir(),
      host(DEFAULT_LISTEN_HOST),
      port_override(0),
      log_level(1) {}

int parseLogLevelFlag(const std::string& arg) {
  if (arg.size() != 4 || arg.compare(0, 3, "-l:") != 0 ||
      arg[3] < '0' || arg[3] > '2') {
    throw std::invalid_argument("invalid log level flag '" + arg +
                                "' (expected -l:0, -l:1 or -l:2)");
  }
  return arg[3] - '0';
}

static std::string requireValue(int argc, char** argv, int& i) {
  std::string flag(argv[i]);
  if (i + 1 >= argc) {
    throw std::invalid_argument("missing value after " + flag);
  }
  ++i;
  return std::string(argv[i]);
}

void processArgs(int argc, char** argv, Options& opts) {
  bool have_path = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg.compare(0, 3, "-l:") == 0) {
      opts.log_level = parseLogLevelFlag(arg);
    } else if (arg == "-H") {
      opts.host = requireValue(argc, argv, i);
    } else if (arg == "-p") {
      std::string value = requireValue(argc, argv, i);
      errno = 0;
      long port = is_digits(value) ? std::strtol(value.c_str(), NULL, 10) : -1;
      if (errno == ERANGE || port < 0 || port > 65535) {
        throw std::invalid_argument("invalid port override '" + value + "'");
      }
      opts.port_override = static_cast<int>(port);
    } else if (arg == "-b") {
      opts.base_dir = requireValue(argc, argv, i);
    } else if (!arg.empty() && arg[0] == '-') {
      throw std::invalid_argument("unknown option '" + arg + "'");
    } else if (!have_path) {
      opts.config_path = arg;
      have_path = true;
    } else {
      throw std::invalid_argument("unexpected argument '" + arg + "'");
    }
  }
}
