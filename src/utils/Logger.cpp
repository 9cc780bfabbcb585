#include "Logger.hpp"

#include <cstring>
#include <ctime>
#include <iostream>
#include <sstream>

// Map numeric LOG_LEVEL (-DLOG_LEVEL=N) to the LogLevel enum, INFO otherwise.
#ifndef LOG_LEVEL
#define LOG_LEVEL Logger::INFO
#endif

Logger::LogLevel Logger::level_ =
    (LOG_LEVEL >= Logger::DEBUG && LOG_LEVEL <= Logger::ERROR)
        ? static_cast<Logger::LogLevel>(LOG_LEVEL)
        : Logger::INFO;

Logger::Logger(LogLevel level, const char* file, int line)
    : msgLevel_(level), file_(file), line_(line), stream_() {}

Logger::~Logger() {
  if (msgLevel_ < level_) {
    return;
  }
  // keep only the basename so log lines stay short
  const char* base = std::strrchr(file_, '/');
  std::ostringstream output;
  output << "(" << (base != NULL ? base + 1 : file_) << ":" << line_ << ") "
         << stream_.str();
  Logger::log(msgLevel_, output.str());
}

std::ostringstream& Logger::stream() {
  return stream_;
}

void Logger::setLevel(LogLevel level) {
  level_ = level;
}

Logger::LogLevel Logger::level() {
  return level_;
}

std::string Logger::getCurrentTime() {
  static const size_t kTimeBufferSize = 32;
  time_t now = time(0);
  struct tm timeinfo;
  localtime_r(&now, &timeinfo);
  char buffer[kTimeBufferSize];
  strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &timeinfo);
  return std::string(buffer);
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
    case DEBUG:
      return "DEBUG";
    case INFO:
      return "INFO";
    case ERROR:
      return "ERROR";
  }
  return "UNKNOWN";
}

void Logger::log(LogLevel level, const std::string& message) {
  if (level < level_) {
    return;
  }

  std::ostream& out = (level == ERROR) ? std::cerr : std::cout;
  out << "[" << getCurrentTime() << "] [" << levelToString(level) << "] "
      << message << std::endl;
}

void Logger::printStartupLevel() {
  std::cout << "Effective log level: " << levelToString(level_) << std::endl;
}
