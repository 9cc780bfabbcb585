#pragma once

#include <sys/types.h>

#include <string>

#include "IHandler.hpp"
#include "file_utils.hpp"

// Serves one regular file with 200. GET streams the body with sendfile()
// once the head has been written; HEAD sends the head only.
class FileHandler : public IHandler {
 public:
  FileHandler(const std::string& path, const std::string& content_type);
  virtual ~FileHandler();

  virtual HandlerResult start(Connection& conn);
  virtual HandlerResult resume(Connection& conn);

 private:
  FileHandler(const FileHandler& other);
  FileHandler& operator=(const FileHandler& other);

  std::string path_;
  std::string content_type_;
  FileInfo fi_;
  off_t offset_;
};
