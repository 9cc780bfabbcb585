#include "FileHandler.hpp"

#include <sstream>

#include "Connection.hpp"
#include "Logger.hpp"

FileHandler::FileHandler(const std::string& path,
                         const std::string& content_type)
    : path_(path), content_type_(content_type), fi_(), offset_(0) {}

FileHandler::~FileHandler() {
  file_utils::closeFile(fi_);
}

HandlerResult FileHandler::start(Connection& conn) {
  // The descriptor stays open until the body is sent so the advertised
  // Content-Length matches what is streamed.
  if (!file_utils::openFile(path_, fi_)) {
    LOG(ERROR) << "FileHandler: cannot open " << path_;
    return HR_ERROR;
  }
  offset_ = 0;

  conn.response.setStatus(http::S_200_OK);
  conn.response.setHeader("Content-Type", content_type_);
  {
    std::ostringstream tmp;
    tmp << fi_.size;
    conn.response.setHeader("Content-Length", tmp.str());
  }
  conn.write_buffer = conn.response.serializeHead();
  conn.write_offset = 0;

  LOG(DEBUG) << "FileHandler: " << path_ << " (" << fi_.size << " bytes, "
             << content_type_ << ")";

  if (conn.request.isHead() || fi_.size == 0) {
    file_utils::closeFile(fi_);
    return HR_DONE;
  }
  return HR_WOULD_BLOCK;  // body is streamed from resume()
}

HandlerResult FileHandler::resume(Connection& conn) {
  if (fi_.fd < 0) {
    return HR_DONE;
  }

  int r = file_utils::streamToSocket(conn.fd, fi_.fd, offset_, fi_.size);
  LOG(DEBUG) << "FileHandler: streamToSocket returned " << r
             << " offset=" << offset_ << "/" << fi_.size;
  if (r == 1) {
    return HR_WOULD_BLOCK;
  }
  file_utils::closeFile(fi_);
  return r < 0 ? HR_ERROR : HR_DONE;
}
