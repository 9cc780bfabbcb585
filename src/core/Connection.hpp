#pragma once

#include <cstddef>
#include <string>

#include "HttpStatus.hpp"
#include "IHandler.hpp"
#include "Request.hpp"
#include "Response.hpp"

class Router;

// One accepted client socket: reads the request head, routes it once and
// writes a single response before the connection is closed.
class Connection {
 public:
  enum ReadStatus { READ_CLOSED = -1, READ_MORE = 0, READ_COMPLETE = 1 };
  enum WriteStatus { WRITE_ERROR = -1, WRITE_DONE = 0, WRITE_PENDING = 1 };

  Connection();
  explicit Connection(int fd);
  Connection(const Connection& other);
  ~Connection();

  Connection& operator=(const Connection& other);

  int fd;
  std::string read_buffer;
  std::string write_buffer;
  std::size_t write_offset;
  std::size_t headers_end_pos;
  Request request;
  Response response;
  IHandler* active_handler;

  // Drain the socket into read_buffer. READ_COMPLETE once the blank line
  // ending the head arrived, or once the head grew past MAX_HEADER_SIZE
  // (a 400 is then already prepared).
  ReadStatus handleRead();
  // Flush write_buffer, then let the active handler stream the rest.
  WriteStatus handleWrite();

  // Parse the buffered head, route it and prepare the response.
  void processRequest(const Router& router);
  // Plain text error page, e.g. "404 Not Found (Directory index not found)".
  void prepareErrorResponse(http::Status status,
                            const std::string& detail = "");

  bool hasResponse() const;

  void setHandler(IHandler* h);
  void clearHandler();
  // Install `handler` and run its start(); a failing handler is replaced
  // by a 500 response.
  HandlerResult executeHandler(IHandler* handler);
};
