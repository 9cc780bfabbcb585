#include "Connection.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <exception>

#include "FileHandler.hpp"
#include "Logger.hpp"
#include "ProxyMockHandler.hpp"
#include "Router.hpp"
#include "constants.hpp"

Connection::Connection()
    : fd(-1),
      read_buffer(),
      write_buffer(),
      write_offset(0),
      headers_end_pos(std::string::npos),
      request(),
      response(),
      active_handler(NULL) {}

Connection::Connection(int fd)
    : fd(fd),
      read_buffer(),
      write_buffer(),
      write_offset(0),
      headers_end_pos(std::string::npos),
      request(),
      response(),
      active_handler(NULL) {}

// The handler is owned by exactly one connection and is never copied.
Connection::Connection(const Connection& other)
    : fd(other.fd),
      read_buffer(other.read_buffer),
      write_buffer(other.write_buffer),
      write_offset(other.write_offset),
      headers_end_pos(other.headers_end_pos),
      request(other.request),
      response(other.response),
      active_handler(NULL) {}

Connection::~Connection() {
  clearHandler();
}

Connection& Connection::operator=(const Connection& other) {
  if (this != &other) {
    fd = other.fd;
    read_buffer = other.read_buffer;
    write_buffer = other.write_buffer;
    write_offset = other.write_offset;
    headers_end_pos = other.headers_end_pos;
    request = other.request;
    response = other.response;
    clearHandler();
  }
  return *this;
}

Connection::ReadStatus Connection::handleRead() {
  while (true) {
    char buf[WRITE_BUF_SIZE];

    ssize_t r = recv(fd, buf, sizeof(buf), 0);

    if (r < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return READ_MORE;
      }
      if (errno == EINTR) {
        continue;
      }
      LOG_PERROR(ERROR, "recv");
      return READ_CLOSED;
    }

    if (r == 0) {
      LOG(DEBUG) << "Client disconnected (fd: " << fd << ")";
      return READ_CLOSED;
    }

    read_buffer.append(buf, static_cast<std::size_t>(r));

    std::size_t pos = read_buffer.find(CRLF CRLF);
    if (pos != std::string::npos) {
      headers_end_pos = pos;
      return READ_COMPLETE;
    }
    if (read_buffer.size() > MAX_HEADER_SIZE) {
      LOG(INFO) << "Request head too large on fd " << fd << " ("
                << read_buffer.size() << " bytes)";
      prepareErrorResponse(http::S_400_BAD_REQUEST);
      return READ_COMPLETE;
    }
  }
}

Connection::WriteStatus Connection::handleWrite() {
  while (write_offset < write_buffer.size()) {
    ssize_t w = send(fd, write_buffer.c_str() + write_offset,
                     write_buffer.size() - write_offset, 0);

    if (w < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        return WRITE_PENDING;
      }
      if (errno == EINTR) {
        continue;
      }
      LOG_PERROR(ERROR, "send");
      return WRITE_ERROR;
    }
    LOG(DEBUG) << "Sent " << w << " bytes to fd=" << fd;

    write_offset += static_cast<std::size_t>(w);
  }

  if (active_handler) {
    HandlerResult hr = active_handler->resume(*this);
    if (hr == HR_WOULD_BLOCK) {
      return WRITE_PENDING;
    }
    clearHandler();
    if (hr == HR_ERROR) {
      // the head is already on the wire; nothing left but to drop the peer
      return WRITE_ERROR;
    }
  }

  return WRITE_DONE;
}

bool Connection::hasResponse() const {
  return !write_buffer.empty() || active_handler != NULL;
}

void Connection::processRequest(const Router& router) {
  response = Response();

  Request::ParseStatus ps = request.parse(read_buffer, headers_end_pos);
  if (ps == Request::PARSE_BAD_REQUEST) {
    LOG(INFO) << "Malformed request on fd " << fd << ", sending 400";
    prepareErrorResponse(http::S_400_BAD_REQUEST);
    return;
  }
  if (ps == Request::PARSE_BAD_VERSION) {
    LOG(INFO) << "Unsupported HTTP version: " << request.version;
    prepareErrorResponse(http::S_505_HTTP_VERSION_NOT_SUPPORTED);
    return;
  }

  try {
    RouteResult route =
        router.route(request.method, request.url.getDecodedPath());

    switch (route.outcome) {
      case RouteResult::SERVE_FILE:
        executeHandler(new FileHandler(route.path, route.content_type));
        return;
      case RouteResult::PROXY:
        executeHandler(new ProxyMockHandler(route.proxy_target));
        return;
      case RouteResult::NOT_FOUND:
      case RouteResult::FORBIDDEN:
      case RouteResult::INTERNAL_ERROR:
        prepareErrorResponse(route.status(), route.detail);
        return;
    }
  } catch (const std::exception& e) {
    LOG(ERROR) << "Failed to handle " << request.method << " "
               << request.target << ": " << e.what();
    clearHandler();
    response = Response();
    prepareErrorResponse(http::S_500_INTERNAL_SERVER_ERROR);
  }
}

void Connection::prepareErrorResponse(http::Status status,
                                      const std::string& detail) {
  response.setStatus(status);

  std::string body = http::statusWithReason(status);
  if (!detail.empty()) {
    body += " (" + detail + ")";
  }
  response.setBodyWithContentType(body, "text/plain; charset=utf-8");

  if (request.isHead()) {
    write_buffer = response.serializeHead();
  } else {
    write_buffer = response.serialize();
  }
  write_offset = 0;
}

void Connection::setHandler(IHandler* h) {
  clearHandler();
  active_handler = h;
  LOG(DEBUG) << "Connection: setHandler installed handler=" << h
             << " fd=" << fd;
}

void Connection::clearHandler() {
  if (active_handler) {
    LOG(DEBUG) << "Connection: clearHandler deleting handler=" << active_handler
               << " fd=" << fd;
    delete active_handler;
    active_handler = NULL;
  }
}

HandlerResult Connection::executeHandler(IHandler* handler) {
  setHandler(handler);
  HandlerResult hr = active_handler->start(*this);
  if (hr == HR_WOULD_BLOCK) {
    return HR_WOULD_BLOCK;
  }
  clearHandler();
  if (hr == HR_ERROR) {
    response = Response();
    prepareErrorResponse(http::S_500_INTERNAL_SERVER_ERROR);
  }
  return hr;
}
