#include "Server.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>

#include "Logger.hpp"
#include "constants.hpp"
#include "utils.hpp"

ListenError::ListenError(const std::string& message, int err)
    : std::runtime_error(message), err_(err) {}

ListenError::~ListenError() throw() {}

int ListenError::error() const {
  return err_;
}

std::string ListenError::describe(const std::string& op,
                                  const std::string& host, int port, int err) {
  std::ostringstream oss;
  if (err == EADDRINUSE) {
    oss << "port " << port << " already in use";
  } else {
    oss << op << " " << host << ":" << port << " failed: "
        << std::strerror(err);
  }
  return oss.str();
}

Server::Server() : fd(-1), host(DEFAULT_LISTEN_HOST), port(DEFAULT_LISTEN_PORT) {}

Server::Server(const std::string& host, int port)
    : fd(-1), host(host), port(port) {}

Server::~Server() {
  disconnect();
}

void Server::fail_(const std::string& op, int err) {
  disconnect();
  std::string msg = ListenError::describe(op, host, port, err);
  LOG(ERROR) << msg;
  throw ListenError(msg, err);
}

void Server::init() {
  LOG(DEBUG) << "Initializing listener on " << host << ":" << port << "...";

  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<unsigned short>(port));

  if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) != 1) {
    // not a dotted quad: let the resolver handle names like "localhost"
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = NULL;
    int rc = getaddrinfo(host.c_str(), NULL, &hints, &res);
    if (rc != 0 || res == NULL) {
      std::string msg = "cannot resolve listen host '" + host +
                        "': " + gai_strerror(rc);
      LOG(ERROR) << msg;
      throw ListenError(msg, EINVAL);
    }
    addr.sin_addr =
        reinterpret_cast<struct sockaddr_in*>(res->ai_addr)->sin_addr;
    freeaddrinfo(res);
  }

  fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    fail_("socket", errno);
  }
  LOG(DEBUG) << "Socket created with fd: " << fd;

  /* avoid "address already in use" on quick restarts */
  int opt = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    fail_("setsockopt", errno);
  }

  if (bind(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    fail_("bind", errno);
  }

  if (listen(fd, LISTEN_BACKLOG) < 0) {
    fail_("listen", errno);
  }
  LOG(DEBUG) << "Socket listening with backlog: " << LISTEN_BACKLOG;

  if (set_nonblocking(fd) < 0) {
    fail_("set_nonblocking", errno);
  }

  LOG(DEBUG) << "Listener fd " << fd << " ready on " << host << ":"
             << boundPort();
}

void Server::disconnect() {
  if (fd != -1) {
    LOG(DEBUG) << "Closing listener socket fd: " << fd;
    close(fd);
    fd = -1;
  }
}

int Server::boundPort() const {
  if (fd < 0) {
    return port;
  }
  struct sockaddr_in addr;
  socklen_t len = sizeof(addr);
  std::memset(&addr, 0, sizeof(addr));
  if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
    LOG_PERROR(ERROR, "getsockname");
    return port;
  }
  return ntohs(addr.sin_port);
}
