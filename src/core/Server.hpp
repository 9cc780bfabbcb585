#pragma once

#include <stdexcept>
#include <string>

// Failure to open the listening socket. Carries the errno of the failing
// call; EADDRINUSE reads "port <n> already in use".
class ListenError : public std::runtime_error {
 public:
  ListenError(const std::string& message, int err);
  virtual ~ListenError() throw();

  int error() const;

  static std::string describe(const std::string& op, const std::string& host,
                              int port, int err);

 private:
  int err_;
};

// Non-blocking listening socket for one host:port.
class Server {
 public:
  Server();
  Server(const std::string& host, int port);
  ~Server();

  // Create, bind and listen. Throws ListenError; the socket is closed
  // again on failure.
  void init();
  void disconnect();

  // Port actually bound (differs from `port` when it was 0).
  int boundPort() const;

  int fd;
  std::string host;
  int port;

 private:
  Server(const Server& other);
  Server& operator=(const Server& other);

  void fail_(const std::string& op, int err);
};
