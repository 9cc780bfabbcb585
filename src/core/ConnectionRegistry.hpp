#pragma once

#include <cstddef>
#include <map>

#include "Connection.hpp"

// Live client connections of one listener, keyed by socket fd.
// The registry owns the sockets: remove() and terminateAll() close them.
class ConnectionRegistry {
 public:
  ConnectionRegistry();
  ~ConnectionRegistry();

  Connection& add(int fd);
  // Close and forget `fd`. Returns false if it was not registered.
  bool remove(int fd);
  // Reset every connection (SO_LINGER 0, then close) without draining
  // pending output. Returns how many were terminated.
  std::size_t terminateAll();

  Connection* find(int fd);
  std::size_t size() const;
  bool empty() const;

 private:
  ConnectionRegistry(const ConnectionRegistry& other);
  ConnectionRegistry& operator=(const ConnectionRegistry& other);

  std::map<int, Connection> connections_;
};
