#include "ConnectionRegistry.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "Logger.hpp"

ConnectionRegistry::ConnectionRegistry() : connections_() {}

ConnectionRegistry::~ConnectionRegistry() {
  terminateAll();
}

Connection& ConnectionRegistry::add(int fd) {
  Connection& conn = connections_[fd];
  conn = Connection(fd);
  LOG(DEBUG) << "Registry: added fd " << fd << " (" << connections_.size()
             << " live)";
  return conn;
}

bool ConnectionRegistry::remove(int fd) {
  std::map<int, Connection>::iterator it = connections_.find(fd);
  if (it == connections_.end()) {
    return false;
  }
  it->second.clearHandler();
  close(fd);
  connections_.erase(it);
  LOG(DEBUG) << "Registry: removed fd " << fd << " (" << connections_.size()
             << " live)";
  return true;
}

std::size_t ConnectionRegistry::terminateAll() {
  std::size_t count = connections_.size();
  for (std::map<int, Connection>::iterator it = connections_.begin();
       it != connections_.end(); ++it) {
    struct linger lg;
    lg.l_onoff = 1;
    lg.l_linger = 0;
    if (setsockopt(it->first, SOL_SOCKET, SO_LINGER, &lg, sizeof(lg)) < 0) {
      LOG_PERROR(DEBUG, "setsockopt(SO_LINGER) fd " << it->first);
    }
    it->second.clearHandler();
    close(it->first);
  }
  connections_.clear();
  if (count > 0) {
    LOG(INFO) << "Terminated " << count << " open connection(s)";
  }
  return count;
}

Connection* ConnectionRegistry::find(int fd) {
  std::map<int, Connection>::iterator it = connections_.find(fd);
  if (it == connections_.end()) {
    return NULL;
  }
  return &it->second;
}

std::size_t ConnectionRegistry::size() const {
  return connections_.size();
}

bool ConnectionRegistry::empty() const {
  return connections_.empty();
}
