#pragma once

#include <sys/types.h>

#include <string>

#include "ConnectionRegistry.hpp"
#include "Router.hpp"
#include "Server.hpp"

// Owns the listener, its connections and the active configuration.
//
// start() reads the config file, builds the ServerConfig and binds; stop()
// closes the listener and resets every connection; restart() does both so
// edits to the config file take effect. run() drives the epoll loop until
// SIGINT/SIGTERM, reloading on SIGHUP.
class ServerManager {
 public:
  ServerManager(const std::string& config_path, const std::string& base_dir,
                const std::string& host, int port_override);
  ~ServerManager();

  // Returns false when the config has no http/server block. Throws
  // ConfigError on an invalid config, ListenError when binding fails and
  // std::runtime_error when the file cannot be read. Stays stopped on
  // any failure.
  bool start();
  void stop();
  bool restart();

  bool isRunning() const;
  // Port being listened on, or 0 when stopped.
  int port() const;
  std::size_t connectionCount() const;
  const Router& router() const;

  void setupSignalHandlers();

  // Event loop. Returns EXIT_SUCCESS on a stop signal, EXIT_FAILURE when a
  // reload failed or the loop itself broke.
  int run();
  // Wait up to `timeout_ms` for events and process them once. Returns the
  // number of events handled, or -1 on an epoll failure.
  int runOnce(int timeout_ms);

 private:
  ServerManager(const ServerManager& other);
  ServerManager& operator=(const ServerManager& other);

  void ensureEpoll_();
  void updateEvents(int fd, u_int32_t events);
  void acceptConnection();
  void handleConnectionEvent(int fd, u_int32_t ev_mask);
  void closeConnection(int fd);
  bool processSignalsFromFd();

  std::string config_path_;
  std::string base_dir_;
  std::string host_;
  int port_override_;

  int efd_;
  int sfd_;
  bool running_;
  bool stop_requested_;
  bool reload_requested_;
  bool reload_failed_;

  Server listener_;
  ConnectionRegistry connections_;
  Router router_;
};
