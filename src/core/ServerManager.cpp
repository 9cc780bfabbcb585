#include "ServerManager.hpp"

#include <sys/epoll.h>
#include <sys/signalfd.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <stdexcept>
#include <vector>

#include "Config.hpp"
#include "Logger.hpp"
#include "ServerConfig.hpp"
#include "constants.hpp"
#include "utils.hpp"

ServerManager::ServerManager(const std::string& config_path,
                             const std::string& base_dir,
                             const std::string& host, int port_override)
    : config_path_(config_path),
      base_dir_(base_dir),
      host_(host.empty() ? DEFAULT_LISTEN_HOST : host),
      port_override_(port_override),
      efd_(-1),
      sfd_(-1),
      running_(false),
      stop_requested_(false),
      reload_requested_(false),
      reload_failed_(false),
      listener_(),
      connections_(),
      router_() {}

ServerManager::~ServerManager() {
  stop();
  if (efd_ >= 0) {
    close(efd_);
    efd_ = -1;
  }
  if (sfd_ >= 0) {
    close(sfd_);
    sfd_ = -1;
  }
}

bool ServerManager::start() {
  if (running_) {
    LOG(INFO) << "Preview server already running on port " << port();
    return true;
  }

  Config cfg;
  cfg.loadFile(config_path_);
  cfg.dumpTree();

  const ParseResult& parsed = cfg.parseResult();
  if (!parsed.complete) {
    LOG(INFO) << "Config " << config_path_ << " is not well formed ("
              << parsed.unclosed_blocks << " unclosed block(s), "
              << parsed.stray_closers << " stray '}'), using what parsed";
  }

  ServerConfig sc;
  if (!cfg.buildServer(base_dir_, sc)) {
    LOG(ERROR) << "No http/server block found in " << config_path_;
    return false;
  }

  int listen_port = port_override_ > 0 ? port_override_ : sc.listen_port;

  ensureEpoll_();

  listener_.host = host_;
  listener_.port = listen_port;
  listener_.init();

  struct epoll_event event = {};
  event.events = EPOLLIN;
  event.data.fd = listener_.fd;
  if (epoll_ctl(efd_, EPOLL_CTL_ADD, listener_.fd, &event) < 0) {
    LOG_PERROR(ERROR, "epoll_ctl ADD listen_fd");
    listener_.disconnect();
    throw std::runtime_error("Failed to register the listening socket");
  }

  router_ = Router(sc, base_dir_);
  running_ = true;

  LOG(INFO) << "Config file: " << config_path_;
  LOG(INFO) << "Base dir: " << base_dir_;
  LOG(INFO) << "Document root: " << sc.document_root;
  LOG(INFO) << "Locations: " << sc.locations.size();
  LOG(INFO) << "Preview server listening on http://" << host_ << ":"
            << port();
  return true;
}

void ServerManager::stop() {
  if (!running_) {
    return;
  }
  connections_.terminateAll();
  if (efd_ >= 0 && listener_.fd >= 0) {
    epoll_ctl(efd_, EPOLL_CTL_DEL, listener_.fd, NULL);
  }
  listener_.disconnect();
  router_ = Router();
  running_ = false;
  LOG(INFO) << "Preview server stopped";
}

bool ServerManager::restart() {
  LOG(INFO) << "Restarting preview server...";
  stop();
  return start();
}

bool ServerManager::isRunning() const {
  return running_;
}

int ServerManager::port() const {
  return running_ ? listener_.boundPort() : 0;
}

std::size_t ServerManager::connectionCount() const {
  return connections_.size();
}

const Router& ServerManager::router() const {
  return router_;
}

void ServerManager::ensureEpoll_() {
  if (efd_ >= 0) {
    return;
  }
  efd_ = epoll_create1(EPOLL_CLOEXEC);
  if (efd_ < 0) {
    LOG_PERROR(ERROR, "epoll_create1");
    throw std::runtime_error("Failed to create epoll instance");
  }
  LOG(DEBUG) << "Epoll instance created with fd: " << efd_;

  if (sfd_ >= 0) {
    struct epoll_event signal_event = {};
    signal_event.events = EPOLLIN;
    signal_event.data.fd = sfd_;
    if (epoll_ctl(efd_, EPOLL_CTL_ADD, sfd_, &signal_event) < 0) {
      LOG_PERROR(ERROR, "epoll_ctl ADD signalfd");
      throw std::runtime_error("Failed to register signalfd");
    }
  }
}

void ServerManager::updateEvents(int file_descriptor, uint32_t events) {
  struct epoll_event event = {};
  event.events = events;
  event.data.fd = file_descriptor;

  if (epoll_ctl(efd_, EPOLL_CTL_MOD, file_descriptor, &event) < 0) {
    if (errno == ENOENT) {
      if (epoll_ctl(efd_, EPOLL_CTL_ADD, file_descriptor, &event) < 0) {
        LOG_PERROR(ERROR, "epoll_ctl ADD");
        throw std::runtime_error("Failed to add file descriptor to epoll");
      }
    } else {
      LOG_PERROR(ERROR, "epoll_ctl MOD");
      throw std::runtime_error("Failed to modify epoll events");
    }
  }
}

void ServerManager::acceptConnection() {
  while (listener_.fd >= 0) {
    int conn_fd = accept(listener_.fd, NULL, NULL);
    if (conn_fd < 0) {
      if (errno != EAGAIN && errno != EWOULDBLOCK) {
        LOG_PERROR(ERROR, "accept");
      }
      break;
    }
    if (set_nonblocking(conn_fd) < 0) {
      LOG_PERROR(ERROR, "set_nonblocking conn_fd");
      close(conn_fd);
      continue;
    }

    connections_.add(conn_fd);
    LOG(DEBUG) << "New connection accepted (fd: " << conn_fd << ")";
    try {
      updateEvents(conn_fd, EPOLLIN | EPOLLET);
    } catch (const std::runtime_error&) {
      connections_.remove(conn_fd);
    }
  }
}

void ServerManager::closeConnection(int fd) {
  connections_.remove(fd);  // close() also drops it from the epoll set
}

void ServerManager::handleConnectionEvent(int fd, uint32_t ev_mask) {
  Connection* conn = connections_.find(fd);
  if (conn == NULL) {
    LOG(DEBUG) << "Unknown fd: " << fd << ", skipping";
    return;
  }

  if ((ev_mask & (EPOLLERR | EPOLLHUP)) != 0U && (ev_mask & EPOLLIN) == 0U) {
    LOG(DEBUG) << "Peer hung up on fd " << fd;
    closeConnection(fd);
    return;
  }

  if ((ev_mask & EPOLLIN) != 0U && !conn->hasResponse()) {
    Connection::ReadStatus rs = conn->handleRead();
    if (rs == Connection::READ_CLOSED) {
      closeConnection(fd);
      return;
    }
    if (rs == Connection::READ_MORE) {
      return;
    }
    if (!conn->hasResponse()) {
      conn->processRequest(router_);
    }
    // EPOLL_CTL_MOD re-arms the edge, so a writable socket reports at once
    updateEvents(fd, EPOLLOUT | EPOLLET);
    return;
  }

  if ((ev_mask & EPOLLOUT) != 0U) {
    Connection::WriteStatus ws = conn->handleWrite();
    if (ws != Connection::WRITE_PENDING) {
      closeConnection(fd);
    }
  }
}

int ServerManager::runOnce(int timeout_ms) {
  if (efd_ < 0) {
    LOG(ERROR) << "epoll fd not initialized";
    return -1;
  }

  std::vector<struct epoll_event> events(MAX_EVENTS);
  int num_events = epoll_wait(efd_, &events[0], MAX_EVENTS, timeout_ms);
  if (num_events < 0) {
    if (errno == EINTR) {
      return 0;
    }
    LOG_PERROR(ERROR, "epoll_wait");
    return -1;
  }

  for (int i = 0; i < num_events; ++i) {
    int event_fd = events[static_cast<size_t>(i)].data.fd;
    uint32_t event_mask = events[static_cast<size_t>(i)].events;

    if (event_fd == sfd_) {
      processSignalsFromFd();
      continue;
    }
    if (event_fd == listener_.fd) {
      acceptConnection();
      continue;
    }
    try {
      handleConnectionEvent(event_fd, event_mask);
    } catch (const std::exception& e) {
      LOG(ERROR) << "Dropping connection fd " << event_fd << ": " << e.what();
      closeConnection(event_fd);
    }
  }

  if (reload_requested_ && !stop_requested_) {
    reload_requested_ = false;
    try {
      if (!restart()) {
        reload_failed_ = true;
      }
    } catch (const std::exception& e) {
      LOG(ERROR) << "Reload failed: " << e.what();
      reload_failed_ = true;
    }
  }
  return num_events;
}

int ServerManager::run() {
  if (!running_) {
    LOG(ERROR) << "run() called before a successful start()";
    return EXIT_FAILURE;
  }
  LOG(INFO) << "Entering main event loop (waiting for connections)...";

  while (!stop_requested_) {
    if (runOnce(-1) < 0) {
      stop();
      return EXIT_FAILURE;
    }
    if (reload_failed_) {
      LOG(ERROR) << "Preview server stopped after a failed reload";
      return EXIT_FAILURE;
    }
  }
  LOG(INFO) << "Stop requested, exiting event loop";
  stop();
  return EXIT_SUCCESS;
}

void ServerManager::setupSignalHandlers() {
  // Block the signals we want to handle
  sigset_t mask;
  sigemptyset(&mask);
  sigaddset(&mask, SIGINT);
  sigaddset(&mask, SIGTERM);
  sigaddset(&mask, SIGHUP);

  if (sigprocmask(SIG_BLOCK, &mask, NULL) < 0) {
    LOG_PERROR(ERROR, "sigprocmask");
    throw std::runtime_error("Failed to block signals with sigprocmask");
  }

  sfd_ = signalfd(-1, &mask, SFD_CLOEXEC | SFD_NONBLOCK);
  if (sfd_ < 0) {
    LOG_PERROR(ERROR, "signalfd");
    sigprocmask(SIG_UNBLOCK, &mask, NULL);
    throw std::runtime_error("Failed to create signalfd");
  }

  // Ignore SIGPIPE
  struct sigaction sa_pipe = {};
  std::memset(&sa_pipe, 0, sizeof(sa_pipe));
  sa_pipe.sa_handler = SIG_IGN;
  sigemptyset(&sa_pipe.sa_mask);
  if (sigaction(SIGPIPE, &sa_pipe, NULL) < 0) {
    LOG_PERROR(ERROR, "sigaction(SIGPIPE)");
    throw std::runtime_error("Failed to ignore SIGPIPE with sigaction");
  }

  if (efd_ >= 0) {
    struct epoll_event signal_event = {};
    signal_event.events = EPOLLIN;
    signal_event.data.fd = sfd_;
    if (epoll_ctl(efd_, EPOLL_CTL_ADD, sfd_, &signal_event) < 0) {
      LOG_PERROR(ERROR, "epoll_ctl ADD signalfd");
      throw std::runtime_error("Failed to register signalfd");
    }
  }

  LOG(DEBUG) << "signals: signalfd installed and signals blocked";
}

bool ServerManager::processSignalsFromFd() {
  struct signalfd_siginfo fdsi = {};
  while (true) {
    ssize_t bytes_read = read(sfd_, &fdsi, sizeof(fdsi));
    if (bytes_read < 0) {
      if (errno != EAGAIN && errno != EWOULDBLOCK) {
        LOG_PERROR(ERROR, "read(signalfd)");
      }
      return stop_requested_;
    }
    if (bytes_read != static_cast<ssize_t>(sizeof(fdsi))) {
      LOG(ERROR) << "signals: short read from signalfd (" << bytes_read
                 << " bytes, expected " << sizeof(fdsi) << ")";
      return stop_requested_;
    }

    if (fdsi.ssi_signo == SIGINT || fdsi.ssi_signo == SIGTERM) {
      LOG(INFO) << "signals: got " << strsignal(fdsi.ssi_signo)
                << ", stopping";
      stop_requested_ = true;
    } else if (fdsi.ssi_signo == SIGHUP) {
      LOG(INFO) << "signals: got SIGHUP, reloading configuration";
      reload_requested_ = true;
    } else {
      LOG(INFO) << "signals: got unexpected signo=" << fdsi.ssi_signo;
    }
  }
}
