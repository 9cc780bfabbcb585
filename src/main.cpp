#include <cstdlib>
#include <exception>
#include <string>

#include "Config.hpp"
#include "ConfigError.hpp"
#include "Logger.hpp"
#include "Server.hpp"
#include "ServerManager.hpp"
#include "file_utils.hpp"
#include "utils.hpp"

int main(int argc, char** argv) {
  // ngxpreview [-l:N] [-H host] [-p port] [-b base_dir] [config_path]
  // 0 = DEBUG, 1 = INFO, 2 = ERROR

  Options opts;
  try {
    processArgs(argc, argv, opts);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Error processing command-line arguments: " << e.what();
    LOG(ERROR) << "usage: " << argv[0]
               << " [-l:N] [-H host] [-p port] [-b base_dir] [config_path]";
    return EXIT_FAILURE;
  }

  Logger::setLevel(static_cast<Logger::LogLevel>(opts.log_level));

  std::string base_dir = file_utils::absolutePath(
      opts.base_dir.empty() ? std::string(".") : opts.base_dir);
  std::string explicit_path;
  if (!opts.config_path.empty()) {
    explicit_path = file_utils::absolutePath(opts.config_path);
  }

  std::string config_path;
  if (!Config::findConfigFile(explicit_path, base_dir, config_path)) {
    if (!explicit_path.empty()) {
      LOG(ERROR) << "Cannot read config file " << explicit_path;
    } else {
      LOG(ERROR) << "nginx.conf not found in " << base_dir;
    }
    return EXIT_FAILURE;
  }

  ServerManager sm(config_path, base_dir, opts.host, opts.port_override);
  try {
    sm.setupSignalHandlers();
    if (!sm.start()) {
      return EXIT_FAILURE;
    }
    return sm.run();
  } catch (const ConfigError& e) {
    LOG(ERROR) << e.what();
    return EXIT_FAILURE;
  } catch (const ListenError& e) {
    LOG(ERROR) << "Failed to start preview server: " << e.what();
    return EXIT_FAILURE;
  } catch (const std::exception& e) {
    LOG(ERROR) << "Error in config or server initialization: " << e.what();
    return EXIT_FAILURE;
  }
}
