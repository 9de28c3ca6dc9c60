#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/log/trivial.hpp>
#include <csignal>
#include <iostream>
#include "tessera/config/config.hpp"
#include "tessera/logging/logger.hpp"
#include "tessera/sync/server_bootstrap.hpp"

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -h <host> -p <port> [-s <storage>] [-l <log file>]\n"
            << "Optional arguments:\n"
            << "  -h, --host        Listen address (default 0.0.0.0)\n"
            << "  -p, --port        Port number (default 3001)\n"
            << "  -s, --storage     Storage root (default ./data/sessions)\n"
            << "  -l, --log         Log file, console when omitted\n"
            << "  -v, --log-level   trace, debug, info, warning, error or fatal\n"
            << "  -c, --chunk-size  Chunk size in bytes (default 65536)\n"
            << "  -m, --max-items   Items kept per session (default 20)\n"
            << "Environment variables TESSERA_* override defaults, flags override both.\n"
            << "Example: " << program_name << " -h 127.0.0.1 -p 3001\n";
}

bool run_server(const tessera::config::ServerConfig& config) {
  try {
    tessera::sync::ServerBootstrap server(config);
    if (!server.start()) {
      std::cerr << "Error: Failed to start server\n";
      return false;
    }

    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
      if (!ec) {
        BOOST_LOG_TRIVIAL(info) << "Server: Received signal " << signal_number;
      }
    });
    std::cout << "Serving on " << config.host << ":" << server.port() << ", Ctrl-C to stop" << std::endl;
    signals_context.run();

    server.shutdown();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Server failed: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  tessera::config::ServerConfig config;
  try {
    config = tessera::config::load_server_config(argc, argv, tessera::config::process_environment());
  } catch (const tessera::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    print_usage(argv[0]);
    return 1;
  }

  const auto level = tessera::logging::parse_severity(config.log_level);
  if (config.log_file.empty()) {
    tessera::logging::init_console_logging(level);
  } else {
    tessera::logging::init_logging(config.log_file, level);
  }

  return run_server(config) ? 0 : 1;
}
