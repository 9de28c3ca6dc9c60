#include <boost/log/trivial.hpp>
#include <iostream>
#include <string>
#include "tessera/cache/local_chunk_cache.hpp"
#include "tessera/cli/cli.hpp"
#include "tessera/config/config.hpp"
#include "tessera/crypto/crypto_provider.hpp"
#include "tessera/logging/logger.hpp"
#include "tessera/network/network_error.hpp"
#include "tessera/sync/sync_client.hpp"

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " -h <host> -p <port> -S <session> -k <passphrase> [-o <dir>]\n"
            << "Required arguments:\n"
            << "  -h, --host        Server address\n"
            << "  -p, --port        Server port\n"
            << "  -S, --session     Session id, 1-128 of [A-Za-z0-9_-]\n"
            << "  -k, --passphrase  Shared session passphrase\n"
            << "Optional arguments:\n"
            << "  -o, --output      Download directory (default ./downloads)\n"
            << "  -c, --cache       Local cache database (default ./tessera-cache.db)\n"
            << "  -n, --name        Name shown to other members\n"
            << "  -b, --backend     Crypto backend: provider or stream\n"
            << "  -l, --log         Log file (default tessera.log)\n"
            << "  -v, --log-level   trace, debug, info, warning, error or fatal\n"
            << "Example: " << program_name << " -h 127.0.0.1 -p 3001 -S team -k 'correct horse'\n";
}

bool run_client(const tessera::config::ClientConfig& config) {
  try {
    auto crypto = tessera::crypto::make_crypto_provider(
        tessera::crypto::parse_crypto_backend(config.crypto_backend), config.kdf_iterations);
    tessera::cache::LocalChunkCache cache(config.cache_path, config.cache_max_bytes);
    tessera::sync::SyncClient client(config, *crypto, cache);
    tessera::cli::CLI cli(client, config.output_dir);

    try {
      client.connect();
      std::cout << "Joined session " << config.session_id << " on " << config.host << ":" << config.port << std::endl;
    } catch (const tessera::network::NetworkError& e) {
      std::cerr << "Warning: " << e.what() << ", retrying in the background\n";
    }
    client.start();

    cli.run();
    client.disconnect();
    return true;
  } catch (const tessera::sync::SyncError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return false;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start client: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  tessera::config::ClientConfig config;
  try {
    config = tessera::config::load_client_config(argc, argv, tessera::config::process_environment());
  } catch (const tessera::config::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    print_usage(argv[0]);
    return 1;
  }

  tessera::logging::init_logging(config.log_file, tessera::logging::parse_severity(config.log_level));
  BOOST_LOG_TRIVIAL(info) << "Client starting for session " << config.session_id;

  return run_client(config) ? 0 : 1;
}
