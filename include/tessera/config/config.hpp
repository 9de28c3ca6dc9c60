#ifndef TESSERA_CONFIG_CONFIG_HPP
#define TESSERA_CONFIG_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tessera {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message)
    : std::runtime_error("Configuration error: " + message) {}
};

// Returns the value of an environment variable, if set
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;
// Lookup backed by std::getenv
EnvLookup process_environment();

// Parsed command line: long flag name -> value
using FlagMap = std::map<std::string, std::string>;

// One accepted flag, e.g. {"-p", "--port"}
struct FlagSpec {
  std::string short_name;
  std::string long_name;
};

// Parses "-x value" / "--long value" pairs into a map keyed by long name.
// Throws ConfigError on unknown flags or a flag without value.
FlagMap parse_flags(int argc, const char* const argv[], const std::vector<FlagSpec>& specs);

struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 3001;
  std::string storage_path = "./data/sessions";
  uint32_t chunk_size = 64 * 1024;
  uint32_t max_items_per_session = 20;
  uint32_t items_per_page = 5;
  std::size_t db_pool_size = 4;
  std::chrono::milliseconds cleanup_interval{60 * 1000};
  std::chrono::milliseconds session_timeout{7LL * 24 * 60 * 60 * 1000};
  std::chrono::milliseconds pending_timeout{60 * 60 * 1000};
  std::chrono::milliseconds heartbeat_timeout{90 * 1000};
  std::string log_file;
  std::string log_level = "info";

  static std::vector<FlagSpec> flags();
  void apply_environment(const EnvLookup& env);
  void apply_flags(const FlagMap& flags);
  // Throws ConfigError
  void validate() const;
};

struct ClientConfig {
  std::string host = "127.0.0.1";
  uint16_t port = 3001;
  std::string session_id;
  std::string passphrase;
  std::string client_name = "tessera";
  std::string output_dir = "./downloads";
  std::string cache_path = "./tessera-cache.db";
  uint64_t cache_max_bytes = 256ULL * 1024 * 1024;
  uint32_t chunk_size = 64 * 1024;
  std::string crypto_backend = "provider";
  unsigned kdf_iterations = 100000;
  uint32_t retry_max_attempts = 5;
  std::chrono::milliseconds retry_base_delay{500};
  std::chrono::milliseconds retry_max_delay{30 * 1000};
  std::chrono::milliseconds reconnect_min_delay{1000};
  std::chrono::milliseconds reconnect_max_delay{30 * 1000};
  std::chrono::milliseconds heartbeat_interval{30 * 1000};
  std::string log_file = "tessera.log";
  std::string log_level = "info";

  static std::vector<FlagSpec> flags();
  void apply_environment(const EnvLookup& env);
  void apply_flags(const FlagMap& flags);
  // Throws ConfigError
  void validate() const;
};

// Defaults, then environment, then flags, then validate
ServerConfig load_server_config(int argc, const char* const argv[], const EnvLookup& env);
ClientConfig load_client_config(int argc, const char* const argv[], const EnvLookup& env);

} // namespace config
} // namespace tessera

#endif // TESSERA_CONFIG_CONFIG_HPP
