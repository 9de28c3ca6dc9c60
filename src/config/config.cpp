#include "tessera/config/config.hpp"
#include <boost/log/trivial.hpp>
#include <cstdlib>
#include <limits>
#include "tessera/crypto/crypto_provider.hpp"
#include "tessera/logging/logger.hpp"
#include "tessera/network/codec.hpp"
#include "tessera/store/content.hpp"

namespace tessera {
namespace config {

namespace {

uint64_t parse_unsigned(const std::string& name, const std::string& value,
                        uint64_t max = std::numeric_limits<uint64_t>::max()) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw ConfigError(name + " must be a non-negative integer, got '" + value + "'");
  }
  uint64_t parsed = 0;
  try {
    parsed = std::stoull(value);
  } catch (const std::out_of_range&) {
    throw ConfigError(name + " is out of range: " + value);
  }
  if (parsed > max) {
    throw ConfigError(name + " exceeds " + std::to_string(max) + ": " + value);
  }
  return parsed;
}

std::chrono::milliseconds parse_millis(const std::string& name, const std::string& value) {
  return std::chrono::milliseconds(
      static_cast<std::chrono::milliseconds::rep>(parse_unsigned(name, value, 1ULL << 50)));
}

uint16_t parse_port(const std::string& name, const std::string& value) {
  return static_cast<uint16_t>(parse_unsigned(name, value, std::numeric_limits<uint16_t>::max()));
}

uint32_t parse_u32(const std::string& name, const std::string& value) {
  return static_cast<uint32_t>(parse_unsigned(name, value, std::numeric_limits<uint32_t>::max()));
}

// Invokes apply with the value when the key is present
template <typename Source, typename Apply>
void with(const Source& source, const std::string& key, Apply apply) {
  auto it = source.find(key);
  if (it != source.end()) {
    apply(it->second);
  }
}

template <typename Apply>
void with_env(const EnvLookup& env, const std::string& key, Apply apply) {
  if (auto value = env(key)) {
    apply(*value);
  }
}

void validate_log_level(const std::string& level) {
  try {
    logging::parse_severity(level);
  } catch (const std::invalid_argument& e) {
    throw ConfigError(e.what());
  }
}

// Every chunk must fit in one wire frame
void validate_chunk_size(uint32_t chunk_size) {
  if (chunk_size == 0) {
    throw ConfigError("chunk size must be positive");
  }
  if (chunk_size > network::Codec::MAX_CHUNK_SIZE) {
    throw ConfigError("chunk size " + std::to_string(chunk_size) + " exceeds the maximum of " +
                      std::to_string(network::Codec::MAX_CHUNK_SIZE) + " bytes");
  }
}

} // namespace

EnvLookup process_environment() {
  return [](const std::string& key) -> std::optional<std::string> {
    const char* value = std::getenv(key.c_str());
    if (value == nullptr) {
      return std::nullopt;
    }
    return std::string(value);
  };
}

FlagMap parse_flags(int argc, const char* const argv[], const std::vector<FlagSpec>& specs) {
  FlagMap flags;
  for (int i = 1; i < argc; i += 2) {
    const std::string flag(argv[i]);
    const FlagSpec* match = nullptr;
    for (const auto& spec : specs) {
      if (flag == spec.short_name || flag == spec.long_name) {
        match = &spec;
        break;
      }
    }
    if (match == nullptr) {
      throw ConfigError("unknown argument: " + flag);
    }
    if (i + 1 >= argc) {
      throw ConfigError("missing value for " + flag);
    }
    flags[match->long_name] = argv[i + 1];
  }
  return flags;
}

//==============================================
// SERVER CONFIGURATION
//==============================================

std::vector<FlagSpec> ServerConfig::flags() {
  return {
    {"-h", "--host"},
    {"-p", "--port"},
    {"-s", "--storage"},
    {"-l", "--log"},
    {"-v", "--log-level"},
    {"-c", "--chunk-size"},
    {"-m", "--max-items"}
  };
}

void ServerConfig::apply_environment(const EnvLookup& env) {
  with_env(env, "TESSERA_HOST", [this](const std::string& v) { host = v; });
  with_env(env, "TESSERA_PORT", [this](const std::string& v) { port = parse_port("TESSERA_PORT", v); });
  with_env(env, "TESSERA_STORAGE", [this](const std::string& v) { storage_path = v; });
  with_env(env, "TESSERA_CHUNK_SIZE", [this](const std::string& v) { chunk_size = parse_u32("TESSERA_CHUNK_SIZE", v); });
  with_env(env, "TESSERA_MAX_ITEMS", [this](const std::string& v) {
    max_items_per_session = parse_u32("TESSERA_MAX_ITEMS", v);
  });
  with_env(env, "TESSERA_PAGE_SIZE", [this](const std::string& v) { items_per_page = parse_u32("TESSERA_PAGE_SIZE", v); });
  with_env(env, "TESSERA_CLEANUP_INTERVAL_MS", [this](const std::string& v) {
    cleanup_interval = parse_millis("TESSERA_CLEANUP_INTERVAL_MS", v);
  });
  with_env(env, "TESSERA_SESSION_TIMEOUT_MS", [this](const std::string& v) {
    session_timeout = parse_millis("TESSERA_SESSION_TIMEOUT_MS", v);
  });
  with_env(env, "TESSERA_PENDING_TIMEOUT_MS", [this](const std::string& v) {
    pending_timeout = parse_millis("TESSERA_PENDING_TIMEOUT_MS", v);
  });
  with_env(env, "TESSERA_HEARTBEAT_TIMEOUT_MS", [this](const std::string& v) {
    heartbeat_timeout = parse_millis("TESSERA_HEARTBEAT_TIMEOUT_MS", v);
  });
  with_env(env, "TESSERA_LOG_FILE", [this](const std::string& v) { log_file = v; });
  with_env(env, "TESSERA_LOG_LEVEL", [this](const std::string& v) { log_level = v; });
}

void ServerConfig::apply_flags(const FlagMap& flags) {
  with(flags, "--host", [this](const std::string& v) { host = v; });
  with(flags, "--port", [this](const std::string& v) { port = parse_port("--port", v); });
  with(flags, "--storage", [this](const std::string& v) { storage_path = v; });
  with(flags, "--log", [this](const std::string& v) { log_file = v; });
  with(flags, "--log-level", [this](const std::string& v) { log_level = v; });
  with(flags, "--chunk-size", [this](const std::string& v) { chunk_size = parse_u32("--chunk-size", v); });
  with(flags, "--max-items", [this](const std::string& v) { max_items_per_session = parse_u32("--max-items", v); });
}

void ServerConfig::validate() const {
  if (host.empty()) {
    throw ConfigError("host must not be empty");
  }
  if (storage_path.empty()) {
    throw ConfigError("storage path must not be empty");
  }
  validate_chunk_size(chunk_size);
  if (max_items_per_session == 0) {
    throw ConfigError("max items per session must be positive");
  }
  if (items_per_page == 0) {
    throw ConfigError("items per page must be positive");
  }
  if (db_pool_size == 0) {
    throw ConfigError("database pool size must be positive");
  }
  if (cleanup_interval.count() <= 0 || session_timeout.count() <= 0 ||
      pending_timeout.count() <= 0 || heartbeat_timeout.count() <= 0) {
    throw ConfigError("intervals and timeouts must be positive");
  }
  validate_log_level(log_level);
}

//==============================================
// CLIENT CONFIGURATION
//==============================================

std::vector<FlagSpec> ClientConfig::flags() {
  return {
    {"-h", "--host"},
    {"-p", "--port"},
    {"-S", "--session"},
    {"-k", "--passphrase"},
    {"-o", "--output"},
    {"-c", "--cache"},
    {"-n", "--name"},
    {"-b", "--backend"},
    {"-l", "--log"},
    {"-v", "--log-level"}
  };
}

void ClientConfig::apply_environment(const EnvLookup& env) {
  with_env(env, "TESSERA_HOST", [this](const std::string& v) { host = v; });
  with_env(env, "TESSERA_PORT", [this](const std::string& v) { port = parse_port("TESSERA_PORT", v); });
  with_env(env, "TESSERA_SESSION", [this](const std::string& v) { session_id = v; });
  with_env(env, "TESSERA_PASSPHRASE", [this](const std::string& v) { passphrase = v; });
  with_env(env, "TESSERA_CLIENT_NAME", [this](const std::string& v) { client_name = v; });
  with_env(env, "TESSERA_OUTPUT_DIR", [this](const std::string& v) { output_dir = v; });
  with_env(env, "TESSERA_CACHE_PATH", [this](const std::string& v) { cache_path = v; });
  with_env(env, "TESSERA_CACHE_BYTES", [this](const std::string& v) {
    cache_max_bytes = parse_unsigned("TESSERA_CACHE_BYTES", v);
  });
  with_env(env, "TESSERA_CHUNK_SIZE", [this](const std::string& v) { chunk_size = parse_u32("TESSERA_CHUNK_SIZE", v); });
  with_env(env, "TESSERA_CRYPTO_BACKEND", [this](const std::string& v) { crypto_backend = v; });
  with_env(env, "TESSERA_KDF_ITERATIONS", [this](const std::string& v) {
    kdf_iterations = static_cast<unsigned>(parse_u32("TESSERA_KDF_ITERATIONS", v));
  });
  with_env(env, "TESSERA_RETRY_ATTEMPTS", [this](const std::string& v) {
    retry_max_attempts = parse_u32("TESSERA_RETRY_ATTEMPTS", v);
  });
  with_env(env, "TESSERA_LOG_FILE", [this](const std::string& v) { log_file = v; });
  with_env(env, "TESSERA_LOG_LEVEL", [this](const std::string& v) { log_level = v; });
}

void ClientConfig::apply_flags(const FlagMap& flags) {
  with(flags, "--host", [this](const std::string& v) { host = v; });
  with(flags, "--port", [this](const std::string& v) { port = parse_port("--port", v); });
  with(flags, "--session", [this](const std::string& v) { session_id = v; });
  with(flags, "--passphrase", [this](const std::string& v) { passphrase = v; });
  with(flags, "--output", [this](const std::string& v) { output_dir = v; });
  with(flags, "--cache", [this](const std::string& v) { cache_path = v; });
  with(flags, "--name", [this](const std::string& v) { client_name = v; });
  with(flags, "--backend", [this](const std::string& v) { crypto_backend = v; });
  with(flags, "--log", [this](const std::string& v) { log_file = v; });
  with(flags, "--log-level", [this](const std::string& v) { log_level = v; });
}

void ClientConfig::validate() const {
  if (host.empty() || port == 0) {
    throw ConfigError("host and port are required");
  }
  if (!store::is_valid_identifier(session_id)) {
    throw ConfigError("session id must be 1-128 characters of [A-Za-z0-9_-]");
  }
  if (passphrase.empty()) {
    throw ConfigError("passphrase must not be empty");
  }
  if (cache_path.empty() || output_dir.empty()) {
    throw ConfigError("cache path and output directory must not be empty");
  }
  if (cache_max_bytes == 0 || kdf_iterations == 0 || retry_max_attempts == 0) {
    throw ConfigError("cache size, kdf iterations and retry attempts must be positive");
  }
  validate_chunk_size(chunk_size);
  if (retry_base_delay.count() <= 0 || retry_max_delay < retry_base_delay) {
    throw ConfigError("retry delays must be positive and ordered");
  }
  if (reconnect_min_delay.count() <= 0 || reconnect_max_delay < reconnect_min_delay) {
    throw ConfigError("reconnect delays must be positive and ordered");
  }
  try {
    crypto::parse_crypto_backend(crypto_backend);
  } catch (const crypto::CryptoError& e) {
    throw ConfigError(e.what());
  }
  validate_log_level(log_level);
}

//==============================================
// LOADING
//==============================================

ServerConfig load_server_config(int argc, const char* const argv[], const EnvLookup& env) {
  ServerConfig config;
  config.apply_environment(env);
  config.apply_flags(parse_flags(argc, argv, ServerConfig::flags()));
  config.validate();
  BOOST_LOG_TRIVIAL(debug) << "Config: Server " << config.host << ":" << config.port
                           << " storage " << config.storage_path;
  return config;
}

ClientConfig load_client_config(int argc, const char* const argv[], const EnvLookup& env) {
  ClientConfig config;
  config.apply_environment(env);
  config.apply_flags(parse_flags(argc, argv, ClientConfig::flags()));
  config.validate();
  BOOST_LOG_TRIVIAL(debug) << "Config: Client " << config.host << ":" << config.port
                           << " session " << config.session_id;
  return config;
}

} // namespace config
} // namespace tessera
