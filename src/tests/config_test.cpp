#include <gtest/gtest.h>
#include <map>
#include <string>
#include <vector>
#include "tessera/config/config.hpp"
#include "tessera/network/codec.hpp"

using namespace tessera::config;

namespace {

EnvLookup env_of(std::map<std::string, std::string> values) {
  return [values](const std::string& key) -> std::optional<std::string> {
    auto it = values.find(key);
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

EnvLookup empty_env() {
  return env_of({});
}

ClientConfig valid_client() {
  ClientConfig config;
  config.session_id = "team-room_1";
  config.passphrase = "secret";
  return config;
}

} // namespace

//==============================================
// FLAG PARSING
//==============================================

TEST(ParseFlagsTest, MapsShortAndLongNames) {
  const char* argv[] = {"tessera-server", "-p", "4000", "--storage", "/tmp/x"};
  const auto flags = parse_flags(5, argv, ServerConfig::flags());

  ASSERT_EQ(flags.size(), 2u);
  EXPECT_EQ(flags.at("--port"), "4000");
  EXPECT_EQ(flags.at("--storage"), "/tmp/x");
}

TEST(ParseFlagsTest, RejectsUnknownFlag) {
  const char* argv[] = {"tessera-server", "--bogus", "1"};
  EXPECT_THROW(parse_flags(3, argv, ServerConfig::flags()), ConfigError);
}

TEST(ParseFlagsTest, RejectsMissingValue) {
  const char* argv[] = {"tessera-server", "--port"};
  EXPECT_THROW(parse_flags(2, argv, ServerConfig::flags()), ConfigError);
}

TEST(ParseFlagsTest, NoArgumentsGiveEmptyMap) {
  const char* argv[] = {"tessera-server"};
  EXPECT_TRUE(parse_flags(1, argv, ServerConfig::flags()).empty());
}

//==============================================
// SERVER CONFIGURATION
//==============================================

TEST(ServerConfigTest, DefaultsAreValid) {
  ServerConfig config;
  EXPECT_NO_THROW(config.validate());
  EXPECT_EQ(config.port, 3001);
  EXPECT_EQ(config.chunk_size, 64u * 1024);
  EXPECT_EQ(config.max_items_per_session, 20u);
  EXPECT_EQ(config.items_per_page, 5u);
}

TEST(ServerConfigTest, FlagsOverrideEnvironment) {
  const char* argv[] = {"tessera-server", "--port", "5000", "-m", "7"};
  const auto config = load_server_config(5, argv, env_of({
      {"TESSERA_PORT", "4000"},
      {"TESSERA_STORAGE", "/srv/tessera"},
      {"TESSERA_SESSION_TIMEOUT_MS", "1000"},
  }));

  EXPECT_EQ(config.port, 5000);
  EXPECT_EQ(config.storage_path, "/srv/tessera");
  EXPECT_EQ(config.max_items_per_session, 7u);
  EXPECT_EQ(config.session_timeout.count(), 1000);
}

TEST(ServerConfigTest, RejectsMalformedNumbers) {
  ServerConfig config;
  EXPECT_THROW(config.apply_environment(env_of({{"TESSERA_PORT", "abc"}})), ConfigError);
  EXPECT_THROW(config.apply_environment(env_of({{"TESSERA_PORT", "70000"}})), ConfigError);
  EXPECT_THROW(config.apply_environment(env_of({{"TESSERA_CHUNK_SIZE", "-1"}})), ConfigError);
}

TEST(ServerConfigTest, ValidateRejectsZeroLimits) {
  ServerConfig config;
  config.chunk_size = 0;
  EXPECT_THROW(config.validate(), ConfigError);

  config = ServerConfig{};
  config.max_items_per_session = 0;
  EXPECT_THROW(config.validate(), ConfigError);

  config = ServerConfig{};
  config.cleanup_interval = std::chrono::milliseconds(0);
  EXPECT_THROW(config.validate(), ConfigError);
}

TEST(ServerConfigTest, ChunkSizeMustFitInAFrame) {
  ServerConfig config;
  config.chunk_size = 32 * 1024 * 1024;
  EXPECT_THROW(config.validate(), ConfigError);

  config.chunk_size = tessera::network::Codec::MAX_FRAME_SIZE;
  EXPECT_THROW(config.validate(), ConfigError);

  config.chunk_size = tessera::network::Codec::MAX_CHUNK_SIZE;
  EXPECT_NO_THROW(config.validate());

  const char* argv[] = {"tessera-server", "--chunk-size", "33554432"};
  EXPECT_THROW(load_server_config(3, argv, empty_env()), ConfigError);
}

TEST(ServerConfigTest, ValidateRejectsUnknownLogLevel) {
  ServerConfig config;
  config.log_level = "chatty";
  EXPECT_THROW(config.validate(), ConfigError);
}

//==============================================
// CLIENT CONFIGURATION
//==============================================

TEST(ClientConfigTest, RequiresSessionAndPassphrase) {
  const char* argv[] = {"tessera"};
  EXPECT_THROW(load_client_config(1, argv, empty_env()), ConfigError);

  ClientConfig config = valid_client();
  EXPECT_NO_THROW(config.validate());
  config.passphrase.clear();
  EXPECT_THROW(config.validate(), ConfigError);
}

TEST(ClientConfigTest, RejectsInvalidSessionIds) {
  ClientConfig config = valid_client();
  config.session_id = "has space";
  EXPECT_THROW(config.validate(), ConfigError);
  config.session_id = "../escape";
  EXPECT_THROW(config.validate(), ConfigError);
  config.session_id = std::string(129, 'a');
  EXPECT_THROW(config.validate(), ConfigError);
  config.session_id = std::string(128, 'a');
  EXPECT_NO_THROW(config.validate());
}

TEST(ClientConfigTest, LoadsFromEnvironmentAndFlags) {
  const char* argv[] = {"tessera", "-S", "room", "--backend", "stream", "-n", "laptop"};
  const auto config = load_client_config(7, argv, env_of({
      {"TESSERA_PASSPHRASE", "hunter2"},
      {"TESSERA_HOST", "10.0.0.5"},
      {"TESSERA_KDF_ITERATIONS", "5000"},
      {"TESSERA_CACHE_BYTES", "1048576"},
  }));

  EXPECT_EQ(config.session_id, "room");
  EXPECT_EQ(config.passphrase, "hunter2");
  EXPECT_EQ(config.host, "10.0.0.5");
  EXPECT_EQ(config.crypto_backend, "stream");
  EXPECT_EQ(config.client_name, "laptop");
  EXPECT_EQ(config.kdf_iterations, 5000u);
  EXPECT_EQ(config.cache_max_bytes, 1048576u);
}

TEST(ClientConfigTest, RejectsUnknownBackend) {
  ClientConfig config = valid_client();
  config.crypto_backend = "rot13";
  EXPECT_THROW(config.validate(), ConfigError);
}

TEST(ClientConfigTest, RejectsUnorderedDelays) {
  ClientConfig config = valid_client();
  config.retry_base_delay = std::chrono::milliseconds(1000);
  config.retry_max_delay = std::chrono::milliseconds(10);
  EXPECT_THROW(config.validate(), ConfigError);

  config = valid_client();
  config.reconnect_min_delay = std::chrono::milliseconds(0);
  EXPECT_THROW(config.validate(), ConfigError);
}

TEST(ClientConfigTest, ChunkSizeMustFitInAFrame) {
  ClientConfig config = valid_client();
  config.chunk_size = 32 * 1024 * 1024;
  EXPECT_THROW(config.validate(), ConfigError);

  config.chunk_size = tessera::network::Codec::MAX_CHUNK_SIZE;
  EXPECT_NO_THROW(config.validate());

  config.chunk_size = 0;
  EXPECT_THROW(config.validate(), ConfigError);
}

TEST(ClientConfigTest, RejectsZeroSizes) {
  ClientConfig config = valid_client();
  config.cache_max_bytes = 0;
  EXPECT_THROW(config.validate(), ConfigError);

  config = valid_client();
  config.port = 0;
  EXPECT_THROW(config.validate(), ConfigError);
}
