#pragma once

#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "tessera/cache/local_chunk_cache.hpp"
#include "tessera/config/config.hpp"
#include "tessera/crypto/crypto_provider.hpp"
#include "tessera/network/tcp_connection.hpp"
#include "tessera/sync/sync_error.hpp"
#include "tessera/transfer/chunk_transport.hpp"
#include "tessera/transfer/transfer_tracker.hpp"

namespace tessera {
namespace sync {

/**
 * Client side of a session.
 *
 * Derives the session key and fingerprint from the passphrase, joins over a
 * TcpConnection and routes server messages into the transfer tracker. A
 * supervisor thread drives retry timeouts and heartbeats, and reconnects with
 * exponential backoff after the connection drops, resuming unfinished
 * transfers once joined again.
 */
class SyncClient : public transfer::ChunkTransport {
public:
  // Receives every server message after internal handling
  using EventHandler = std::function<void(const network::Message& message)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  SyncClient(const config::ClientConfig& config, const crypto::CryptoProvider& crypto,
             cache::LocalChunkCache& cache);
  ~SyncClient() override;

  SyncClient(const SyncClient&) = delete;
  SyncClient& operator=(const SyncClient&) = delete;


  // ---- CONNECTION CONTROL ----
  // Connects and joins. Throws AuthenticationError or ConfigurationError when
  // the server refuses, network::ConnectionError when it cannot be reached.
  void connect();
  // Starts the supervisor thread (timeouts, heartbeats, reconnects)
  void start();
  void disconnect();
  bool is_connected() const { return joined_; }


  // ---- CONTENT OPERATIONS ----
  // Encrypts, registers and starts uploading. Returns the content id.
  std::string send_content(const std::vector<uint8_t>& plaintext, const std::string& content_type,
                           const std::string& name);
  bool remove_content(const std::string& content_id);
  bool clear_all();
  bool list_content(uint32_t offset, uint32_t limit);
  bool rename_content(const std::string& content_id, const std::string& name);
  bool pin_content(const std::string& content_id, bool pinned);
  bool request_health();
  bool cancel(const std::string& content_id) { return tracker_.cancel(content_id); }


  // ---- CHUNK TRANSPORT ----
  bool send_chunk(const network::ChunkMessage& chunk) override;
  bool request_chunk(const std::string& content_id, uint32_t index) override;


  // ---- GETTERS AND SETTERS ----
  transfer::TransferTracker& tracker() { return tracker_; }
  void set_event_handler(EventHandler handler);
  const std::string& client_id() const { return client_id_; }
  // Delay before reconnect attempt number `attempt` (1 based)
  std::chrono::milliseconds reconnect_delay(uint32_t attempt) const;

private:
  static constexpr std::chrono::milliseconds TICK{250};
  static constexpr std::chrono::milliseconds JOIN_TIMEOUT{10000};

  // ---- PARAMETERS ----
  const config::ClientConfig config_;
  const crypto::CryptoProvider& crypto_;
  cache::LocalChunkCache& cache_;
  const crypto::SessionKey key_;
  const std::vector<uint8_t> fingerprint_;
  transfer::TransferTracker tracker_;

  boost::asio::io_context io_context_;
  mutable std::mutex connection_mutex_;
  std::shared_ptr<network::TcpConnection> connection_;
  std::string client_id_;

  std::mutex join_mutex_;
  std::condition_variable join_cv_;
  std::optional<network::JoinResult> join_result_;
  std::atomic<bool> joined_{false};

  std::mutex supervisor_mutex_;
  std::condition_variable supervisor_cv_;
  std::thread supervisor_;
  std::atomic<bool> stopping_{false};
  std::atomic<bool> fatal_{false};

  std::mutex handler_mutex_;
  EventHandler on_event_;


  // ---- MESSAGE HANDLING ----
  void handle_message(const network::Message& message);
  void handle_closed();
  bool send(const network::Message& message);
  void emit(const network::Message& message);


  // ---- SUPERVISOR ----
  void supervise();
  // Drops the current connection, must not run on a connection thread
  void reset_connection();
};

} // namespace sync
} // namespace tessera
