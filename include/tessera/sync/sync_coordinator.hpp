#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "tessera/config/config.hpp"
#include "tessera/network/message.hpp"
#include "tessera/network/peer.hpp"
#include "tessera/network/tcp_connection.hpp"
#include "tessera/store/chunk_store.hpp"
#include "tessera/store/session_registry.hpp"
#include "tessera/sync/sync_error.hpp"

namespace tessera {
namespace sync {

/**
 * Server side session membership and message routing.
 *
 * Messages of one connection are handled in arrival order on that
 * connection's dispatch thread; different connections run concurrently and
 * only meet in the chunk store's per-content locks. Broadcasts about a
 * content id are sent only after the store operation behind them committed.
 */
class SyncCoordinator {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  SyncCoordinator(store::ChunkStore& store, store::SessionRegistry& sessions,
                  const config::ServerConfig& config);
  ~SyncCoordinator();

  SyncCoordinator(const SyncCoordinator&) = delete;
  SyncCoordinator& operator=(const SyncCoordinator&) = delete;


  // ---- CONNECTION LIFECYCLE ----
  // Registers and starts an accepted connection
  void attach(std::shared_ptr<network::TcpConnection> connection);
  // Registers a peer whose messages are fed through handle_message
  void add_peer(std::shared_ptr<network::Peer> peer);
  void handle_message(const std::string& peer_id, const network::Message& message);
  void handle_disconnect(const std::string& peer_id);


  // ---- SESSION OPERATIONS ----
  // Admits the peer. Throws ConfigurationError or AuthenticationError.
  void join(const std::string& peer_id, const network::JoinRequest& request);


  // ---- HOUSEKEEPING ----
  void start_housekeeping();
  // One sweep: session expiry, stale pending content, stale heartbeats
  void run_housekeeping();
  // Stops housekeeping and closes every peer
  void stop();


  // ---- QUERIES ----
  std::vector<std::string> members(const std::string& session_id) const;
  std::size_t peer_count() const;
  bool is_joined(const std::string& peer_id) const;

private:
  using Clock = std::chrono::steady_clock;

  struct Member {
    std::shared_ptr<network::Peer> peer;
    std::string session_id;     // empty until admitted
    std::string client_name;
    Clock::time_point last_seen;
  };

  // ---- PARAMETERS ----
  store::ChunkStore& store_;
  store::SessionRegistry& sessions_;
  const config::ServerConfig config_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Member> members_;
  // Disconnected peers, destroyed outside their own threads
  std::vector<std::shared_ptr<network::Peer>> retired_;

  std::mutex housekeeping_mutex_;
  std::condition_variable housekeeping_cv_;
  std::thread housekeeping_thread_;
  std::atomic<bool> stopping_{false};


  // ---- MESSAGE HANDLERS ----
  void handle_join(const std::string& peer_id, const network::JoinRequest& request);
  void handle_chunk(const std::string& peer_id, const std::string& session_id,
                    const network::ChunkMessage& chunk);
  void handle_request_chunk(const std::string& peer_id, const std::string& session_id,
                            const network::RequestChunk& request);
  void handle_remove(const std::string& peer_id, const std::string& session_id,
                     const network::RemoveContent& request);
  void handle_clear_all(const std::string& peer_id, const std::string& session_id,
                        const network::ClearAll& request);
  void handle_list(const std::string& peer_id, const std::string& session_id,
                   const network::ListContent& request);
  void handle_rename(const std::string& peer_id, const std::string& session_id,
                     const network::RenameContent& request);
  void handle_pin(const std::string& peer_id, const std::string& session_id,
                  const network::PinContent& request);
  void handle_health(const std::string& peer_id);


  // ---- MESSAGE DELIVERY ----
  bool send_to(const std::string& peer_id, const network::Message& message);
  // Sends to every admitted member of the session except `exclude`
  void broadcast(const std::string& session_id, const network::Message& message,
                 const std::string& exclude = "");
  void send_error(const std::string& peer_id, network::ErrorCode code, const std::string& reason);


  // ---- HELPERS ----
  std::string session_of(const std::string& peer_id) const;
  // Finalized metadata owned by the session, nullopt otherwise
  std::optional<store::ContentMetadata> owned_content(const std::string& session_id,
                                                      const std::string& content_id);
  // Sends a page plus content-available notices for items the peer lacks
  void send_page(const std::string& peer_id, const std::string& session_id, uint32_t offset,
                 uint32_t limit, const std::vector<std::string>& cached_ids);
  // Deletes all content of the session. On a storage failure the items
  // already deleted are broadcast as content-removed before rethrowing.
  std::vector<std::string> delete_session_content(const std::string& session_id);
  void expire_session(const std::string& session_id);
  void housekeeping_loop();
  void release_retired();
};

// Wire representation of stored metadata
network::ContentInfo to_content_info(const store::ContentMetadata& meta);

} // namespace sync
} // namespace tessera
