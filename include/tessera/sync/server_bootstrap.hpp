#pragma once

#include <memory>
#include "tessera/config/config.hpp"
#include "tessera/network/tcp_server.hpp"
#include "tessera/store/chunk_store.hpp"
#include "tessera/store/metadata_db.hpp"
#include "tessera/store/session_registry.hpp"
#include "tessera/sync/sync_coordinator.hpp"

namespace tessera {
namespace sync {

// Wires the server components together and owns their lifetime
class ServerBootstrap {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ServerBootstrap(const config::ServerConfig& config);
  ~ServerBootstrap();

  // ---- INITIALIZATION AND DESTRUCTION METHODS ----
  // Reconciles storage, starts housekeeping and the listener
  bool start();
  void shutdown();


  // ---- GETTERS AND SETTERS ----
  store::ChunkStore& get_store() { return *store_; }
  store::SessionRegistry& get_sessions() { return *sessions_; }
  SyncCoordinator& get_coordinator() { return *coordinator_; }
  uint16_t port() const { return tcp_server_->local_port(); }

private:
  // ---- PARAMETERS ----
  config::ServerConfig config_;
  bool running_ = false;

  // System components
  std::unique_ptr<store::MetadataDb> db_;
  std::unique_ptr<store::ChunkStore> store_;
  std::unique_ptr<store::SessionRegistry> sessions_;
  std::unique_ptr<SyncCoordinator> coordinator_;
  std::unique_ptr<network::TcpServer> tcp_server_;
};

} // namespace sync
} // namespace tessera
