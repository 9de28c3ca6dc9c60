#include "tessera/sync/server_bootstrap.hpp"
#include <boost/log/trivial.hpp>

namespace tessera {
namespace sync {

ServerBootstrap::ServerBootstrap(const config::ServerConfig& config)
  : config_(config) {
  config_.validate();

  try {
    db_ = std::make_unique<store::MetadataDb>(config_.storage_path, config_.db_pool_size);
    BOOST_LOG_TRIVIAL(debug) << "Server bootstrap: Metadata database opened at " << db_->path();

    store_ = std::make_unique<store::ChunkStore>(config_.storage_path, *db_, config_.chunk_size);
    sessions_ = std::make_unique<store::SessionRegistry>(*db_);
    coordinator_ = std::make_unique<SyncCoordinator>(*store_, *sessions_, config_);

    tcp_server_ = std::make_unique<network::TcpServer>(
        config_.host, config_.port,
        [this](std::shared_ptr<network::TcpConnection> connection) { coordinator_->attach(std::move(connection)); });

    BOOST_LOG_TRIVIAL(info) << "Server bootstrap: Successfully created all components";
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Server bootstrap: Failed to initialize components: " << e.what();
    throw;
  }
}

ServerBootstrap::~ServerBootstrap() {
  shutdown();
}

bool ServerBootstrap::start() {
  if (running_) {
    return true;
  }
  try {
    const auto report = store_->reconcile();
    BOOST_LOG_TRIVIAL(info) << "Server bootstrap: Reconcile removed " << report.removed_files << " files, "
                            << report.removed_directories << " directories, demoted "
                            << report.demoted_content << " items";
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Server bootstrap: Reconcile failed: " << e.what();
    return false;
  }

  coordinator_->start_housekeeping();
  if (!tcp_server_->start_listener()) {
    BOOST_LOG_TRIVIAL(error) << "Server bootstrap: Failed to start TCP server";
    coordinator_->stop();
    return false;
  }
  running_ = true;
  BOOST_LOG_TRIVIAL(info) << "Server bootstrap: Serving on " << config_.host << ":" << port();
  return true;
}

void ServerBootstrap::shutdown() {
  if (!running_) {
    return;
  }
  running_ = false;
  BOOST_LOG_TRIVIAL(info) << "Server bootstrap: Shutting down";

  // Stop accepting before the open connections are closed
  tcp_server_->shutdown();
  coordinator_->stop();
  BOOST_LOG_TRIVIAL(info) << "Server bootstrap: Shutdown complete";
}

} // namespace sync
} // namespace tessera
