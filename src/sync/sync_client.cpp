#include "tessera/sync/sync_client.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include "tessera/network/codec.hpp"
#include "tessera/network/network_error.hpp"

namespace tessera {
namespace sync {

using network::Message;
using network::MessageType;

namespace {

transfer::RetryPolicy retry_policy(const config::ClientConfig& config) {
  transfer::RetryPolicy policy;
  policy.max_attempts = config.retry_max_attempts;
  policy.base_delay = config.retry_base_delay;
  policy.max_delay = config.retry_max_delay;
  return policy;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SyncClient::SyncClient(const config::ClientConfig& config, const crypto::CryptoProvider& crypto,
                       cache::LocalChunkCache& cache)
  : config_(config),
  crypto_(crypto),
  cache_(cache),
  key_(crypto.derive_key(config.passphrase, config.session_id)),
  fingerprint_(crypto.fingerprint(config.passphrase)),
  tracker_(*this, cache, crypto, key_, config.session_id, config.chunk_size, retry_policy(config)) {
  BOOST_LOG_TRIVIAL(info) << "Sync client: Session " << config_.session_id << " using "
                          << crypto_.name() << " crypto";
}

SyncClient::~SyncClient() {
  disconnect();
}

//==============================================
// CONNECTION CONTROL
//==============================================

void SyncClient::connect() {
  reset_connection();

  auto socket = network::TcpConnection::dial(io_context_, config_.host, config_.port);
  auto connection = std::make_shared<network::TcpConnection>("server", socket);
  {
    std::lock_guard<std::mutex> lock(join_mutex_);
    join_result_.reset();
  }
  {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    connection_ = connection;
  }
  connection->start([this](const Message& message) { handle_message(message); },
                    [this]() { handle_closed(); });

  network::JoinRequest request;
  request.session_id = config_.session_id;
  request.fingerprint = fingerprint_;
  request.chunk_size = config_.chunk_size;
  request.client_name = config_.client_name;
  for (const auto& id : cache_.content_ids()) {
    if (request.cached_ids.size() >= network::Codec::MAX_LIST_SIZE) {
      break;
    }
    if (cache_.has_all(id)) {
      request.cached_ids.push_back(id);
    }
  }
  connection->send(Message::make(std::move(request)));

  std::optional<network::JoinResult> result;
  {
    std::unique_lock<std::mutex> lock(join_mutex_);
    join_cv_.wait_for(lock, JOIN_TIMEOUT, [this, &connection] {
      return join_result_.has_value() || !connection->is_open();
    });
    result = join_result_;
  }

  if (!result) {
    reset_connection();
    throw network::ConnectionError("no join result from " + config_.host);
  }
  if (!result->accepted) {
    reset_connection();
    BOOST_LOG_TRIVIAL(error) << "Sync client: Join refused (" << network::to_string(result->error)
                             << "): " << result->reason;
    if (result->error == network::ErrorCode::AUTHENTICATION) {
      throw AuthenticationError(result->reason);
    }
    throw ConfigurationError(result->reason);
  }

  client_id_ = result->client_id;
  joined_ = true;
  BOOST_LOG_TRIVIAL(info) << "Sync client: Joined session " << config_.session_id << " as " << client_id_
                          << " with " << result->members.size() << " members";

  tracker_.resume_uploads();
  tracker_.resume_downloads();
}

void SyncClient::start() {
  if (supervisor_.joinable()) {
    return;
  }
  stopping_ = false;
  supervisor_ = std::thread(&SyncClient::supervise, this);
}

void SyncClient::disconnect() {
  {
    std::lock_guard<std::mutex> lock(supervisor_mutex_);
    stopping_ = true;
  }
  supervisor_cv_.notify_all();
  if (supervisor_.joinable()) {
    supervisor_.join();
  }
  reset_connection();
}

std::chrono::milliseconds SyncClient::reconnect_delay(uint32_t attempt) const {
  std::chrono::milliseconds delay = config_.reconnect_min_delay;
  for (uint32_t i = 1; i < attempt && delay < config_.reconnect_max_delay; ++i) {
    delay *= 2;
  }
  return std::min(delay, config_.reconnect_max_delay);
}

//==============================================
// CONTENT OPERATIONS
//==============================================

std::string SyncClient::send_content(const std::vector<uint8_t>& plaintext, const std::string& content_type,
                                     const std::string& name) {
  const std::string content_id = tracker_.start_upload(plaintext, content_type, name);
  if (joined_) {
    tracker_.pump_upload(content_id);
  } else {
    BOOST_LOG_TRIVIAL(info) << "Sync client: Offline, upload " << content_id << " starts after reconnect";
  }
  return content_id;
}

bool SyncClient::remove_content(const std::string& content_id) {
  return send(Message::make(network::RemoveContent{content_id}));
}

bool SyncClient::clear_all() {
  return send(Message::make(network::ClearAll{config_.session_id}));
}

bool SyncClient::list_content(uint32_t offset, uint32_t limit) {
  return send(Message::make(network::ListContent{offset, limit}));
}

bool SyncClient::rename_content(const std::string& content_id, const std::string& name) {
  return send(Message::make(network::RenameContent{content_id, name}));
}

bool SyncClient::pin_content(const std::string& content_id, bool pinned) {
  return send(Message::make(network::PinContent{content_id, pinned}));
}

bool SyncClient::request_health() {
  return send(Message::make(network::HealthCheck{}));
}

//==============================================
// CHUNK TRANSPORT
//==============================================

bool SyncClient::send_chunk(const network::ChunkMessage& chunk) {
  return send(Message::make(chunk));
}

bool SyncClient::request_chunk(const std::string& content_id, uint32_t index) {
  return send(Message::make(network::RequestChunk{content_id, index}));
}

//==============================================
// GETTERS AND SETTERS
//==============================================

void SyncClient::set_event_handler(EventHandler handler) {
  std::lock_guard<std::mutex> lock(handler_mutex_);
  on_event_ = std::move(handler);
}

//==============================================
// MESSAGE HANDLING
//==============================================

void SyncClient::handle_message(const Message& message) {
  switch (message.type) {
    case MessageType::JOIN_RESULT: {
      std::lock_guard<std::mutex> lock(join_mutex_);
      join_result_ = message.as<network::JoinResult>();
      join_cv_.notify_all();
      break;
    }
    case MessageType::CHUNK_ACK: {
      const auto& ack = message.as<network::ChunkAck>();
      tracker_.on_chunk_ack(ack.content_id, ack.index);
      break;
    }
    case MessageType::CHUNK_ERROR: {
      const auto& error = message.as<network::ChunkErrorMessage>();
      tracker_.on_chunk_rejected(error.content_id, error.index, error.code, error.reason);
      break;
    }
    case MessageType::CHUNK:
      tracker_.on_chunk(message.as<network::ChunkMessage>());
      break;
    case MessageType::CONTENT_AVAILABLE:
      tracker_.on_content_available(message.as<network::ContentAvailable>().info);
      break;
    case MessageType::CONTENT_REMOVED:
      tracker_.on_content_removed(message.as<network::ContentRemoved>().content_id);
      break;
    case MessageType::SESSION_CLEARED:
      tracker_.cancel_downloads("session cleared");
      cache_.clear();
      break;
    case MessageType::SESSION_EXPIRED: {
      BOOST_LOG_TRIVIAL(warning) << "Sync client: Session " << config_.session_id << " expired on the server";
      tracker_.cancel_downloads("session expired");
      cache_.clear();
      joined_ = false;
      std::lock_guard<std::mutex> lock(connection_mutex_);
      if (connection_) {
        connection_->close();
      }
      break;
    }
    case MessageType::ERROR: {
      const auto& error = message.as<network::ErrorMessage>();
      BOOST_LOG_TRIVIAL(warning) << "Sync client: Server error (" << network::to_string(error.code)
                                 << "): " << error.reason;
      break;
    }
    default:
      break;
  }
  emit(message);
}

void SyncClient::handle_closed() {
  const bool was_joined = joined_.exchange(false);
  {
    std::lock_guard<std::mutex> lock(join_mutex_);
    join_cv_.notify_all();
  }
  if (was_joined) {
    BOOST_LOG_TRIVIAL(warning) << "Sync client: Connection to " << config_.host << ":" << config_.port << " lost";
  }
  supervisor_cv_.notify_all();
}

bool SyncClient::send(const Message& message) {
  std::shared_ptr<network::TcpConnection> connection;
  {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    connection = connection_;
  }
  if (!connection || !joined_) {
    BOOST_LOG_TRIVIAL(debug) << "Sync client: Not connected, dropping " << to_string(message.type);
    return false;
  }
  return connection->send(message);
}

void SyncClient::emit(const Message& message) {
  EventHandler handler;
  {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler = on_event_;
  }
  if (handler) {
    handler(message);
  }
}

//==============================================
// SUPERVISOR
//==============================================

void SyncClient::supervise() {
  using Clock = std::chrono::steady_clock;
  uint32_t attempt = 0;
  uint64_t nonce = 0;
  auto next_attempt = Clock::now();
  auto next_ping = Clock::now() + config_.heartbeat_interval;

  while (!stopping_) {
    {
      std::unique_lock<std::mutex> lock(supervisor_mutex_);
      supervisor_cv_.wait_for(lock, TICK, [this] { return stopping_.load(); });
    }
    if (stopping_) {
      break;
    }

    const auto now = Clock::now();
    if (joined_) {
      attempt = 0;
      tracker_.check_timeouts(now);
      if (now >= next_ping) {
        send(Message::make(network::Ping{++nonce}));
        next_ping = now + config_.heartbeat_interval;
      }
      continue;
    }
    if (fatal_ || now < next_attempt) {
      continue;
    }

    try {
      connect();
      attempt = 0;
      next_ping = Clock::now() + config_.heartbeat_interval;
    } catch (const AuthenticationError& e) {
      BOOST_LOG_TRIVIAL(error) << "Sync client: Giving up reconnecting: " << e.what();
      fatal_ = true;
    } catch (const ConfigurationError& e) {
      BOOST_LOG_TRIVIAL(error) << "Sync client: Giving up reconnecting: " << e.what();
      fatal_ = true;
    } catch (const network::NetworkError& e) {
      ++attempt;
      const auto delay = reconnect_delay(attempt);
      next_attempt = Clock::now() + delay;
      BOOST_LOG_TRIVIAL(info) << "Sync client: Reconnect attempt " << attempt << " failed, next in "
                              << delay.count() << " ms: " << e.what();
    }
  }
}

void SyncClient::reset_connection() {
  std::shared_ptr<network::TcpConnection> connection;
  {
    std::lock_guard<std::mutex> lock(connection_mutex_);
    connection.swap(connection_);
  }
  joined_ = false;
  if (connection) {
    connection->stop();
  }
}

} // namespace sync
} // namespace tessera
