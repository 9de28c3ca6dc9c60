#include "tessera/sync/sync_coordinator.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <set>
#include "tessera/crypto/crypto_provider.hpp"
#include "tessera/crypto/digest.hpp"

namespace tessera {
namespace sync {

using network::ErrorCode;
using network::Message;
using network::MessageType;

namespace {
constexpr uint32_t MAX_PAGE_LIMIT = 100;
constexpr std::size_t MAX_NAME_LENGTH = 255;
}

network::ContentInfo to_content_info(const store::ContentMetadata& meta) {
  network::ContentInfo info;
  info.content_id = meta.id;
  info.content_type = meta.content_type;
  info.name = meta.name;
  info.total_chunks = meta.total_chunks;
  info.total_size = meta.total_size;
  info.iv = meta.iv;
  info.created_at = meta.created_at;
  info.pinned = meta.pinned;
  return info;
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SyncCoordinator::SyncCoordinator(store::ChunkStore& store, store::SessionRegistry& sessions,
                                 const config::ServerConfig& config)
  : store_(store),
  sessions_(sessions),
  config_(config) {
  BOOST_LOG_TRIVIAL(info) << "Sync coordinator: Initialized with chunk size " << config_.chunk_size
                          << ", " << config_.max_items_per_session << " items per session";
}

SyncCoordinator::~SyncCoordinator() {
  stop();
}

//==============================================
// CONNECTION LIFECYCLE
//==============================================

void SyncCoordinator::attach(std::shared_ptr<network::TcpConnection> connection) {
  const std::string id = connection->id();
  add_peer(connection);
  const bool started = connection->start(
      [this, id](const Message& message) { handle_message(id, message); },
      [this, id]() { handle_disconnect(id); });
  if (!started) {
    BOOST_LOG_TRIVIAL(error) << "Sync coordinator: Failed to start connection " << id;
    handle_disconnect(id);
  }
}

void SyncCoordinator::add_peer(std::shared_ptr<network::Peer> peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string id = peer->id();
  members_[id] = Member{std::move(peer), "", "", Clock::now()};
  BOOST_LOG_TRIVIAL(debug) << "Sync coordinator: Registered peer " << id << ", " << members_.size() << " connected";
}

void SyncCoordinator::handle_message(const std::string& peer_id, const Message& message) {
  std::string session_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(peer_id);
    if (it == members_.end()) {
      BOOST_LOG_TRIVIAL(debug) << "Sync coordinator: Message from unknown peer " << peer_id;
      return;
    }
    it->second.last_seen = Clock::now();
    session_id = it->second.session_id;
  }

  BOOST_LOG_TRIVIAL(trace) << "Sync coordinator: " << to_string(message.type) << " from " << peer_id;

  try {
    switch (message.type) {
      case MessageType::JOIN:
        handle_join(peer_id, message.as<network::JoinRequest>());
        return;
      case MessageType::HEALTH:
        handle_health(peer_id);
        return;
      case MessageType::PING:
        if (!session_id.empty()) {
          sessions_.touch(session_id);
        }
        send_to(peer_id, Message::make(network::Pong{message.as<network::Ping>().nonce}));
        return;
      case MessageType::PONG:
        return;
      default:
        break;
    }

    if (session_id.empty()) {
      send_error(peer_id, ErrorCode::PROTOCOL, "join required before " + to_string(message.type));
      return;
    }

    switch (message.type) {
      case MessageType::CHUNK:
        handle_chunk(peer_id, session_id, message.as<network::ChunkMessage>());
        break;
      case MessageType::REQUEST_CHUNK:
        handle_request_chunk(peer_id, session_id, message.as<network::RequestChunk>());
        break;
      case MessageType::REMOVE_CONTENT:
        handle_remove(peer_id, session_id, message.as<network::RemoveContent>());
        break;
      case MessageType::CLEAR_ALL:
        handle_clear_all(peer_id, session_id, message.as<network::ClearAll>());
        break;
      case MessageType::LIST_CONTENT:
        handle_list(peer_id, session_id, message.as<network::ListContent>());
        break;
      case MessageType::RENAME_CONTENT:
        handle_rename(peer_id, session_id, message.as<network::RenameContent>());
        break;
      case MessageType::PIN_CONTENT:
        handle_pin(peer_id, session_id, message.as<network::PinContent>());
        break;
      default:
        BOOST_LOG_TRIVIAL(warning) << "Sync coordinator: Unexpected " << to_string(message.type)
                                   << " from " << peer_id;
        send_error(peer_id, ErrorCode::PROTOCOL, "unexpected message " + to_string(message.type));
        break;
    }
  } catch (const store::NotFoundError& e) {
    send_error(peer_id, ErrorCode::NOT_FOUND, e.what());
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Sync coordinator: Storage failure on " << to_string(message.type)
                             << " from " << peer_id << ": " << e.what();
    send_error(peer_id, ErrorCode::STORAGE, e.what());
  }
}

void SyncCoordinator::handle_disconnect(const std::string& peer_id) {
  Member member;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(peer_id);
    if (it == members_.end()) {
      return;
    }
    member = std::move(it->second);
    members_.erase(it);
    retired_.push_back(member.peer);
  }

  BOOST_LOG_TRIVIAL(info) << "Sync coordinator: Peer " << peer_id << " disconnected";
  if (!member.session_id.empty()) {
    broadcast(member.session_id, Message::make(network::ClientLeft{peer_id, member.client_name}));
    try {
      sessions_.touch(member.session_id);
    } catch (const store::StoreError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Sync coordinator: Cannot touch session " << member.session_id
                                 << ": " << e.what();
    }
  }
}

//==============================================
// SESSION OPERATIONS
//==============================================

void SyncCoordinator::join(const std::string& peer_id, const network::JoinRequest& request) {
  if (!store::is_valid_identifier(request.session_id)) {
    throw ConfigurationError("malformed session id");
  }
  if (request.chunk_size != config_.chunk_size) {
    throw ConfigurationError("chunk size " + std::to_string(request.chunk_size) +
                             " does not match server chunk size " + std::to_string(config_.chunk_size));
  }
  if (request.fingerprint.size() != crypto::CryptoProvider::FINGERPRINT_SIZE) {
    throw AuthenticationError("malformed fingerprint");
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(peer_id);
    if (it == members_.end()) {
      throw SyncError("unknown peer " + peer_id);
    }
    if (!it->second.session_id.empty()) {
      throw ConfigurationError("already joined session " + it->second.session_id);
    }
  }

  if (!sessions_.verify_or_create(request.session_id, request.fingerprint)) {
    throw AuthenticationError("fingerprint mismatch for session " + request.session_id);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = members_.find(peer_id);
  if (it == members_.end()) {
    throw SyncError("peer " + peer_id + " left during join");
  }
  it->second.session_id = request.session_id;
  it->second.client_name = request.client_name;
}

void SyncCoordinator::handle_join(const std::string& peer_id, const network::JoinRequest& request) {
  network::JoinResult result;
  result.client_id = peer_id;
  try {
    join(peer_id, request);
    result.accepted = true;
  } catch (const AuthenticationError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Sync coordinator: Rejected " << peer_id << ": " << e.what();
    result.error = ErrorCode::AUTHENTICATION;
    result.reason = e.what();
  } catch (const ConfigurationError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Sync coordinator: Rejected " << peer_id << ": " << e.what();
    result.error = ErrorCode::CONFIGURATION;
    result.reason = e.what();
  } catch (const SyncError& e) {
    result.error = ErrorCode::PROTOCOL;
    result.reason = e.what();
  }

  if (!result.accepted) {
    send_to(peer_id, Message::make(std::move(result)));
    return;
  }

  result.members = members(request.session_id);
  send_to(peer_id, Message::make(std::move(result)));
  BOOST_LOG_TRIVIAL(info) << "Sync coordinator: " << peer_id << " (" << request.client_name
                          << ") joined session " << request.session_id;

  broadcast(request.session_id, Message::make(network::ClientJoined{peer_id, request.client_name}), peer_id);
  send_page(peer_id, request.session_id, 0, config_.items_per_page, request.cached_ids);
}

//==============================================
// MESSAGE HANDLERS
//==============================================

void SyncCoordinator::handle_chunk(const std::string& peer_id, const std::string& session_id,
                                   const network::ChunkMessage& chunk) {
  store::ChunkUpload upload;
  upload.content_id = chunk.content_id;
  upload.index = chunk.index;
  upload.total_chunks = chunk.total_chunks;
  upload.total_size = chunk.total_size;
  upload.iv = chunk.iv;
  upload.content_type = chunk.content_type;
  upload.name = chunk.name;
  upload.data = chunk.data;
  upload.checksum = chunk.checksum;

  store::PutResult result;
  try {
    // Announced under the content lock, so a concurrent removal is always announced after it
    result = store_.put_chunk(session_id, upload, [&](const store::ContentMetadata& meta) {
      BOOST_LOG_TRIVIAL(info) << "Sync coordinator: Content " << meta.id << " finalized in session "
                              << session_id;
      broadcast(session_id, Message::make(network::ContentAvailable{to_content_info(meta)}), peer_id);
    });
  } catch (const store::ChunkConflictError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Sync coordinator: Conflict on " << chunk.content_id << "/" << chunk.index
                               << " from " << peer_id;
    send_to(peer_id, Message::make(network::ChunkErrorMessage{chunk.content_id, chunk.index,
                                                              ErrorCode::CHUNK_CONFLICT, e.what()}));
    return;
  } catch (const store::InvalidChunkError& e) {
    send_to(peer_id, Message::make(network::ChunkErrorMessage{chunk.content_id, chunk.index,
                                                              ErrorCode::INVALID_CHUNK, e.what()}));
    return;
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Sync coordinator: Storing " << chunk.content_id << "/" << chunk.index
                             << " failed: " << e.what();
    send_to(peer_id, Message::make(network::ChunkErrorMessage{chunk.content_id, chunk.index,
                                                              ErrorCode::STORAGE, e.what()}));
    return;
  }

  send_to(peer_id, Message::make(network::ChunkAck{chunk.content_id, chunk.index, result.duplicate}));
  if (!result.finalized) {
    return;
  }

  sessions_.touch(session_id);
  for (const auto& removed : store_.enforce_retention(session_id, config_.max_items_per_session)) {
    broadcast(session_id, Message::make(network::ContentRemoved{removed.id}));
  }
}

void SyncCoordinator::handle_request_chunk(const std::string& peer_id, const std::string& session_id,
                                           const network::RequestChunk& request) {
  auto meta = owned_content(session_id, request.content_id);
  if (!meta) {
    send_to(peer_id, Message::make(network::ChunkErrorMessage{request.content_id, request.index,
                                                              ErrorCode::NOT_FOUND, "content not available"}));
    return;
  }

  store::StoredChunk stored;
  try {
    stored = store_.get_chunk(request.content_id, request.index);
  } catch (const store::NotFoundError& e) {
    send_to(peer_id, Message::make(network::ChunkErrorMessage{request.content_id, request.index,
                                                              ErrorCode::NOT_FOUND, e.what()}));
    return;
  }

  network::ChunkMessage chunk;
  chunk.content_id = meta->id;
  chunk.index = stored.index;
  chunk.total_chunks = meta->total_chunks;
  chunk.total_size = meta->total_size;
  chunk.iv = meta->iv;
  chunk.content_type = meta->content_type;
  chunk.name = meta->name;
  chunk.data = std::move(stored.data);
  chunk.checksum = stored.checksum.empty() ? crypto::sha256(chunk.data) : std::move(stored.checksum);
  send_to(peer_id, Message::make(std::move(chunk)));
}

void SyncCoordinator::handle_remove(const std::string& peer_id, const std::string& session_id,
                                    const network::RemoveContent& request) {
  auto meta = store_.find_metadata(request.content_id);
  if (meta && meta->session_id != session_id) {
    send_error(peer_id, ErrorCode::NOT_FOUND, "content " + request.content_id);
    return;
  }

  if (meta && store_.delete_content(request.content_id)) {
    sessions_.touch(session_id);
    broadcast(session_id, Message::make(network::ContentRemoved{request.content_id}));
  } else {
    // Already gone, confirm to the requester only
    send_to(peer_id, Message::make(network::ContentRemoved{request.content_id}));
  }
}

void SyncCoordinator::handle_clear_all(const std::string& peer_id, const std::string& session_id,
                                       const network::ClearAll& request) {
  if (request.session_id != session_id) {
    send_error(peer_id, ErrorCode::PROTOCOL, "cannot clear another session");
    return;
  }

  const auto removed = delete_session_content(session_id);
  sessions_.touch(session_id);
  BOOST_LOG_TRIVIAL(info) << "Sync coordinator: Session " << session_id << " cleared by " << peer_id
                          << ", " << removed.size() << " items removed";
  broadcast(session_id, Message::make(network::SessionCleared{session_id}));
}

void SyncCoordinator::handle_list(const std::string& peer_id, const std::string& session_id,
                                  const network::ListContent& request) {
  uint32_t limit = request.limit == 0 ? config_.items_per_page : request.limit;
  limit = std::min(limit, MAX_PAGE_LIMIT);
  send_page(peer_id, session_id, request.offset, limit, {});
}

void SyncCoordinator::handle_rename(const std::string& peer_id, const std::string& session_id,
                                    const network::RenameContent& request) {
  if (request.name.size() > MAX_NAME_LENGTH) {
    send_error(peer_id, ErrorCode::PROTOCOL, "name longer than " + std::to_string(MAX_NAME_LENGTH) + " bytes");
    return;
  }
  if (!owned_content(session_id, request.content_id)) {
    send_error(peer_id, ErrorCode::NOT_FOUND, "content " + request.content_id);
    return;
  }
  store_.rename_content(request.content_id, request.name);
  if (auto meta = owned_content(session_id, request.content_id)) {
    broadcast(session_id, Message::make(network::ContentUpdated{to_content_info(*meta)}));
  }
}

void SyncCoordinator::handle_pin(const std::string& peer_id, const std::string& session_id,
                                 const network::PinContent& request) {
  if (!owned_content(session_id, request.content_id)) {
    send_error(peer_id, ErrorCode::NOT_FOUND, "content " + request.content_id);
    return;
  }
  store_.set_pinned(request.content_id, request.pinned);
  if (auto meta = owned_content(session_id, request.content_id)) {
    broadcast(session_id, Message::make(network::ContentUpdated{to_content_info(*meta)}));
  }
}

void SyncCoordinator::handle_health(const std::string& peer_id) {
  const bool healthy = store_.healthy();
  send_to(peer_id, Message::make(network::HealthStatus{healthy, healthy ? "ok" : "storage unavailable"}));
}

//==============================================
// MESSAGE DELIVERY
//==============================================

bool SyncCoordinator::send_to(const std::string& peer_id, const Message& message) {
  std::shared_ptr<network::Peer> peer;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(peer_id);
    if (it == members_.end()) {
      return false;
    }
    peer = it->second.peer;
  }
  return peer->send(message);
}

void SyncCoordinator::broadcast(const std::string& session_id, const Message& message,
                                const std::string& exclude) {
  std::vector<std::shared_ptr<network::Peer>> recipients;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, member] : members_) {
      if (member.session_id == session_id && id != exclude) {
        recipients.push_back(member.peer);
      }
    }
  }
  BOOST_LOG_TRIVIAL(debug) << "Sync coordinator: Broadcasting " << to_string(message.type) << " to "
                           << recipients.size() << " members of " << session_id;
  for (const auto& peer : recipients) {
    peer->send(message);
  }
}

void SyncCoordinator::send_error(const std::string& peer_id, ErrorCode code, const std::string& reason) {
  BOOST_LOG_TRIVIAL(debug) << "Sync coordinator: Error " << to_string(code) << " to " << peer_id << ": " << reason;
  send_to(peer_id, Message::make(network::ErrorMessage{code, reason}));
}

//==============================================
// HELPERS
//==============================================

std::string SyncCoordinator::session_of(const std::string& peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = members_.find(peer_id);
  return it == members_.end() ? std::string() : it->second.session_id;
}

std::optional<store::ContentMetadata> SyncCoordinator::owned_content(const std::string& session_id,
                                                                     const std::string& content_id) {
  auto meta = store_.find_metadata(content_id);
  if (!meta || meta->session_id != session_id || !meta->complete) {
    return std::nullopt;
  }
  return meta;
}

void SyncCoordinator::send_page(const std::string& peer_id, const std::string& session_id, uint32_t offset,
                                uint32_t limit, const std::vector<std::string>& cached_ids) {
  const auto page = store_.list_content(session_id, offset, limit);
  const std::set<std::string> cached(cached_ids.begin(), cached_ids.end());

  network::ContentPage reply;
  reply.total = page.total;
  reply.offset = page.offset;
  for (const auto& meta : page.items) {
    auto info = to_content_info(meta);
    if (!cached.count(meta.id)) {
      send_to(peer_id, Message::make(network::ContentAvailable{info}));
    }
    reply.items.push_back(std::move(info));
  }
  send_to(peer_id, Message::make(std::move(reply)));
}

std::vector<std::string> SyncCoordinator::members(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> result;
  for (const auto& [id, member] : members_) {
    if (member.session_id == session_id) {
      result.push_back(member.client_name.empty() ? id : member.client_name + "#" + id);
    }
  }
  std::sort(result.begin(), result.end());
  return result;
}

std::size_t SyncCoordinator::peer_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return members_.size();
}

bool SyncCoordinator::is_joined(const std::string& peer_id) const {
  return !session_of(peer_id).empty();
}

//==============================================
// HOUSEKEEPING
//==============================================

void SyncCoordinator::start_housekeeping() {
  if (housekeeping_thread_.joinable()) {
    return;
  }
  stopping_ = false;
  housekeeping_thread_ = std::thread(&SyncCoordinator::housekeeping_loop, this);
  BOOST_LOG_TRIVIAL(info) << "Sync coordinator: Housekeeping every " << config_.cleanup_interval.count() << " ms";
}

void SyncCoordinator::housekeeping_loop() {
  while (!stopping_) {
    {
      std::unique_lock<std::mutex> lock(housekeeping_mutex_);
      housekeeping_cv_.wait_for(lock, config_.cleanup_interval, [this] { return stopping_.load(); });
    }
    if (stopping_) {
      break;
    }
    run_housekeeping();
  }
}

void SyncCoordinator::run_housekeeping() {
  try {
    for (const auto& record : sessions_.expired(config_.session_timeout)) {
      expire_session(record.id);
    }
    const auto stale = store_.collect_stale_pending(config_.pending_timeout);
    if (!stale.empty()) {
      BOOST_LOG_TRIVIAL(info) << "Sync coordinator: Collected " << stale.size() << " stale pending items";
    }
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Sync coordinator: Housekeeping storage failure: " << e.what();
  }

  std::vector<std::shared_ptr<network::Peer>> silent;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto cutoff = Clock::now() - config_.heartbeat_timeout;
    for (const auto& [id, member] : members_) {
      if (member.last_seen < cutoff) {
        silent.push_back(member.peer);
      }
    }
  }
  for (const auto& peer : silent) {
    BOOST_LOG_TRIVIAL(info) << "Sync coordinator: Dropping silent peer " << peer->id();
    peer->close();
  }

  release_retired();
}

std::vector<std::string> SyncCoordinator::delete_session_content(const std::string& session_id) {
  std::vector<std::string> removed;
  try {
    store_.delete_session_content(session_id, [&removed](const std::string& id) { removed.push_back(id); });
  } catch (const store::StoreError& e) {
    BOOST_LOG_TRIVIAL(error) << "Sync coordinator: Clearing session " << session_id << " stopped after "
                             << removed.size() << " items: " << e.what();
    for (const auto& id : removed) {
      broadcast(session_id, Message::make(network::ContentRemoved{id}));
    }
    throw;
  }
  return removed;
}

void SyncCoordinator::expire_session(const std::string& session_id) {
  const auto removed = delete_session_content(session_id);
  sessions_.remove(session_id);
  BOOST_LOG_TRIVIAL(info) << "Sync coordinator: Session " << session_id << " expired, "
                          << removed.size() << " items removed";

  broadcast(session_id, Message::make(network::SessionExpired{session_id}));
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& [id, member] : members_) {
    if (member.session_id == session_id) {
      member.session_id.clear();
    }
  }
}

void SyncCoordinator::release_retired() {
  std::vector<std::shared_ptr<network::Peer>> retired;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    retired.swap(retired_);
  }
  retired.clear();
}

void SyncCoordinator::stop() {
  {
    std::lock_guard<std::mutex> lock(housekeeping_mutex_);
    stopping_ = true;
  }
  housekeeping_cv_.notify_all();
  if (housekeeping_thread_.joinable()) {
    housekeeping_thread_.join();
  }

  std::vector<std::shared_ptr<network::Peer>> peers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, member] : members_) {
      peers.push_back(member.peer);
    }
    members_.clear();
  }
  for (const auto& peer : peers) {
    peer->close();
  }
  peers.clear();
  release_retired();
}

} // namespace sync
} // namespace tessera
