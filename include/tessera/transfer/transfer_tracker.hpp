#ifndef TESSERA_TRANSFER_TRACKER_HPP
#define TESSERA_TRANSFER_TRACKER_HPP

#include <boost/uuid/random_generator.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "tessera/cache/local_chunk_cache.hpp"
#include "tessera/chunk/chunker.hpp"
#include "tessera/crypto/crypto_provider.hpp"
#include "tessera/network/message.hpp"
#include "tessera/transfer/chunk_transport.hpp"
#include "tessera/transfer/transfer_state.hpp"

namespace tessera {
namespace transfer {

// Resend schedule for unacknowledged chunks
struct RetryPolicy {
  uint32_t max_attempts = 5;
  std::chrono::milliseconds base_delay{500};
  std::chrono::milliseconds max_delay{30000};

  // Wait after send number `attempt` (1 based): base * 2^(attempt - 1), capped
  std::chrono::milliseconds delay_for(uint32_t attempt) const;
};

struct TransferProgress {
  uint32_t acknowledged = 0;
  uint32_t total = 0;
};

struct TransferSnapshot {
  std::string content_id;
  std::string name;
  Direction direction = Direction::UPLOAD;
  TransferState::State state = TransferState::State::PENDING;
  TransferProgress progress;
  std::string error;
};

/**
 * Client side bookkeeping for uploads and downloads.
 *
 * Uploads are encrypted and split up front, then emitted chunk by chunk and
 * resent on ack timeout. Downloads request the chunks the local cache lacks,
 * and once every index is cached the ciphertext is reassembled, decrypted and
 * delivered through the completion handler. Content with an active transfer
 * is protected from cache eviction.
 *
 * Handlers are invoked without the tracker lock held.
 */
class TransferTracker {
public:
  using Clock = std::chrono::steady_clock;
  using CompletionHandler = std::function<void(const network::ContentInfo& info,
                                               const std::vector<uint8_t>& plaintext)>;
  using StateHandler = std::function<void(const std::string& content_id, Direction direction,
                                          TransferState::State state, const std::string& detail)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  TransferTracker(ChunkTransport& transport, cache::LocalChunkCache& cache,
                  const crypto::CryptoProvider& crypto, crypto::SessionKey key,
                  std::string session_id, uint32_t chunk_size, RetryPolicy policy = RetryPolicy{});

  TransferTracker(const TransferTracker&) = delete;
  TransferTracker& operator=(const TransferTracker&) = delete;


  // ---- UPLOAD ----
  // Encrypts and splits the plaintext, returns the new content id (record PENDING)
  std::string start_upload(const std::vector<uint8_t>& plaintext, const std::string& content_type,
                           const std::string& name);
  // Emits every chunk not yet in flight. Stops early once the record is cancelled.
  void pump_upload(const std::string& content_id);
  void on_chunk_ack(const std::string& content_id, uint32_t index);
  // Re-emits in-flight chunks and pumps unfinished uploads, used after a reconnect
  void resume_uploads();


  // ---- DOWNLOAD ----
  void on_content_available(const network::ContentInfo& info);
  void on_chunk(const network::ChunkMessage& chunk);
  // Re-requests every outstanding chunk, used after a reconnect
  void resume_downloads();


  // ---- SHARED ----
  // Conflicts, invalid chunks and missing content are terminal, anything else is retried
  void on_chunk_rejected(const std::string& content_id, uint32_t index, network::ErrorCode code,
                         const std::string& reason);
  void on_content_removed(const std::string& content_id);
  // Cancels every unfinished download, used when the session was cleared or expired
  void cancel_downloads(const std::string& reason);
  bool cancel(const std::string& content_id);
  // Resends what timed out and fails records whose attempts ran out
  void check_timeouts(Clock::time_point now);


  // ---- QUERIES ----
  std::optional<TransferState::State> state(const std::string& content_id) const;
  std::optional<TransferProgress> progress(const std::string& content_id) const;
  std::vector<TransferSnapshot> snapshot() const;


  // ---- GETTERS AND SETTERS ----
  void set_completion_handler(CompletionHandler handler);
  void set_state_handler(StateHandler handler);
  const std::string& session_id() const { return session_id_; }

private:
  struct Outstanding {
    uint32_t attempts = 0;
    Clock::time_point deadline;
  };

  struct Record {
    std::string content_id;
    Direction direction = Direction::UPLOAD;
    TransferState state;
    network::ContentInfo info;
    std::vector<chunk::Chunk> chunks;      // upload ciphertext
    std::set<uint32_t> done;               // acknowledged or cached indices
    std::map<uint32_t, Outstanding> outstanding;
    std::string error;
  };

  struct Notice {
    std::string content_id;
    Direction direction;
    TransferState::State state;
    std::string detail;
  };

  // ---- PARAMETERS ----
  ChunkTransport& transport_;
  cache::LocalChunkCache& cache_;
  const crypto::CryptoProvider& crypto_;
  const crypto::SessionKey key_;
  const std::string session_id_;
  const uint32_t chunk_size_;
  const RetryPolicy policy_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Record> records_;
  boost::uuids::random_generator uuid_generator_;

  CompletionHandler on_complete_;
  StateHandler on_state_;


  // ---- STATE MANAGEMENT ----
  // Applies a transition and queues a notice, releasing cache protection on terminal states
  bool transition(Record& record, TransferState::State state, const std::string& detail,
                  std::vector<Notice>& notices);
  void notify(const std::vector<Notice>& notices);


  // ---- MESSAGE BUILDING ----
  network::ChunkMessage build_chunk(const Record& record, uint32_t index) const;
  cache::CachedContentInfo cache_info(const network::ContentInfo& info) const;


  // ---- DOWNLOAD COMPLETION ----
  // Reassembles and decrypts from the cache, re-requesting anything the cache lost
  void complete_download(const std::string& content_id);
};

} // namespace transfer
} // namespace tessera

#endif // TESSERA_TRANSFER_TRACKER_HPP
