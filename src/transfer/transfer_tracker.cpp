#include "tessera/transfer/transfer_tracker.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "tessera/crypto/digest.hpp"

namespace tessera {
namespace transfer {

using State = TransferState::State;

std::chrono::milliseconds RetryPolicy::delay_for(uint32_t attempt) const {
  std::chrono::milliseconds delay = base_delay;
  for (uint32_t i = 1; i < attempt && delay < max_delay; ++i) {
    delay *= 2;
  }
  return std::min(delay, max_delay);
}

//==============================================
// CONSTRUCTOR
//==============================================

TransferTracker::TransferTracker(ChunkTransport& transport, cache::LocalChunkCache& cache,
                                 const crypto::CryptoProvider& crypto, crypto::SessionKey key,
                                 std::string session_id, uint32_t chunk_size, RetryPolicy policy)
  : transport_(transport),
  cache_(cache),
  crypto_(crypto),
  key_(std::move(key)),
  session_id_(std::move(session_id)),
  chunk_size_(chunk_size),
  policy_(policy) {
  if (chunk_size_ == 0) {
    throw chunk::ChunkError("chunk size must be positive");
  }
  BOOST_LOG_TRIVIAL(debug) << "Transfer tracker: Created for session " << session_id_
                           << " with " << policy_.max_attempts << " attempts per chunk";
}

//==============================================
// UPLOAD
//==============================================

std::string TransferTracker::start_upload(const std::vector<uint8_t>& plaintext,
                                          const std::string& content_type, const std::string& name) {
  const auto iv = crypto_.derive_iv(key_, plaintext);
  auto ciphertext = crypto_.encrypt(key_, iv, plaintext);

  Record record;
  record.direction = Direction::UPLOAD;
  record.chunks = chunk::split(ciphertext, chunk_size_);
  record.info.content_type = content_type;
  record.info.name = name;
  record.info.iv = iv;
  record.info.total_size = ciphertext.size();
  record.info.total_chunks = static_cast<uint32_t>(record.chunks.size());

  std::string content_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    content_id = boost::uuids::to_string(uuid_generator_());
    record.content_id = content_id;
    record.info.content_id = content_id;
  }

  // Seed the cache so a later join does not download our own content
  cache_.protect(content_id);
  const auto info = cache_info(record.info);
  cache_.register_content(info);
  for (const auto& chunk : record.chunks) {
    cache_.put(info, chunk.index, chunk.data);
  }

  std::vector<Notice> notices{{content_id, Direction::UPLOAD, State::PENDING, name}};
  {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.emplace(content_id, std::move(record));
  }
  BOOST_LOG_TRIVIAL(info) << "Transfer tracker: Upload " << content_id << " prepared, "
                          << ciphertext.size() << " bytes in " << info.total_chunks << " chunks";
  notify(notices);
  return content_id;
}

void TransferTracker::pump_upload(const std::string& content_id) {
  std::vector<Notice> notices;
  uint32_t total = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(content_id);
    if (it == records_.end() || it->second.direction != Direction::UPLOAD || it->second.state.is_terminal()) {
      return;
    }
    if (it->second.state.get_state() == State::PENDING) {
      transition(it->second, State::ACTIVE, "", notices);
    }
    total = it->second.info.total_chunks;
  }
  notify(notices);

  for (uint32_t index = 0; index < total; ++index) {
    network::ChunkMessage message;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = records_.find(content_id);
      if (it == records_.end() || it->second.state.get_state() != State::ACTIVE) {
        BOOST_LOG_TRIVIAL(info) << "Transfer tracker: Upload " << content_id << " stopped at chunk " << index;
        return;
      }
      Record& record = it->second;
      if (record.done.count(index) || record.outstanding.count(index)) {
        continue;
      }
      record.outstanding[index] = Outstanding{1, Clock::now() + policy_.delay_for(1)};
      message = build_chunk(record, index);
    }
    if (!transport_.send_chunk(message)) {
      BOOST_LOG_TRIVIAL(debug) << "Transfer tracker: Chunk " << index << " of " << content_id
                               << " not sent, will retry";
    }
  }
}

void TransferTracker::on_chunk_ack(const std::string& content_id, uint32_t index) {
  std::vector<Notice> notices;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(content_id);
    if (it == records_.end() || it->second.direction != Direction::UPLOAD ||
        it->second.state.get_state() != State::ACTIVE) {
      BOOST_LOG_TRIVIAL(debug) << "Transfer tracker: Ignoring ack for " << content_id << "/" << index;
      return;
    }
    Record& record = it->second;
    if (index >= record.info.total_chunks) {
      BOOST_LOG_TRIVIAL(warning) << "Transfer tracker: Ack index " << index << " out of range for " << content_id;
      return;
    }
    record.outstanding.erase(index);
    record.done.insert(index);
    if (record.done.size() == record.info.total_chunks) {
      transition(record, State::COMPLETE, "", notices);
      BOOST_LOG_TRIVIAL(info) << "Transfer tracker: Upload " << content_id << " complete";
    }
  }
  notify(notices);
}

void TransferTracker::resume_uploads() {
  std::vector<std::string> ids;
  std::vector<network::ChunkMessage> resend;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    for (auto& [id, record] : records_) {
      if (record.direction != Direction::UPLOAD || record.state.is_terminal()) {
        continue;
      }
      ids.push_back(id);
      for (auto& [index, outstanding] : record.outstanding) {
        outstanding.deadline = now + policy_.delay_for(outstanding.attempts);
        resend.push_back(build_chunk(record, index));
      }
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Transfer tracker: Resuming " << ids.size() << " uploads, "
                          << resend.size() << " chunks in flight";
  for (const auto& message : resend) {
    transport_.send_chunk(message);
  }
  for (const auto& id : ids) {
    pump_upload(id);
  }
}

//==============================================
// DOWNLOAD
//==============================================

void TransferTracker::on_content_available(const network::ContentInfo& info) {
  if (info.total_chunks == 0 || info.iv.size() != crypto::CryptoProvider::IV_SIZE) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer tracker: Ignoring malformed announcement for " << info.content_id;
    return;
  }

  std::vector<Notice> notices;
  std::vector<uint32_t> requests;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(info.content_id);
    if (it != records_.end() &&
        (!it->second.state.is_terminal() || it->second.state.get_state() == State::COMPLETE)) {
      BOOST_LOG_TRIVIAL(debug) << "Transfer tracker: " << info.content_id << " already "
                               << it->second.state.get_state_string();
      return;
    }

    Record record;
    record.content_id = info.content_id;
    record.direction = Direction::DOWNLOAD;
    record.info = info;
    notices.push_back({info.content_id, Direction::DOWNLOAD, State::PENDING, info.name});

    cache_.protect(info.content_id);
    cache_.register_content(cache_info(info));
    transition(record, State::ACTIVE, "", notices);

    const auto missing = cache_.missing(info.content_id);
    for (uint32_t index = 0; index < info.total_chunks; ++index) {
      record.done.insert(index);
    }
    const auto deadline = Clock::now() + policy_.delay_for(1);
    for (uint32_t index : missing) {
      record.done.erase(index);
      record.outstanding[index] = Outstanding{1, deadline};
      requests.push_back(index);
    }
    records_[info.content_id] = std::move(record);
  }
  notify(notices);

  BOOST_LOG_TRIVIAL(info) << "Transfer tracker: Download " << info.content_id << " needs "
                          << requests.size() << " of " << info.total_chunks << " chunks";
  for (uint32_t index : requests) {
    transport_.request_chunk(info.content_id, index);
  }
  if (requests.empty()) {
    complete_download(info.content_id);
  }
}

void TransferTracker::on_chunk(const network::ChunkMessage& chunk) {
  bool finished = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(chunk.content_id);
    if (it == records_.end() || it->second.direction != Direction::DOWNLOAD ||
        it->second.state.get_state() != State::ACTIVE) {
      BOOST_LOG_TRIVIAL(debug) << "Transfer tracker: Unexpected chunk " << chunk.content_id << "/" << chunk.index;
      return;
    }
    Record& record = it->second;
    if (chunk.index >= record.info.total_chunks) {
      BOOST_LOG_TRIVIAL(warning) << "Transfer tracker: Chunk index " << chunk.index << " out of range for "
                                 << chunk.content_id;
      return;
    }
    if (!chunk.checksum.empty() && !crypto::constant_time_equals(chunk.checksum, crypto::sha256(chunk.data))) {
      BOOST_LOG_TRIVIAL(warning) << "Transfer tracker: Checksum mismatch on " << chunk.content_id << "/"
                                 << chunk.index << ", awaiting resend";
      return;
    }
    if (chunk.data.size() != chunk::expected_chunk_size(chunk.index, record.info.total_size, chunk_size_)) {
      BOOST_LOG_TRIVIAL(warning) << "Transfer tracker: Size mismatch on " << chunk.content_id << "/"
                                 << chunk.index << ": " << chunk.data.size() << " bytes";
      return;
    }
    if (record.done.count(chunk.index)) {
      return;
    }

    cache_.put(cache_info(record.info), chunk.index, chunk.data);
    record.done.insert(chunk.index);
    record.outstanding.erase(chunk.index);
    finished = record.done.size() == record.info.total_chunks;
  }

  if (finished) {
    complete_download(chunk.content_id);
  }
}

void TransferTracker::resume_downloads() {
  std::vector<std::pair<std::string, uint32_t>> requests;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    for (auto& [id, record] : records_) {
      if (record.direction != Direction::DOWNLOAD || record.state.get_state() != State::ACTIVE) {
        continue;
      }
      for (auto& [index, outstanding] : record.outstanding) {
        outstanding.deadline = now + policy_.delay_for(outstanding.attempts);
        requests.emplace_back(id, index);
      }
    }
  }
  for (const auto& [id, index] : requests) {
    transport_.request_chunk(id, index);
  }
}

void TransferTracker::complete_download(const std::string& content_id) {
  auto chunks = cache_.read_all(content_id);

  network::ContentInfo info;
  std::vector<uint32_t> requests;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(content_id);
    if (it == records_.end() || it->second.state.get_state() != State::ACTIVE) {
      return;
    }
    Record& record = it->second;
    info = record.info;

    if (chunks.size() < info.total_chunks) {
      std::set<uint32_t> present;
      for (const auto& chunk : chunks) {
        present.insert(chunk.index);
      }
      const auto deadline = Clock::now() + policy_.delay_for(1);
      for (uint32_t index = 0; index < info.total_chunks; ++index) {
        if (!present.count(index)) {
          record.done.erase(index);
          record.outstanding[index] = Outstanding{1, deadline};
          requests.push_back(index);
        }
      }
    }
  }

  if (!requests.empty()) {
    BOOST_LOG_TRIVIAL(info) << "Transfer tracker: Cache lost " << requests.size() << " chunks of "
                            << content_id << ", requesting again";
    for (uint32_t index : requests) {
      transport_.request_chunk(content_id, index);
    }
    return;
  }

  std::vector<uint8_t> plaintext;
  std::string failure;
  try {
    const auto ciphertext = chunk::reassemble(std::move(chunks), info.total_chunks);
    plaintext = crypto_.decrypt(key_, info.iv, ciphertext);
  } catch (const crypto::IntegrityError& e) {
    failure = e.what();
  } catch (const crypto::CryptoError& e) {
    failure = e.what();
  } catch (const chunk::ChunkError& e) {
    failure = e.what();
  }

  std::vector<Notice> notices;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(content_id);
    if (it == records_.end() || it->second.state.get_state() != State::ACTIVE) {
      return;
    }
    if (!failure.empty()) {
      BOOST_LOG_TRIVIAL(error) << "Transfer tracker: Download " << content_id << " failed: " << failure;
      transition(it->second, State::FAILED, failure, notices);
    } else {
      transition(it->second, State::COMPLETE, "", notices);
    }
  }

  if (!failure.empty()) {
    // Corrupt chunks must not satisfy the next attempt
    cache_.remove(content_id);
    notify(notices);
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "Transfer tracker: Download " << content_id << " complete, "
                          << plaintext.size() << " bytes";
  CompletionHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = on_complete_;
  }
  if (handler) {
    handler(info, plaintext);
  }
  notify(notices);
}

//==============================================
// SHARED
//==============================================

void TransferTracker::on_chunk_rejected(const std::string& content_id, uint32_t index,
                                        network::ErrorCode code, const std::string& reason) {
  std::vector<Notice> notices;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(content_id);
    if (it == records_.end() || it->second.state.is_terminal()) {
      return;
    }
    Record& record = it->second;
    const bool terminal = code == network::ErrorCode::CHUNK_CONFLICT ||
                          code == network::ErrorCode::INVALID_CHUNK ||
                          code == network::ErrorCode::NOT_FOUND;
    if (!terminal) {
      BOOST_LOG_TRIVIAL(warning) << "Transfer tracker: Chunk " << index << " of " << content_id
                                 << " rejected (" << network::to_string(code) << "), will retry: " << reason;
      return;
    }
    BOOST_LOG_TRIVIAL(error) << "Transfer tracker: " << to_string(record.direction) << " " << content_id
                             << " failed on chunk " << index << ": " << reason;
    transition(record, State::FAILED, network::to_string(code) + ": " + reason, notices);
  }
  notify(notices);
}

void TransferTracker::on_content_removed(const std::string& content_id) {
  std::vector<Notice> notices;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(content_id);
    if (it != records_.end() && !it->second.state.is_terminal()) {
      transition(it->second, State::CANCELLED, "removed", notices);
    }
  }
  cache_.remove(content_id);
  notify(notices);
}

void TransferTracker::cancel_downloads(const std::string& reason) {
  std::vector<Notice> notices;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, record] : records_) {
      if (record.direction == Direction::DOWNLOAD && !record.state.is_terminal()) {
        transition(record, State::CANCELLED, reason, notices);
      }
    }
  }
  notify(notices);
}

bool TransferTracker::cancel(const std::string& content_id) {
  std::vector<Notice> notices;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(content_id);
    if (it == records_.end() || it->second.state.is_terminal()) {
      return false;
    }
    transition(it->second, State::CANCELLED, "cancelled", notices);
  }
  BOOST_LOG_TRIVIAL(info) << "Transfer tracker: Cancelled " << content_id;
  notify(notices);
  return true;
}

void TransferTracker::check_timeouts(Clock::time_point now) {
  std::vector<Notice> notices;
  std::vector<network::ChunkMessage> resend;
  std::vector<std::pair<std::string, uint32_t>> requests;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, record] : records_) {
      if (record.state.get_state() != State::ACTIVE) {
        continue;
      }
      std::optional<uint32_t> exhausted;
      for (auto& [index, outstanding] : record.outstanding) {
        if (outstanding.deadline > now) {
          continue;
        }
        if (outstanding.attempts >= policy_.max_attempts) {
          exhausted = index;
          break;
        }
        ++outstanding.attempts;
        outstanding.deadline = now + policy_.delay_for(outstanding.attempts);
        if (record.direction == Direction::UPLOAD) {
          resend.push_back(build_chunk(record, index));
        } else {
          requests.emplace_back(id, index);
        }
      }
      if (exhausted) {
        const std::string detail = "chunk " + std::to_string(*exhausted) + " unanswered after " +
                                   std::to_string(policy_.max_attempts) + " attempts";
        BOOST_LOG_TRIVIAL(error) << "Transfer tracker: " << to_string(record.direction) << " " << id
                                 << " failed: " << detail;
        transition(record, State::FAILED, detail, notices);
      }
    }
  }

  for (const auto& message : resend) {
    BOOST_LOG_TRIVIAL(debug) << "Transfer tracker: Resending " << message.content_id << "/" << message.index;
    transport_.send_chunk(message);
  }
  for (const auto& [id, index] : requests) {
    BOOST_LOG_TRIVIAL(debug) << "Transfer tracker: Re-requesting " << id << "/" << index;
    transport_.request_chunk(id, index);
  }
  notify(notices);
}

//==============================================
// QUERIES
//==============================================

std::optional<TransferState::State> TransferTracker::state(const std::string& content_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(content_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second.state.get_state();
}

std::optional<TransferProgress> TransferTracker::progress(const std::string& content_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(content_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return TransferProgress{static_cast<uint32_t>(it->second.done.size()), it->second.info.total_chunks};
}

std::vector<TransferSnapshot> TransferTracker::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TransferSnapshot> result;
  result.reserve(records_.size());
  for (const auto& [id, record] : records_) {
    TransferSnapshot entry;
    entry.content_id = id;
    entry.name = record.info.name;
    entry.direction = record.direction;
    entry.state = record.state.get_state();
    entry.progress = TransferProgress{static_cast<uint32_t>(record.done.size()), record.info.total_chunks};
    entry.error = record.error;
    result.push_back(std::move(entry));
  }
  std::sort(result.begin(), result.end(),
            [](const TransferSnapshot& a, const TransferSnapshot& b) { return a.content_id < b.content_id; });
  return result;
}

//==============================================
// GETTERS AND SETTERS
//==============================================

void TransferTracker::set_completion_handler(CompletionHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_complete_ = std::move(handler);
}

void TransferTracker::set_state_handler(StateHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_state_ = std::move(handler);
}

//==============================================
// STATE MANAGEMENT
//==============================================

bool TransferTracker::transition(Record& record, State state, const std::string& detail,
                                 std::vector<Notice>& notices) {
  if (!record.state.transition_to(state)) {
    BOOST_LOG_TRIVIAL(warning) << "Transfer tracker: Invalid transition " << record.state.get_state()
                               << " -> " << state << " for " << record.content_id;
    return false;
  }
  if (state == State::FAILED) {
    record.error = detail;
  }
  if (record.state.is_terminal()) {
    record.outstanding.clear();
    cache_.unprotect(record.content_id);
  }
  notices.push_back({record.content_id, record.direction, state, detail});
  return true;
}

void TransferTracker::notify(const std::vector<Notice>& notices) {
  StateHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = on_state_;
  }
  if (!handler) {
    return;
  }
  for (const auto& notice : notices) {
    handler(notice.content_id, notice.direction, notice.state, notice.detail);
  }
}

//==============================================
// MESSAGE BUILDING
//==============================================

network::ChunkMessage TransferTracker::build_chunk(const Record& record, uint32_t index) const {
  network::ChunkMessage message;
  message.content_id = record.content_id;
  message.index = index;
  message.total_chunks = record.info.total_chunks;
  message.total_size = record.info.total_size;
  message.iv = record.info.iv;
  message.content_type = record.info.content_type;
  message.name = record.info.name;
  message.data = record.chunks.at(index).data;
  message.checksum = crypto::sha256(message.data);
  return message;
}

cache::CachedContentInfo TransferTracker::cache_info(const network::ContentInfo& info) const {
  cache::CachedContentInfo cached;
  cached.content_id = info.content_id;
  cached.session_id = session_id_;
  cached.content_type = info.content_type;
  cached.name = info.name;
  cached.total_chunks = info.total_chunks;
  cached.total_size = info.total_size;
  cached.iv = info.iv;
  return cached;
}

} // namespace transfer
} // namespace tessera
