#include "tessera/store/sqlite.hpp"
#include <boost/log/trivial.hpp>

namespace tessera {
namespace store {

//==============================================
// DATABASE CONNECTION
//==============================================

Database::Database(const std::filesystem::path& path) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  const int rc = sqlite3_open_v2(path.string().c_str(), &db_, flags, nullptr);
  if (rc != SQLITE_OK) {
    std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    BOOST_LOG_TRIVIAL(error) << "SQLite: Failed to open " << path.string() << ": " << message;
    sqlite3_close(db_);
    db_ = nullptr;
    throw StorageUnavailableError("cannot open database " + path.string() + ": " + message);
  }

  sqlite3_busy_timeout(db_, 5000);

  // WAL lets readers proceed while a writer commits, FULL sync makes commits durable
  exec("PRAGMA journal_mode=WAL;");
  exec("PRAGMA synchronous=FULL;");
  exec("PRAGMA foreign_keys=ON;");
}

Database::~Database() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

void Database::exec(const std::string& sql) {
  char* err = nullptr;
  const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string message = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    BOOST_LOG_TRIVIAL(error) << "SQLite: Statement failed: " << message;
    throw_error(rc, message);
  }
}

int Database::changes() const {
  return sqlite3_changes(db_);
}

void Database::throw_error(int rc, const std::string& context) const {
  const std::string message = context + " (" + sqlite3_errstr(rc) + ")";
  switch (rc & 0xff) {
    case SQLITE_FULL:
    case SQLITE_IOERR:
    case SQLITE_READONLY:
    case SQLITE_CANTOPEN:
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      throw StorageUnavailableError(message);
    default:
      throw StoreError("SQLite: " + message);
  }
}

//==============================================
// PREPARED STATEMENTS
//==============================================

Statement::Statement(Database& db, const char* sql) : db_(db), sql_(sql) {
  const int rc = sqlite3_prepare_v2(db_.handle(), sql, -1, &stmt_, nullptr);
  if (rc != SQLITE_OK) {
    BOOST_LOG_TRIVIAL(error) << "SQLite: Failed to prepare '" << sql_ << "': " << sqlite3_errmsg(db_.handle());
    db_.throw_error(rc, sqlite3_errmsg(db_.handle()));
  }
}

Statement::~Statement() {
  if (stmt_) {
    sqlite3_finalize(stmt_);
  }
}

Statement& Statement::bind(int index, const std::string& value) {
  const int rc = sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
  if (rc != SQLITE_OK) {
    db_.throw_error(rc, "bind text for '" + sql_ + "'");
  }
  return *this;
}

Statement& Statement::bind(int index, int64_t value) {
  const int rc = sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
  if (rc != SQLITE_OK) {
    db_.throw_error(rc, "bind integer for '" + sql_ + "'");
  }
  return *this;
}

Statement& Statement::bind_blob(int index, const std::vector<uint8_t>& value) {
  // A null data pointer would bind NULL, empty blobs need zeroblob
  const int rc = value.empty()
      ? sqlite3_bind_zeroblob(stmt_, index, 0)
      : sqlite3_bind_blob(stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
  if (rc != SQLITE_OK) {
    db_.throw_error(rc, "bind blob for '" + sql_ + "'");
  }
  return *this;
}

bool Statement::step() {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  BOOST_LOG_TRIVIAL(error) << "SQLite: Step failed for '" << sql_ << "': " << sqlite3_errmsg(db_.handle());
  db_.throw_error(rc, sqlite3_errmsg(db_.handle()));
}

void Statement::run() {
  while (step()) {
  }
}

void Statement::reset() {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

int64_t Statement::column_int(int column) const {
  return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
}

std::string Statement::column_text(int column) const {
  const auto* text = sqlite3_column_text(stmt_, column);
  if (!text) {
    return {};
  }
  return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(stmt_, column)));
}

std::vector<uint8_t> Statement::column_blob(int column) const {
  const auto* blob = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_, column));
  const int bytes = sqlite3_column_bytes(stmt_, column);
  if (!blob || bytes <= 0) {
    return {};
  }
  return std::vector<uint8_t>(blob, blob + bytes);
}

//==============================================
// TRANSACTIONS
//==============================================

Transaction::Transaction(Database& db, bool immediate) : db_(db) {
  db_.exec(immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
  active_ = true;
}

Transaction::~Transaction() {
  if (active_) {
    char* err = nullptr;
    if (sqlite3_exec(db_.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
      BOOST_LOG_TRIVIAL(error) << "SQLite: Rollback failed: " << (err ? err : "unknown error");
    }
    sqlite3_free(err);
  }
}

void Transaction::commit() {
  db_.exec("COMMIT;");
  active_ = false;
}

//==============================================
// CONNECTION POOL
//==============================================

ConnectionPool::Lease::Lease(ConnectionPool& pool, std::unique_ptr<Database> db)
  : pool_(&pool), db_(std::move(db)) {}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
  : pool_(other.pool_), db_(std::move(other.db_)) {
  other.pool_ = nullptr;
}

ConnectionPool::Lease::~Lease() {
  if (pool_ && db_) {
    pool_->release(std::move(db_));
  }
}

ConnectionPool::ConnectionPool(const std::filesystem::path& path, std::size_t size) : size_(size) {
  if (size_ == 0) {
    throw StoreError("Connection pool size must be positive");
  }
  for (std::size_t i = 0; i < size_; ++i) {
    idle_.push_back(std::make_unique<Database>(path));
  }
  BOOST_LOG_TRIVIAL(debug) << "SQLite: Opened " << size_ << " connections to " << path.string();
}

ConnectionPool::Lease ConnectionPool::acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  available_.wait(lock, [this] { return !idle_.empty(); });
  auto db = std::move(idle_.back());
  idle_.pop_back();
  return Lease(*this, std::move(db));
}

void ConnectionPool::release(std::unique_ptr<Database> db) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.push_back(std::move(db));
  }
  available_.notify_one();
}

} // namespace store
} // namespace tessera
