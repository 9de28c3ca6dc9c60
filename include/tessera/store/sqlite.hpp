#ifndef TESSERA_STORE_SQLITE_HPP
#define TESSERA_STORE_SQLITE_HPP

#include <sqlite3.h>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "store_error.hpp"

namespace tessera {
namespace store {

// Owning SQLite connection opened in WAL mode with a busy timeout
class Database {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Database(const std::filesystem::path& path);
  ~Database();

  Database(const Database&) = delete;
  Database& operator=(const Database&) = delete;

  // Runs one or more statements without results
  void exec(const std::string& sql);
  // Rows modified by the most recent statement
  int changes() const;

  sqlite3* handle() { return db_; }

  // Throws StorageUnavailableError or StoreError depending on the result code
  [[noreturn]] void throw_error(int rc, const std::string& context) const;

private:
  sqlite3* db_ = nullptr;
};

// Prepared statement, finalized on destruction
class Statement {
public:
  Statement(Database& db, const char* sql);
  ~Statement();

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  // ---- PARAMETER BINDING (1-based) ----
  Statement& bind(int index, const std::string& value);
  Statement& bind(int index, int64_t value);
  Statement& bind_blob(int index, const std::vector<uint8_t>& value);

  // Returns true while a row is available, false once done
  bool step();
  // Runs a statement expected to produce no rows
  void run();
  void reset();

  // ---- COLUMN ACCESS (0-based) ----
  int64_t column_int(int column) const;
  std::string column_text(int column) const;
  std::vector<uint8_t> column_blob(int column) const;

private:
  Database& db_;
  sqlite3_stmt* stmt_ = nullptr;
  std::string sql_;
};

// BEGIN IMMEDIATE (writers) or BEGIN (readers), rolled back unless committed
class Transaction {
public:
  explicit Transaction(Database& db, bool immediate = true);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit();

private:
  Database& db_;
  bool active_ = false;
};

// Fixed set of connections to one database file, handed out one per caller
class ConnectionPool {
public:
  class Lease {
  public:
    Lease(ConnectionPool& pool, std::unique_ptr<Database> db);
    ~Lease();

    Lease(Lease&& other) noexcept;
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    Lease& operator=(Lease&&) = delete;

    Database& operator*() { return *db_; }
    Database* operator->() { return db_.get(); }

  private:
    ConnectionPool* pool_;
    std::unique_ptr<Database> db_;
  };

  ConnectionPool(const std::filesystem::path& path, std::size_t size);

  // Blocks until a connection is free
  Lease acquire();
  std::size_t size() const { return size_; }

private:
  std::size_t size_;
  std::mutex mutex_;
  std::condition_variable available_;
  std::vector<std::unique_ptr<Database>> idle_;

  void release(std::unique_ptr<Database> db);
};

} // namespace store
} // namespace tessera

#endif // TESSERA_STORE_SQLITE_HPP
