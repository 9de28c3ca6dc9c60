#ifndef TESSERA_STORE_METADATA_DB_HPP
#define TESSERA_STORE_METADATA_DB_HPP

#include <filesystem>
#include "sqlite.hpp"

namespace tessera {
namespace store {

// Server metadata database: schema creation plus a pool of WAL connections
// shared by the chunk store and the session registry.
class MetadataDb {
public:
  static constexpr const char* FILE_NAME = "metadata.db";

  MetadataDb(const std::filesystem::path& root, std::size_t pool_size = 4);

  ConnectionPool::Lease acquire() { return pool_.acquire(); }
  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
  ConnectionPool pool_;

  void create_schema();
};

} // namespace store
} // namespace tessera

#endif // TESSERA_STORE_METADATA_DB_HPP
