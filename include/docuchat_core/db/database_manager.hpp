#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "docuchat_core/db/connection_pool.hpp"

namespace docuchat_core {

/**
 * Owns the encrypted database file: creates the schema once, then serves pooled
 * connections. Constructed once at startup and shared with the durable store.
 */
class DatabaseManager {
 public:
  DatabaseManager(const std::filesystem::path &db_path, const std::string &db_key, int pool_size);
  ~DatabaseManager();

  // Used by the PooledConnection guard
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  const std::filesystem::path &path() const {
    return db_path_;
  }

  DatabaseManager(const DatabaseManager &) = delete;
  DatabaseManager &operator=(const DatabaseManager &) = delete;

 private:
  void setup_schema(const std::string &db_key);

  std::filesystem::path db_path_;
  std::unique_ptr<ConnectionPool> pool_;
  bool is_shut_down_ = false;
};

}  // namespace docuchat_core
