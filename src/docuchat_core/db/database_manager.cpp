#include "docuchat_core/db/database_manager.hpp"

#include "docuchat_core/db/sqlite_error_utils.hpp"
#include "docuchat_core/errors.hpp"

namespace docuchat_core {

DatabaseManager::DatabaseManager(const std::filesystem::path &db_path,
                                 const std::string &db_key,
                                 int pool_size)
    : db_path_(db_path) {
  if (db_key.empty()) {
    throw ConfigurationError("Database key must not be empty");
  }
  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // Schema setup happens on a single non-pooled connection before the pool exists
  setup_schema(db_key);
  pool_ = std::make_unique<ConnectionPool>(db_path.string(), db_key, pool_size);
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (is_shut_down_) {
    return;
  }
  pool_->shutdown();
  is_shut_down_ = true;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (is_shut_down_) {
    throw ChunkStoreError("DatabaseManager has been shut down");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (is_shut_down_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::string &db_key) {
  std::unique_ptr<sqlite::database> db = ConnectionPool::open_keyed(db_path_.string(), db_key);
  try {
    *db << R"(
      CREATE TABLE IF NOT EXISTS documents (
          id TEXT PRIMARY KEY,
          title TEXT NOT NULL,
          category TEXT NOT NULL,
          source_file_name TEXT NOT NULL,
          uploaded_at_ms INTEGER NOT NULL,
          owner_id TEXT,
          content_hash TEXT NOT NULL,
          content BLOB NOT NULL
      )
    )";

    *db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          document_id TEXT NOT NULL,
          chunk_index INTEGER NOT NULL,
          content TEXT NOT NULL,
          embedding BLOB,
          FOREIGN KEY (document_id) REFERENCES documents(id) ON DELETE CASCADE,
          UNIQUE (document_id, chunk_index)
      )
    )";

    *db << "CREATE INDEX IF NOT EXISTS idx_documents_uploaded_at ON documents(uploaded_at_ms)";
    *db << "CREATE INDEX IF NOT EXISTS idx_documents_owner ON documents(owner_id)";
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("Schema setup", e));
  }
}

}  // namespace docuchat_core
