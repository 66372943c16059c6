#include "docmind_core/db/database_manager.hpp"

#include <stdexcept>

#include "docmind_core/db/db_error.hpp"

namespace docmind_core {

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::initialize(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 int pool_size) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (is_initialized_) {
    return;
  }

  if (db_path.has_parent_path()) {
    std::filesystem::create_directories(db_path.parent_path());
  }

  // 1. Perform one-time schema setup before creating the pool
  setup_schema(db_path, db_key);

  // 2. Create the connection pool shared by the stores
  pool_ = std::make_unique<ConnectionPool>(db_path.string(), db_key, pool_size);

  is_initialized_ = true;
}

void DatabaseManager::shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

bool DatabaseManager::is_initialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return is_initialized_;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  ConnectionPool* pool = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!is_initialized_) {
      throw DatabaseUnavailableError("DatabaseManager has not been initialized.");
    }
    pool = pool_.get();
  }
  // Blocking wait happens outside the manager lock
  return pool->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!pool_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

void DatabaseManager::setup_schema(const std::filesystem::path& db_path,
                                   const std::string& db_key) {
  // Use a temporary, single-use connection just for schema setup.
  auto db = ConnectionPool::open_keyed(db_path.string(), db_key);
  *db << "PRAGMA journal_mode = WAL;";

  *db << R"(
      CREATE TABLE IF NOT EXISTS documents (
          id TEXT PRIMARY KEY,
          owner_id TEXT NOT NULL,
          filename TEXT NOT NULL,
          file_type TEXT NOT NULL,
          file_size INTEGER NOT NULL,
          content_hash TEXT NOT NULL,
          uploaded_at TEXT NOT NULL,
          chunk_count INTEGER NOT NULL,
          content BLOB NOT NULL
      )
    )";
  *db << R"(
      CREATE INDEX IF NOT EXISTS idx_documents_owner_hash
      ON documents(owner_id, content_hash)
    )";

  *db << R"(
      CREATE TABLE IF NOT EXISTS chunks (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          document_id TEXT NOT NULL,
          chunk_index INTEGER NOT NULL,
          content BLOB NOT NULL,
          vector_blob BLOB NOT NULL,
          UNIQUE (document_id, chunk_index),
          FOREIGN KEY (document_id) REFERENCES documents(id) ON DELETE CASCADE
      )
    )";

  *db << R"(
      CREATE TABLE IF NOT EXISTS conversations (
          id INTEGER PRIMARY KEY AUTOINCREMENT,
          owner_id TEXT NOT NULL,
          session_id TEXT NOT NULL,
          role TEXT NOT NULL,
          content TEXT NOT NULL,
          query_id TEXT NOT NULL DEFAULT '',
          created_at TEXT NOT NULL
      )
    )";
  *db << R"(
      CREATE INDEX IF NOT EXISTS idx_conversations_session
      ON conversations(owner_id, session_id, id)
    )";
}

}  // namespace docmind_core
