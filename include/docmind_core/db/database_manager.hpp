#pragma once

#include "docmind_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace docmind_core {

/**
 * @class DatabaseManager
 * @brief Owns the encrypted database: schema setup and the connection pool.
 *
 * Constructed once by the application (or per test) and passed by reference to
 * the stores. Stores reach connections through the PooledConnection guard.
 */
class DatabaseManager {
 public:
  DatabaseManager() = default;
  ~DatabaseManager();

  // Creates the parent directory, the schema and the pool. A second call is a no-op.
  void initialize(const std::filesystem::path& db_path, const std::string& db_key, int pool_size);

  // These methods are used by the PooledConnection guard
  std::unique_ptr<sqlite::database> get_connection();
  void return_connection(std::unique_ptr<sqlite::database> conn);

  void shutdown();

  bool is_initialized() const;

  DatabaseManager(const DatabaseManager&) = delete;
  DatabaseManager& operator=(const DatabaseManager&) = delete;

 private:
  void setup_schema(const std::filesystem::path& db_path, const std::string& db_key);

  mutable std::mutex mutex_;
  std::unique_ptr<ConnectionPool> pool_;
  bool is_initialized_ = false;
};

}  // namespace docmind_core
