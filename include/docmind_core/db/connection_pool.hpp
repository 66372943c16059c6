#pragma once
#include <sqlite_modern_cpp.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace docmind_core {

/**
 * @class ConnectionPool
 * @brief Fixed set of keyed SQLCipher connections shared between threads.
 *
 * get_connection() blocks until a connection is free. After shutdown() it throws
 * and returned connections are closed instead of re-queued.
 */
class ConnectionPool {
 public:
  ConnectionPool(const std::string& db_path, const std::string& db_key, int pool_size);

  std::unique_ptr<sqlite::database> get_connection();

  void return_connection(std::unique_ptr<sqlite::database> conn);
  void shutdown();

  // Opens a connection, applies the key and verifies it can read the schema
  static std::unique_ptr<sqlite::database> open_keyed(const std::string& db_path,
                                                      const std::string& db_key);

 private:
  bool shutting_down_ = false;
  std::string db_path_;
  std::string db_key_;
  std::queue<std::unique_ptr<sqlite::database>> pool_;
  std::mutex mtx_;
  std::condition_variable cv_;
};

}  // namespace docmind_core
