#pragma once

#include <sqlite_modern_cpp.h>

#include <iostream>
#include <memory>

#include "docmind_core/db/database_manager.hpp"
#include "docmind_core/db/db_error.hpp"

namespace docmind_core {

// Borrows a connection from the manager's pool for the guard's lifetime
class PooledConnection {
 public:
  explicit PooledConnection(DatabaseManager &manager)
      : manager_(manager), conn_(manager.get_connection()) {
    if (!conn_) {
      throw DatabaseUnavailableError("No database connection available: the pool is shutting down");
    }
  }

  ~PooledConnection() {
    if (conn_) {
      manager_.return_connection(std::move(conn_));
    }
  }

  sqlite::database *operator->() const { return conn_.get(); }
  sqlite::database &operator*() const { return *conn_; }

  PooledConnection(const PooledConnection &) = delete;
  PooledConnection &operator=(const PooledConnection &) = delete;

 private:
  DatabaseManager &manager_;
  std::unique_ptr<sqlite::database> conn_;
};

enum class TransactionMode { Deferred, Immediate };

// Scoped transaction on a borrowed connection. Rolls back on destruction unless committed.
class Transaction {
 public:
  explicit Transaction(PooledConnection &conn, TransactionMode mode = TransactionMode::Deferred)
      : db_(*conn) {
    db_ << (mode == TransactionMode::Immediate ? "BEGIN IMMEDIATE;" : "BEGIN;");
  }

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  void commit() {
    if (!committed_) {
      db_ << "COMMIT;";
      committed_ = true;
    }
  }

  bool committed() const { return committed_; }

  ~Transaction() noexcept {
    if (committed_) {
      return;
    }
    try {
      db_ << "ROLLBACK;";
    } catch (const sqlite::sqlite_exception &e) {
      std::cerr << "Transaction: rollback failed: " << e.what() << std::endl;
    }
  }

 private:
  sqlite::database &db_;
  bool committed_ = false;
};

}  // namespace docmind_core
