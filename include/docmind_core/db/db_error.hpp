#pragma once

#include <sqlite3.h>
#include <sqlite_modern_cpp.h>

#include <exception>
#include <string>

namespace docmind_core {

enum class DbErrorKind {
  BusyOrLocked,
  Constraint,
  Readonly,
  Io,
  CantOpen,
  WrongKey,
  Full,
  Schema,
  Unavailable,
  Generic
};

std::string to_string(DbErrorKind kind);

DbErrorKind db_error_kind(int primary_code);

// Busy, locked and full databases may succeed on a later attempt
bool is_transient(DbErrorKind kind);

// "<operation> failed: (<kind>) <sqlite message> [code=..., xcode=...]", plus a hint
// when SQLCipher rejected the key
std::string format_db_error(const std::string &operation, const sqlite::sqlite_exception &e);

/**
 * Base for every error raised by the persistence layer. Carries the classified
 * SQLite failure so callers can tell a retryable failure from a broken database.
 */
class DbError : public std::exception {
 public:
  explicit DbError(const std::string &message, DbErrorKind kind = DbErrorKind::Generic)
      : message_(message), kind_(kind) {}

  DbError(const std::string &operation, const sqlite::sqlite_exception &e)
      : message_(format_db_error(operation, e)), kind_(db_error_kind(e.get_code())) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

  DbErrorKind kind() const noexcept {
    return kind_;
  }

 private:
  std::string message_;
  DbErrorKind kind_;
};

// Raised when no connection can be borrowed because the database is closed
class DatabaseUnavailableError : public DbError {
 public:
  explicit DatabaseUnavailableError(const std::string &message)
      : DbError(message, DbErrorKind::Unavailable) {}
};

}  // namespace docmind_core
