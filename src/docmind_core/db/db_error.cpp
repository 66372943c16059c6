#include "docmind_core/db/db_error.hpp"

namespace docmind_core {

std::string to_string(DbErrorKind kind) {
  switch (kind) {
    case DbErrorKind::BusyOrLocked:
      return "busy_or_locked";
    case DbErrorKind::Constraint:
      return "constraint";
    case DbErrorKind::Readonly:
      return "readonly";
    case DbErrorKind::Io:
      return "io";
    case DbErrorKind::CantOpen:
      return "cantopen";
    case DbErrorKind::WrongKey:
      return "wrong_key";
    case DbErrorKind::Full:
      return "full";
    case DbErrorKind::Schema:
      return "schema";
    case DbErrorKind::Unavailable:
      return "unavailable";
    default:
      return "generic";
  }
}

DbErrorKind db_error_kind(int primary_code) {
  switch (primary_code & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return DbErrorKind::BusyOrLocked;
    case SQLITE_CONSTRAINT:
      return DbErrorKind::Constraint;
    case SQLITE_READONLY:
      return DbErrorKind::Readonly;
    case SQLITE_IOERR:
      return DbErrorKind::Io;
    case SQLITE_CANTOPEN:
      return DbErrorKind::CantOpen;
    // SQLCipher cannot tell a wrong key from a file that is not a database
    case SQLITE_NOTADB:
      return DbErrorKind::WrongKey;
    case SQLITE_FULL:
      return DbErrorKind::Full;
    case SQLITE_ERROR:
    case SQLITE_SCHEMA:
      return DbErrorKind::Schema;
    default:
      return DbErrorKind::Generic;
  }
}

bool is_transient(DbErrorKind kind) {
  return kind == DbErrorKind::BusyOrLocked || kind == DbErrorKind::Full;
}

std::string format_db_error(const std::string &operation, const sqlite::sqlite_exception &e) {
  const int code = e.get_code();
  const DbErrorKind kind = db_error_kind(code);
  std::string msg = operation + " failed: (" + to_string(kind) + ") " + e.errstr() +
                    " [code=" + std::to_string(code) +
                    ", xcode=" + std::to_string(e.get_extended_code()) + "]";
  if (kind == DbErrorKind::WrongKey) {
    msg += "; check that the database key matches the one the file was created with";
  }
  return msg;
}

}  // namespace docmind_core
