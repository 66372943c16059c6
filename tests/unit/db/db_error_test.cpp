#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sqlite_modern_cpp.h>

#include "docmind_core/db/db_error.hpp"

namespace docmind_tests {

using namespace docmind_core;
using ::testing::HasSubstr;

TEST(DbErrorTest, ClassifiesPrimaryAndExtendedCodes) {
  EXPECT_EQ(db_error_kind(SQLITE_BUSY), DbErrorKind::BusyOrLocked);
  EXPECT_EQ(db_error_kind(SQLITE_LOCKED), DbErrorKind::BusyOrLocked);
  EXPECT_EQ(db_error_kind(SQLITE_CONSTRAINT_UNIQUE), DbErrorKind::Constraint);
  EXPECT_EQ(db_error_kind(SQLITE_NOTADB), DbErrorKind::WrongKey);
  EXPECT_EQ(db_error_kind(SQLITE_ERROR), DbErrorKind::Schema);
  EXPECT_EQ(db_error_kind(SQLITE_MISUSE), DbErrorKind::Generic);
}

TEST(DbErrorTest, OnlyBusyAndFullAreTransient) {
  EXPECT_TRUE(is_transient(DbErrorKind::BusyOrLocked));
  EXPECT_TRUE(is_transient(DbErrorKind::Full));
  EXPECT_FALSE(is_transient(DbErrorKind::Constraint));
  EXPECT_FALSE(is_transient(DbErrorKind::WrongKey));
  EXPECT_FALSE(is_transient(DbErrorKind::Unavailable));
}

TEST(DbErrorTest, WrapsSqliteFailureWithOperationAndKind) {
  sqlite::database db(":memory:");
  db << "CREATE TABLE items (id INTEGER PRIMARY KEY)";
  db << "INSERT INTO items (id) VALUES (1)";

  try {
    db << "INSERT INTO items (id) VALUES (1)";
    FAIL() << "Expected a constraint violation";
  } catch (const sqlite::sqlite_exception &e) {
    DbError error("insert_item", e);
    EXPECT_EQ(error.kind(), DbErrorKind::Constraint);
    EXPECT_THAT(std::string(error.what()), HasSubstr("insert_item failed: (constraint)"));
    EXPECT_THAT(std::string(error.what()), HasSubstr("[code=19"));
    EXPECT_THAT(std::string(error.what()), ::testing::Not(HasSubstr("database key")));
  }
}

TEST(DbErrorTest, UnavailableDatabaseIsADbError) {
  DatabaseUnavailableError error("closed");
  const DbError &base = error;
  EXPECT_EQ(base.kind(), DbErrorKind::Unavailable);
  EXPECT_STREQ(base.what(), "closed");
  EXPECT_EQ(to_string(base.kind()), "unavailable");
}

}  // namespace docmind_tests
