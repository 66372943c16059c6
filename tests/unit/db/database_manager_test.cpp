#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>
#include <string>
#include <vector>

#include "utilities_test.hpp"
#include "docmind_core/db/connection_pool.hpp"
#include "docmind_core/db/pooled_connection.hpp"

namespace docmind_tests {

using namespace docmind_core;

class DatabaseManagerTest : public DocumentStoreTestBase {};

TEST_F(DatabaseManagerTest, CreatesSchema_OnInitialization) {
  // Verify required tables exist
  std::vector<std::string> required_tables = {"documents", "chunks", "conversations"};

  PooledConnection conn(*db_manager_);
  for (const auto& table : required_tables) {
    int count = 0;
    *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?" << table >> count;
    EXPECT_EQ(count, 1) << "Missing table: " << table;
  }
}

TEST_F(DatabaseManagerTest, HasIndexesAndPragmas_Applied) {
  PooledConnection conn(*db_manager_);

  std::vector<std::string> required_indexes = {"idx_documents_owner_hash",
                                               "idx_conversations_session"};
  for (const auto& index : required_indexes) {
    int idx_count = 0;
    *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='index' AND name=?" << index >> idx_count;
    EXPECT_EQ(idx_count, 1) << "Missing index: " << index;
  }

  // Verify foreign_keys pragma is ON
  int fk_on = 0;
  *conn << "PRAGMA foreign_keys;" >> fk_on;
  EXPECT_EQ(fk_on, 1);
}

TEST_F(DatabaseManagerTest, InitializeTwiceIsNoOp) {
  EXPECT_NO_THROW(db_manager_->initialize(temp_db_path_, "docmind_test_key", 4));
  EXPECT_TRUE(db_manager_->is_initialized());
}

TEST_F(DatabaseManagerTest, ReopenWithWrongKey_Fails) {
  // Simulate a new initialization attempt with the wrong key: create a fresh pool with wrong key
  const std::string wrong_key = "incorrect_test_key";
  EXPECT_THROW({
                  ConnectionPool bad_pool(temp_db_path_.string(), wrong_key, 1);
                },
                std::exception);
}

}  // namespace docmind_tests
