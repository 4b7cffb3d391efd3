#include <gtest/gtest.h>
#include <sqlite_modern_cpp.h>

#include <string>
#include <vector>

#include "common/utilities_test.hpp"
#include "docuchat_core/db/connection_pool.hpp"
#include "docuchat_core/db/pooled_connection.hpp"
#include "docuchat_core/errors.hpp"

namespace docuchat_core {

class DatabaseManagerTest : public docuchat_tests::DurableStoreTestBase {};

TEST_F(DatabaseManagerTest, CreatesSchema_OnInitialization) {
  std::vector<std::string> required_tables = {"documents", "chunks"};

  PooledConnection conn(*db_manager_);
  for (const auto &table : required_tables) {
    int count = 0;
    *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='table' AND name=?" << table >> count;
    EXPECT_EQ(count, 1) << "Missing table: " << table;
  }
}

TEST_F(DatabaseManagerTest, HasIndexesAndPragmas_Applied) {
  PooledConnection conn(*db_manager_);

  int idx_count = 0;
  *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type='index' AND "
           "name IN ('idx_documents_uploaded_at', 'idx_documents_owner')" >>
      idx_count;
  EXPECT_EQ(idx_count, 2);

  int fk_on = 0;
  *conn << "PRAGMA foreign_keys;" >> fk_on;
  EXPECT_EQ(fk_on, 1);

  std::string journal_mode;
  *conn << "PRAGMA journal_mode;" >> journal_mode;
  EXPECT_EQ(journal_mode, "wal");
}

TEST_F(DatabaseManagerTest, ReopenWithWrongKey_Fails) {
  const std::string wrong_key = "incorrect_test_key";
  EXPECT_THROW({ ConnectionPool bad_pool(temp_db_path_.string(), wrong_key, 1); }, ChunkStoreError);
}

TEST_F(DatabaseManagerTest, EmptyKey_IsRejected) {
  EXPECT_THROW(DatabaseManager(temp_db_path_, "", 1), ConfigurationError);
}

}  // namespace docuchat_core
