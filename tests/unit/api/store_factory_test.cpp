#include <gtest/gtest.h>

#include <cstdlib>

#include "common/utilities_test.hpp"
#include "docuchat_api/store_factory.hpp"

namespace docuchat_api {

using docuchat_tests::TestUtilities;

class StoreFactoryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_db_path_ = TestUtilities::create_temp_test_db();
    config_ = Config::from_json({{"database_path", temp_db_path_.string()},
                                 {"embedding_dimension", docuchat_tests::kTestDimension}});
  }

  void TearDown() override {
    TestUtilities::cleanup_temp_db(temp_db_path_);
  }

  std::filesystem::path temp_db_path_;
  Config config_;
};

TEST_F(StoreFactoryTest, UsesDurableStoreWithKey) {
  SelectedStore selected = select_chunk_store(config_, std::string(docuchat_tests::kTestDbKey));

  EXPECT_EQ(selected.store->backend_name(), "durable");
  ASSERT_NE(selected.db_manager, nullptr);
  selected.store.reset();
  selected.db_manager->shutdown();
}

TEST_F(StoreFactoryTest, FallsBackWithoutKey) {
  SelectedStore selected = select_chunk_store(config_, std::nullopt);

  EXPECT_EQ(selected.store->backend_name(), "ephemeral");
  EXPECT_EQ(selected.db_manager, nullptr);
}

TEST_F(StoreFactoryTest, FallsBackWhenDisabled) {
  config_.durable_store_enabled = false;

  SelectedStore selected = select_chunk_store(config_, std::string(docuchat_tests::kTestDbKey));

  EXPECT_EQ(selected.store->backend_name(), "ephemeral");
}

TEST_F(StoreFactoryTest, FallsBackWhenDatabaseCannotOpen) {
  {
    SelectedStore first = select_chunk_store(config_, std::string(docuchat_tests::kTestDbKey));
    first.store.reset();
    first.db_manager->shutdown();
  }

  SelectedStore selected = select_chunk_store(config_, std::string("a_different_key"));

  EXPECT_EQ(selected.store->backend_name(), "ephemeral");
}

TEST_F(StoreFactoryTest, ReadsKeyFromEnvironment) {
  setenv("DOCUCHAT_DB_KEY", "secret", 1);
  EXPECT_EQ(database_key_from_env(), std::optional<std::string>("secret"));
  setenv("DOCUCHAT_DB_KEY", "", 1);
  EXPECT_FALSE(database_key_from_env().has_value());
  unsetenv("DOCUCHAT_DB_KEY");
  EXPECT_FALSE(database_key_from_env().has_value());
}

}  // namespace docuchat_api
