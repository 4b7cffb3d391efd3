#include <gtest/gtest.h>

#include <functional>
#include <memory>

#include "common/utilities_test.hpp"
#include "docuchat_core/errors.hpp"
#include "docuchat_core/store/durable_chunk_store.hpp"
#include "docuchat_core/store/ephemeral_chunk_store.hpp"

namespace docuchat_core {

using docuchat_tests::kTestDbKey;
using docuchat_tests::kTestDimension;
using docuchat_tests::TestUtilities;

/**
 * Behaviour every ChunkStore backend shares, run against each of them
 */
class ChunkStoreContractTest : public ::testing::TestWithParam<std::string> {
 protected:
  void SetUp() override {
    if (GetParam() == "durable") {
      temp_db_path_ = TestUtilities::create_temp_test_db();
      db_manager_ = std::make_shared<DatabaseManager>(temp_db_path_, kTestDbKey, 2);
      store_ = std::make_shared<DurableChunkStore>(db_manager_, kTestDimension);
    } else {
      store_ = std::make_shared<EphemeralChunkStore>(kTestDimension);
    }
  }

  void TearDown() override {
    store_.reset();
    if (db_manager_) {
      db_manager_->shutdown();
      db_manager_.reset();
      TestUtilities::cleanup_temp_db(temp_db_path_);
    }
  }

  std::filesystem::path temp_db_path_;
  std::shared_ptr<DatabaseManager> db_manager_;
  std::shared_ptr<ChunkStore> store_;
};

TEST_P(ChunkStoreContractTest, ReportsBackendName) {
  EXPECT_EQ(store_->backend_name(), GetParam());
}

TEST_P(ChunkStoreContractTest, ChunksComeBackInIndexOrder) {
  // Arrange
  store_->create_document(TestUtilities::create_test_document("doc1"));
  store_->put_chunks("doc1", {TestUtilities::create_draft("third", 2),
                              TestUtilities::create_draft("first", 0, TestUtilities::axis_vector(0))});
  store_->put_chunks("doc1", {TestUtilities::create_draft("second", 1)});

  // Act
  auto chunks = store_->get_chunks_by_document("doc1");

  // Assert
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].content, "first");
  EXPECT_EQ(chunks[1].content, "second");
  EXPECT_EQ(chunks[2].content, "third");
  EXPECT_TRUE(is_embedded(chunks[0].embedding));
  EXPECT_FALSE(is_embedded(chunks[1].embedding));
  for (const auto &chunk : chunks) {
    EXPECT_EQ(chunk.document_id, "doc1");
    EXPECT_GT(chunk.id, 0);
  }
}

TEST_P(ChunkStoreContractTest, PutChunksReturnsStoredCount) {
  store_->create_document(TestUtilities::create_test_document("doc1"));
  EXPECT_EQ(store_->put_chunks("doc1", {TestUtilities::create_draft("a", 0),
                                        TestUtilities::create_draft("b", 1)}),
            2u);
  EXPECT_EQ(store_->put_chunks("doc1", {}), 0u);
}

TEST_P(ChunkStoreContractTest, PutChunksForUnknownDocumentIsNotFound) {
  EXPECT_THROW(store_->put_chunks("ghost", {TestUtilities::create_draft("a", 0)}), NotFoundError);
}

TEST_P(ChunkStoreContractTest, DuplicateIndexRejectsWholeBatch) {
  store_->create_document(TestUtilities::create_test_document("doc1"));
  store_->put_chunks("doc1", {TestUtilities::create_draft("a", 0)});

  EXPECT_THROW(store_->put_chunks("doc1", {TestUtilities::create_draft("b", 1),
                                           TestUtilities::create_draft("c", 0)}),
               ConflictError);
  EXPECT_THROW(store_->put_chunks("doc1", {TestUtilities::create_draft("d", 5),
                                           TestUtilities::create_draft("e", 5)}),
               ConflictError);

  EXPECT_EQ(store_->get_chunks_by_document("doc1").size(), 1u);
}

TEST_P(ChunkStoreContractTest, ReportsWhetherDocumentExists) {
  EXPECT_FALSE(store_->has_document("doc1"));
  store_->create_document(TestUtilities::create_test_document("doc1"));
  EXPECT_TRUE(store_->has_document("doc1"));

  store_->delete_document("doc1");
  EXPECT_FALSE(store_->has_document("doc1"));
}

TEST_P(ChunkStoreContractTest, UnknownDocumentHasNoChunks) {
  EXPECT_FALSE(store_->has_document("ghost"));
  EXPECT_FALSE(store_->get_document("ghost").has_value());
  EXPECT_TRUE(store_->get_chunks_by_document("ghost").empty());
}

TEST_P(ChunkStoreContractTest, LexicalSearchFindsChunkByKeywords) {
  // Arrange
  store_->create_document(TestUtilities::create_test_document("hr", "HR policy"));
  store_->put_chunks("hr", {TestUtilities::create_draft(
                                "remote work eligibility requires six months tenure", 0)});

  // Act
  auto first = store_->lexical_search("remote work", 5);
  auto second = store_->lexical_search("remote work", 5);

  // Assert
  ASSERT_FALSE(first.empty());
  EXPECT_EQ(first[0].chunk.content, "remote work eligibility requires six months tenure");
  EXPECT_EQ(first[0].document.title, "HR policy");
  EXPECT_GT(first[0].similarity_score, 0.0f);
  ASSERT_EQ(second.size(), first.size());
  EXPECT_EQ(second[0].similarity_score, first[0].similarity_score);
}

TEST_P(ChunkStoreContractTest, LexicalSearchRanksByMatchedTerms) {
  store_->create_document(TestUtilities::create_test_document("doc1"));
  store_->put_chunks("doc1", {TestUtilities::create_draft("budget only", 0),
                              TestUtilities::create_draft("budget and hearing schedule", 1),
                              TestUtilities::create_draft("nothing relevant", 2)});

  auto results = store_->lexical_search("Budget HEARING", 5);

  ASSERT_EQ(results.size(), 2u);
  EXPECT_EQ(results[0].chunk.chunk_index, 1);
  EXPECT_FLOAT_EQ(results[0].similarity_score, 1.0f);
  EXPECT_EQ(results[1].chunk.chunk_index, 0);
  EXPECT_FLOAT_EQ(results[1].similarity_score, 0.5f);
}

TEST_P(ChunkStoreContractTest, LexicalSearchHonoursLimit) {
  store_->create_document(TestUtilities::create_test_document("doc1"));
  std::vector<ChunkDraft> drafts;
  for (int i = 0; i < 10; ++i) {
    drafts.push_back(TestUtilities::create_draft("shared keyword " + std::to_string(i), i));
  }
  store_->put_chunks("doc1", drafts);

  auto results = store_->lexical_search("keyword", 4);

  ASSERT_EQ(results.size(), 4u);
  for (int i = 0; i < 4; ++i) {
    EXPECT_EQ(results[i].chunk.chunk_index, i);
  }
  EXPECT_TRUE(store_->lexical_search("keyword", 0).empty());
}

TEST_P(ChunkStoreContractTest, DeletedDocumentLeavesNoTrace) {
  // Arrange
  store_->create_document(TestUtilities::create_test_document("gone"));
  store_->create_document(TestUtilities::create_test_document("kept"));
  store_->put_chunks("gone", {TestUtilities::create_draft("shared words here", 0,
                                                          TestUtilities::axis_vector(0)),
                              TestUtilities::create_draft("more shared words", 1)});
  store_->put_chunks("kept", {TestUtilities::create_draft("shared words too", 0,
                                                          TestUtilities::axis_vector(1))});

  // Act
  store_->delete_document("gone");

  // Assert
  EXPECT_FALSE(store_->get_document("gone").has_value());
  EXPECT_TRUE(store_->get_chunks_by_document("gone").empty());
  for (const auto &result : store_->lexical_search("shared words", 10)) {
    EXPECT_NE(result.document.id, "gone");
  }
  for (const auto &result :
       store_->vector_search({TestUtilities::axis_vector(0), "shared words"}, 10).results) {
    EXPECT_NE(result.document.id, "gone");
  }
  EXPECT_EQ(store_->list_documents().size(), 1u);
}

TEST_P(ChunkStoreContractTest, DeletingUnknownDocumentIsNotFound) {
  EXPECT_THROW(store_->delete_document("ghost"), NotFoundError);
}

TEST_P(ChunkStoreContractTest, ListsNewestDocumentsFirst) {
  const auto now = std::chrono::system_clock::now();
  store_->create_document(TestUtilities::create_test_document(
      "old", "Old", "x", DocumentCategory::Manual, now - std::chrono::hours(2)));
  store_->create_document(TestUtilities::create_test_document(
      "new", "New", "x", DocumentCategory::Operations, now));
  store_->create_document(TestUtilities::create_test_document(
      "mid", "Mid", "x", DocumentCategory::Politics, now - std::chrono::hours(1),
      std::string("owner")));

  auto all = store_->list_documents();
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].id, "new");
  EXPECT_EQ(all[1].id, "mid");
  EXPECT_EQ(all[2].id, "old");

  auto owned = store_->list_documents(std::string("owner"));
  ASSERT_EQ(owned.size(), 1u);
  EXPECT_EQ(owned[0].id, "mid");
}

INSTANTIATE_TEST_SUITE_P(Backends,
                         ChunkStoreContractTest,
                         ::testing::Values("ephemeral", "durable"),
                         [](const ::testing::TestParamInfo<std::string> &info) {
                           return info.param;
                         });

}  // namespace docuchat_core
