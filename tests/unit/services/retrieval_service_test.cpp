#include <gtest/gtest.h>

#include <memory>

#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"
#include "docuchat_core/errors.hpp"
#include "docuchat_core/services/retrieval_service.hpp"
#include "docuchat_core/store/ephemeral_chunk_store.hpp"

namespace docuchat_core {

using docuchat_tests::EmbeddingResult;
using docuchat_tests::kTestDimension;
using docuchat_tests::MockChunkStore;
using docuchat_tests::MockEmbeddingProvider;
namespace MockUtilities = docuchat_tests::MockUtilities;
using docuchat_tests::TestUtilities;
using ::testing::_;
using ::testing::Field;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

class RetrievalServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<NiceMock<MockChunkStore>>();
    ON_CALL(*store_, backend_name()).WillByDefault(Return("mock"));
    provider_ = std::make_shared<MockEmbeddingProvider>();
    EmbeddingLimits limits;
    limits.dimension = kTestDimension;
    limits.max_text_chars = 50;
    client_ = std::make_shared<EmbeddingClient>(provider_, limits,
                                                RetryPolicy(1, std::chrono::milliseconds(1)));
  }

  void provider_returns_vectors() {
    EXPECT_CALL(*provider_, embed(_)).WillRepeatedly(Invoke([](const std::vector<std::string> &t) {
      return MockUtilities::embeddings_for(t, kTestDimension);
    }));
  }

  std::shared_ptr<NiceMock<MockChunkStore>> store_;
  std::shared_ptr<MockEmbeddingProvider> provider_;
  std::shared_ptr<EmbeddingClient> client_;
};

TEST_F(RetrievalServiceTest, UsesVectorSearchWhenAvailable) {
  // Arrange
  provider_returns_vectors();
  VectorSearchOutcome outcome{VectorSearchStatus::Ok,
                              {MockUtilities::make_result("a", 0, 0.4f),
                               MockUtilities::make_result("b", 0, 0.9f)}};
  EXPECT_CALL(*store_, vector_search(Field(&VectorQuery::text, "budget"), 5u))
      .WillOnce(Return(outcome));
  EXPECT_CALL(*store_, lexical_search(_, _)).Times(0);
  RetrievalService service(store_, client_);

  // Act
  RetrievalOutcome result = service.search_detailed("budget");

  // Assert
  EXPECT_EQ(result.mode, RetrievalMode::Vector);
  ASSERT_EQ(result.results.size(), 2u);
  EXPECT_EQ(result.results[0].document.id, "b");
  EXPECT_EQ(result.results[1].document.id, "a");
}

TEST_F(RetrievalServiceTest, FallsBackToLexicalWhenNothingIsEmbedded) {
  provider_returns_vectors();
  EXPECT_CALL(*store_, vector_search(_, _))
      .WillOnce(Return(VectorSearchOutcome{VectorSearchStatus::NoEmbeddedChunks, {}}));
  EXPECT_CALL(*store_, lexical_search("budget", 5u))
      .WillOnce(Return(std::vector<SearchResult>{MockUtilities::make_result("a", 1, 1.0f)}));
  RetrievalService service(store_, client_);

  RetrievalOutcome result = service.search_detailed("budget");

  EXPECT_EQ(result.mode, RetrievalMode::Lexical);
  ASSERT_EQ(result.results.size(), 1u);
}

TEST_F(RetrievalServiceTest, FallsBackToLexicalWhenEmbedderIsDown) {
  EXPECT_CALL(*provider_, embed(_))
      .Times(2)
      .WillRepeatedly(Return(EmbeddingResult::transient_failure("connection refused")));
  EXPECT_CALL(*store_, vector_search(_, _)).Times(0);
  EXPECT_CALL(*store_, lexical_search("budget", 5u))
      .WillOnce(Return(std::vector<SearchResult>{}));
  RetrievalService service(store_, client_);

  RetrievalOutcome result = service.search_detailed("budget");

  EXPECT_EQ(result.mode, RetrievalMode::Lexical);
  EXPECT_TRUE(result.results.empty());
}

TEST_F(RetrievalServiceTest, FallsBackToLexicalWhenEmbedderIsBusy) {
  EXPECT_CALL(*provider_, embed(_))
      .Times(2)
      .WillRepeatedly(Return(EmbeddingResult::from_error(
          "server busy, please try again.  maximum pending requests exceeded",
          "Embedding generation failed")));
  EXPECT_CALL(*store_, vector_search(_, _)).Times(0);
  EXPECT_CALL(*store_, lexical_search("budget", 5u))
      .WillOnce(Return(std::vector<SearchResult>{}));
  RetrievalService service(store_, client_);

  EXPECT_EQ(service.search_detailed("budget").mode, RetrievalMode::Lexical);
}

TEST_F(RetrievalServiceTest, OversizedQueryIsSearchedLexically) {
  EXPECT_CALL(*provider_, embed(_)).Times(0);
  const std::string long_query(80, 'q');
  EXPECT_CALL(*store_, lexical_search(long_query, 5u))
      .WillOnce(Return(std::vector<SearchResult>{}));
  RetrievalService service(store_, client_);

  EXPECT_EQ(service.search_detailed(long_query).mode, RetrievalMode::Lexical);
}

TEST_F(RetrievalServiceTest, PermanentEmbeddingFailurePropagates) {
  EXPECT_CALL(*provider_, embed(_))
      .WillOnce(Return(EmbeddingResult::permanent_failure("invalid api key")));
  RetrievalService service(store_, client_);

  EXPECT_THROW(service.search("budget"), PermanentServiceError);
}

TEST_F(RetrievalServiceTest, SearchesLexicallyWithoutEmbeddingClient) {
  EXPECT_CALL(*store_, vector_search(_, _)).Times(0);
  EXPECT_CALL(*store_, lexical_search("budget", 3u)).WillOnce(Return(std::vector<SearchResult>{}));
  RetrievalService service(store_, nullptr);

  service.search("budget", 3);
}

TEST_F(RetrievalServiceTest, ClampsAndValidatesK) {
  EXPECT_CALL(*store_, lexical_search("budget", 10u)).WillOnce(Return(std::vector<SearchResult>{}));
  RetrievalService service(store_, nullptr, RetrievalOptions{2, 10});

  service.search("budget", 500);
  EXPECT_THROW(service.search("budget", 0), ValidationError);
  EXPECT_THROW(service.search("budget", -3), ValidationError);
}

TEST_F(RetrievalServiceTest, RejectsBlankQuery) {
  RetrievalService service(store_, client_);
  EXPECT_THROW(service.search(""), ValidationError);
  EXPECT_THROW(service.search("  \n "), ValidationError);
}

TEST_F(RetrievalServiceTest, RejectsInconsistentOptions) {
  EXPECT_THROW(RetrievalService(store_, nullptr, RetrievalOptions{0, 10}), ConfigurationError);
  EXPECT_THROW(RetrievalService(store_, nullptr, RetrievalOptions{20, 10}), ConfigurationError);
  EXPECT_THROW(RetrievalService(nullptr, nullptr), ConfigurationError);
}

TEST_F(RetrievalServiceTest, EphemeralStoreAnswersThroughLexicalProxy) {
  // Arrange
  provider_returns_vectors();
  auto store = std::make_shared<EphemeralChunkStore>(kTestDimension);
  store->create_document(TestUtilities::create_test_document("hr"));
  store->put_chunks("hr", {TestUtilities::create_draft(
                              "remote work eligibility requires six months tenure", 0)});
  RetrievalService service(store, client_);

  // Act
  RetrievalOutcome result = service.search_detailed("remote work");

  // Assert
  EXPECT_EQ(result.mode, RetrievalMode::LexicalProxy);
  ASSERT_EQ(result.results.size(), 1u);
  EXPECT_FLOAT_EQ(result.results[0].similarity_score, 1.0f);
}

TEST(RetrievalModeTest, Names) {
  EXPECT_EQ(to_string(RetrievalMode::Vector), "vector");
  EXPECT_EQ(to_string(RetrievalMode::Lexical), "lexical");
  EXPECT_EQ(to_string(RetrievalMode::LexicalProxy), "lexical_proxy");
}

}  // namespace docuchat_core
