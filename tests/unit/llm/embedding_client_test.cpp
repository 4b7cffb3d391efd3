#include <gtest/gtest.h>

#include <memory>

#include "common/mocks_test.hpp"
#include "docuchat_core/errors.hpp"
#include "docuchat_core/llm/embedding_client.hpp"

namespace docuchat_core {

using docuchat_tests::EmbeddingResult;
using docuchat_tests::MockEmbeddingProvider;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

class EmbeddingClientTest : public ::testing::Test {
 protected:
  void SetUp() override {
    provider_ = std::make_shared<MockEmbeddingProvider>();
    limits_.max_text_chars = 20;
    limits_.max_batch_size = 4;
    limits_.dimension = 8;
    client_ = std::make_unique<EmbeddingClient>(provider_, limits_,
                                                RetryPolicy(2, std::chrono::milliseconds(1)));
  }

  std::shared_ptr<MockEmbeddingProvider> provider_;
  EmbeddingLimits limits_;
  std::unique_ptr<EmbeddingClient> client_;
};

TEST_F(EmbeddingClientTest, EmbedsBatchInOrder) {
  // Arrange
  std::vector<std::string> texts = {"alpha", "beta", "gamma"};
  EXPECT_CALL(*provider_, embed(texts))
      .WillOnce(Return(docuchat_tests::MockUtilities::embeddings_for(texts, 8)));

  // Act
  auto vectors = client_->embed_batch(texts);

  // Assert
  ASSERT_EQ(vectors.size(), 3u);
  EXPECT_FLOAT_EQ(vectors[0][0], 1.0f);
  EXPECT_FLOAT_EQ(vectors[1][1], 1.0f);
  EXPECT_FLOAT_EQ(vectors[2][2], 1.0f);
}

TEST_F(EmbeddingClientTest, OversizedTextFailsWithoutCallingProvider) {
  EXPECT_CALL(*provider_, embed(_)).Times(0);

  EXPECT_THROW(client_->embed_one(std::string(21, 'x')), ValidationError);
  EXPECT_THROW(client_->embed_batch({"ok", std::string(25, 'y')}), ValidationError);
}

TEST_F(EmbeddingClientTest, LengthIsCountedInCodePoints) {
  // Twenty two-byte characters is forty bytes but within the limit
  std::string text;
  for (int i = 0; i < 20; ++i) {
    text += "\xC3\xA9";
  }
  EXPECT_CALL(*provider_, embed(_)).WillOnce(Invoke([](const std::vector<std::string> &texts) {
    return docuchat_tests::MockUtilities::embeddings_for(texts, 8);
  }));

  EXPECT_EQ(client_->embed_one(text).size(), 8u);
}

TEST_F(EmbeddingClientTest, OversizedBatchFailsWithoutCallingProvider) {
  EXPECT_CALL(*provider_, embed(_)).Times(0);

  EXPECT_THROW(client_->embed_batch({"a", "b", "c", "d", "e"}), ValidationError);
}

TEST_F(EmbeddingClientTest, EmptyOrInvalidTextIsRejected) {
  EXPECT_CALL(*provider_, embed(_)).Times(0);

  EXPECT_THROW(client_->embed_one(""), ValidationError);
  EXPECT_THROW(client_->embed_one(std::string("\xFF", 1)), ValidationError);
}

TEST_F(EmbeddingClientTest, EmptyBatchReturnsNothing) {
  EXPECT_CALL(*provider_, embed(_)).Times(0);

  EXPECT_TRUE(client_->embed_batch({}).empty());
}

TEST_F(EmbeddingClientTest, VectorCountMismatchIsPermanent) {
  EXPECT_CALL(*provider_, embed(_))
      .WillOnce(Return(docuchat_tests::MockUtilities::embeddings_for({"only one"}, 8)));

  EXPECT_THROW(client_->embed_batch({"a", "b"}), PermanentServiceError);
}

TEST_F(EmbeddingClientTest, DimensionMismatchIsPermanent) {
  EXPECT_CALL(*provider_, embed(_))
      .WillOnce(Return(docuchat_tests::MockUtilities::embeddings_for({"a"}, 4)));

  EXPECT_THROW(client_->embed_one("a"), PermanentServiceError);
}

TEST_F(EmbeddingClientTest, TransientFailureIsRetried) {
  EXPECT_CALL(*provider_, embed(_))
      .WillOnce(Return(EmbeddingResult::transient_failure("connection refused")))
      .WillOnce(Return(docuchat_tests::MockUtilities::embeddings_for({"a"}, 8)));

  EXPECT_EQ(client_->embed_one("a").size(), 8u);
}

TEST_F(EmbeddingClientTest, PersistentTransientFailureSurfacesAfterRetries) {
  EXPECT_CALL(*provider_, embed(_))
      .Times(3)
      .WillRepeatedly(Return(EmbeddingResult::transient_failure("timed out")));

  EXPECT_THROW(client_->embed_one("a"), TransientServiceError);
}

TEST_F(EmbeddingClientTest, PermanentProviderFailureIsNotRetried) {
  EXPECT_CALL(*provider_, embed(_))
      .Times(1)
      .WillOnce(Return(EmbeddingResult::permanent_failure("model not found")));

  EXPECT_THROW(client_->embed_one("a"), PermanentServiceError);
}

TEST_F(EmbeddingClientTest, ReportsProviderAvailability) {
  EXPECT_CALL(*provider_, is_available()).WillOnce(Return(false));

  EXPECT_FALSE(client_->is_available());
}

TEST_F(EmbeddingClientTest, RequiresProvider) {
  EXPECT_THROW(EmbeddingClient(nullptr), ConfigurationError);
}

}  // namespace docuchat_core
