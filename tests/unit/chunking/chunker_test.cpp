#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "docuchat_core/chunking/chunker.hpp"
#include "docuchat_core/errors.hpp"

namespace docuchat_core {

class ChunkerTest : public ::testing::Test {
 protected:
  // Text without whitespace so no window is ever dropped
  static std::string make_text(size_t length) {
    std::string text;
    text.reserve(length);
    for (size_t i = 0; i < length; ++i) {
      text.push_back(static_cast<char>('a' + (i * 7) % 26));
    }
    return text;
  }

  static std::string rejoin(const std::vector<TextChunk> &chunks, int overlap) {
    std::string joined;
    for (size_t i = 0; i < chunks.size(); ++i) {
      joined += i == 0 ? chunks[i].content : chunks[i].content.substr(overlap);
    }
    return joined;
  }
};

TEST_F(ChunkerTest, SlidingWindowOverLongerText) {
  // Arrange
  std::string text = make_text(2500);

  // Act
  std::vector<TextChunk> chunks = Chunker::chunk(text, 1000, 200);

  // Assert
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].chunk_index, 0);
  EXPECT_EQ(chunks[1].chunk_index, 1);
  EXPECT_EQ(chunks[2].chunk_index, 2);
  EXPECT_EQ(chunks[0].content, text.substr(0, 1000));
  EXPECT_EQ(chunks[1].content, text.substr(800, 1000));
  EXPECT_EQ(chunks[2].content, text.substr(1600));
  EXPECT_EQ(chunks[2].content.size(), 900u);
}

TEST_F(ChunkerTest, RejoiningChunksReproducesText) {
  const std::vector<std::pair<int, int>> configs = {{1000, 200}, {10, 0}, {10, 9}, {7, 3}, {1, 0}};
  const std::vector<size_t> lengths = {1, 5, 9, 10, 11, 99, 1000, 2501};

  for (const auto &[window, overlap] : configs) {
    Chunker chunker(window, overlap);
    for (size_t length : lengths) {
      std::string text = make_text(length);
      std::vector<TextChunk> chunks = chunker.split(text);
      ASSERT_FALSE(chunks.empty());
      EXPECT_EQ(rejoin(chunks, overlap), text)
          << "window=" << window << " overlap=" << overlap << " length=" << length;
    }
  }
}

TEST_F(ChunkerTest, ChunkCountMatchesFormula) {
  const std::vector<std::pair<int, int>> configs = {{1000, 200}, {10, 0}, {10, 9}, {7, 3}};
  for (const auto &[window, overlap] : configs) {
    const size_t step = static_cast<size_t>(window - overlap);
    for (size_t length = static_cast<size_t>(overlap) + 1; length < 3000; length += 97) {
      std::vector<TextChunk> chunks = Chunker::chunk(make_text(length), window, overlap);
      const size_t expected = (length - overlap + step - 1) / step;
      EXPECT_EQ(chunks.size(), expected)
          << "window=" << window << " overlap=" << overlap << " length=" << length;
    }
  }
}

TEST_F(ChunkerTest, IndicesFollowStartOffsets) {
  std::vector<TextChunk> chunks = Chunker::chunk(make_text(50), 10, 4);
  for (size_t i = 0; i < chunks.size(); ++i) {
    EXPECT_EQ(chunks[i].chunk_index, static_cast<int>(i));
  }
}

TEST_F(ChunkerTest, EmptyTextYieldsNoChunks) {
  EXPECT_TRUE(Chunker::chunk("", 1000, 200).empty());
}

TEST_F(ChunkerTest, TextShorterThanOverlapYieldsOneChunk) {
  std::vector<TextChunk> chunks = Chunker::chunk("short", 1000, 200);
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].content, "short");
}

TEST_F(ChunkerTest, WhitespaceOnlyWindowsAreDropped) {
  // Arrange
  std::string text = "abc" + std::string(10, ' ') + "def";

  // Act
  std::vector<TextChunk> chunks = Chunker::chunk(text, 3, 0);

  // Assert
  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].content, "abc");
  EXPECT_EQ(chunks[0].chunk_index, 0);
  EXPECT_EQ(chunks[1].content, " de");
  EXPECT_EQ(chunks[1].chunk_index, 4);
  EXPECT_EQ(chunks[2].content, "f");
  EXPECT_EQ(chunks[2].chunk_index, 5);
}

TEST_F(ChunkerTest, WhitespaceOnlyTextYieldsNoChunks) {
  EXPECT_TRUE(Chunker::chunk(" \n\t  \r\n ", 3, 1).empty());
}

TEST_F(ChunkerTest, WindowsCountCodePointsNotBytes) {
  // Five two-byte characters
  std::string text = "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9";

  std::vector<TextChunk> chunks = Chunker::chunk(text, 2, 0);

  ASSERT_EQ(chunks.size(), 3u);
  EXPECT_EQ(chunks[0].content, "\xC3\xA9\xC3\xA9");
  EXPECT_EQ(chunks[1].content, "\xC3\xA9\xC3\xA9");
  EXPECT_EQ(chunks[2].content, "\xC3\xA9");
}

TEST_F(ChunkerTest, InvalidUtf8IsRejected) {
  EXPECT_THROW(Chunker::chunk(std::string("abc\xFF\xFE", 5), 3, 1), ValidationError);
}

TEST_F(ChunkerTest, OverlapNotBelowWindowIsAConfigurationError) {
  EXPECT_THROW(Chunker(10, 10), ConfigurationError);
  EXPECT_THROW(Chunker(10, 11), ConfigurationError);
  EXPECT_THROW(Chunker::chunk(make_text(100), 5, 5), ConfigurationError);
}

TEST_F(ChunkerTest, NonPositiveWindowOrNegativeOverlapIsAConfigurationError) {
  EXPECT_THROW(Chunker(0, 0), ConfigurationError);
  EXPECT_THROW(Chunker(-5, 0), ConfigurationError);
  EXPECT_THROW(Chunker(10, -1), ConfigurationError);
}

TEST_F(ChunkerTest, SplittingIsDeterministic) {
  Chunker chunker(13, 5);
  std::string text = make_text(400);
  std::vector<TextChunk> first = chunker.split(text);
  std::vector<TextChunk> second = chunker.split(text);
  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i].content, second[i].content);
    EXPECT_EQ(first[i].chunk_index, second[i].chunk_index);
  }
}

}  // namespace docuchat_core
