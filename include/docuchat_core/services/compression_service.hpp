#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace docuchat_core {

/**
 * Packs a document's raw text into the zstd frame stored in documents.content.
 *
 * Frames carry their content size and a checksum, so a damaged blob is detected on
 * read instead of yielding wrong text. Every failure surfaces as ChunkStoreError.
 */
class CompressionService {
 public:
  static constexpr int kDefaultLevel = 3;
  // Upper bound on a decoded body; a corrupt header cannot request more
  static constexpr size_t kMaxDocumentBytes = 256u * 1024u * 1024u;

  static std::vector<char> compress(std::string_view text, int level = kDefaultLevel);

  // Empty blob decodes to empty text
  static std::string decompress(const std::vector<char> &frame);
};

}  // namespace docuchat_core
