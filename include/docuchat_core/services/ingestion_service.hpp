#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docuchat_core/chunking/chunker.hpp"
#include "docuchat_core/llm/embedding_client.hpp"
#include "docuchat_core/store/chunk_store.hpp"

namespace docuchat_core {

enum class EmbeddingState { EmbeddedFully, EmbeddedPartially, EmbeddingSkipped };
std::string to_string(EmbeddingState state);

struct IngestRequest {
  std::optional<std::string> title;
  std::string content;
  std::string category;
  std::optional<std::string> source_file_name;
  std::optional<std::string> owner_id;
};

struct IngestResult {
  DocumentMetadata document;
  size_t chunks_created = 0;
  size_t embedded_chunks = 0;
  EmbeddingState embedding_state = EmbeddingState::EmbeddingSkipped;
};

/**
 * Turns raw text into a stored document with its chunks.
 *
 * Embedding is best effort: a batch that fails transiently (or is rejected as too
 * large) is stored unembedded. A permanent embedding failure aborts the ingestion
 * before anything is written. If storing the chunks fails, the document is removed
 * again so no half-ingested document stays visible.
 */
class IngestionService {
 public:
  // embedding_client may be null when embeddings are disabled
  IngestionService(std::shared_ptr<ChunkStore> chunk_store,
                   std::shared_ptr<EmbeddingClient> embedding_client,
                   Chunker chunker);

  IngestResult ingest(const IngestRequest &request);

 private:
  size_t embed_drafts(std::vector<ChunkDraft> &drafts) const;
  static void resolve_names(const IngestRequest &request,
                            std::string &title,
                            std::string &source_file_name);

  std::shared_ptr<ChunkStore> chunk_store_;
  std::shared_ptr<EmbeddingClient> embedding_client_;
  Chunker chunker_;
};

}  // namespace docuchat_core
