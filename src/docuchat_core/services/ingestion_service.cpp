#include "docuchat_core/services/ingestion_service.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iostream>

#include "docuchat_core/errors.hpp"
#include "docuchat_core/util/crypto_utils.hpp"

namespace docuchat_core {

std::string to_string(EmbeddingState state) {
  switch (state) {
    case EmbeddingState::EmbeddedFully:
      return "embedded_fully";
    case EmbeddingState::EmbeddedPartially:
      return "embedded_partially";
    case EmbeddingState::EmbeddingSkipped:
      return "embedding_skipped";
    default:
      return "unknown";
  }
}

IngestionService::IngestionService(std::shared_ptr<ChunkStore> chunk_store,
                                   std::shared_ptr<EmbeddingClient> embedding_client,
                                   Chunker chunker)
    : chunk_store_(std::move(chunk_store)),
      embedding_client_(std::move(embedding_client)),
      chunker_(chunker) {
  if (!chunk_store_) {
    throw ConfigurationError("IngestionService requires a chunk store");
  }
}

IngestResult IngestionService::ingest(const IngestRequest &request) {
  const DocumentCategory category = document_category_from_string(request.category);
  if (request.content.empty()) {
    throw ValidationError("Document content must not be empty");
  }

  std::vector<TextChunk> text_chunks = chunker_.split(request.content);
  std::vector<ChunkDraft> drafts;
  drafts.reserve(text_chunks.size());
  for (auto &text_chunk : text_chunks) {
    drafts.push_back({std::move(text_chunk.content), text_chunk.chunk_index, Unembedded{}});
  }

  const size_t embedded = embed_drafts(drafts);

  Document document;
  document.id = generate_uuid_v4();
  resolve_names(request, document.title, document.source_file_name);
  document.category = category;
  // Millisecond precision is what the durable backend keeps
  document.uploaded_at = std::chrono::time_point_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
  document.owner_id = request.owner_id;
  document.content_hash = sha256_hex(request.content);
  document.content = request.content;

  chunk_store_->create_document(document);
  try {
    chunk_store_->put_chunks(document.id, drafts);
  } catch (const DocuchatError &e) {
    std::cerr << "Error: storing chunks for document " << document.id << " failed, removing it: "
              << e.what() << std::endl;
    try {
      chunk_store_->delete_document(document.id);
    } catch (const DocuchatError &cleanup_error) {
      std::cerr << "Error: could not remove document " << document.id << ": "
                << cleanup_error.what() << std::endl;
    }
    throw;
  }

  IngestResult result;
  result.document = document;
  result.chunks_created = drafts.size();
  result.embedded_chunks = embedded;
  if (embedded == 0) {
    result.embedding_state = EmbeddingState::EmbeddingSkipped;
  } else if (embedded == drafts.size()) {
    result.embedding_state = EmbeddingState::EmbeddedFully;
  } else {
    result.embedding_state = EmbeddingState::EmbeddedPartially;
  }

  std::cout << "Ingested document " << document.id << " '" << document.title << "': "
            << result.chunks_created << " chunks, " << embedded << " embedded ("
            << to_string(result.embedding_state) << ")" << std::endl;
  return result;
}

size_t IngestionService::embed_drafts(std::vector<ChunkDraft> &drafts) const {
  if (!embedding_client_ || drafts.empty()) {
    return 0;
  }

  const size_t batch_size = embedding_client_->limits().max_batch_size;
  size_t embedded = 0;
  for (size_t start = 0; start < drafts.size(); start += batch_size) {
    const size_t end = std::min(start + batch_size, drafts.size());
    std::vector<std::string> texts;
    texts.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
      texts.push_back(drafts[i].content);
    }

    try {
      std::vector<std::vector<float>> vectors = embedding_client_->embed_batch(texts);
      for (size_t i = start; i < end; ++i) {
        drafts[i].embedding = Embedded{std::move(vectors[i - start])};
      }
      embedded += end - start;
    } catch (const TransientServiceError &e) {
      std::cerr << "Warning: storing chunks " << start << "-" << end - 1
                << " without embeddings: " << e.what() << std::endl;
    } catch (const ValidationError &e) {
      std::cerr << "Warning: storing chunks " << start << "-" << end - 1
                << " without embeddings: " << e.what() << std::endl;
    }
  }
  return embedded;
}

void IngestionService::resolve_names(const IngestRequest &request,
                                     std::string &title,
                                     std::string &source_file_name) {
  auto present = [](const std::optional<std::string> &value) {
    return value && value->find_first_not_of(" \t\r\n") != std::string::npos;
  };

  if (present(request.title)) {
    title = *request.title;
  } else if (present(request.source_file_name)) {
    title = std::filesystem::path(*request.source_file_name).stem().string();
  } else {
    title = "Untitled document";
  }

  if (present(request.source_file_name)) {
    source_file_name = *request.source_file_name;
  } else {
    source_file_name = title;
    std::replace_if(
        source_file_name.begin(), source_file_name.end(),
        [](unsigned char c) { return c < 0x80 && !std::isalnum(c); }, '_');
    source_file_name += ".txt";
  }
}

}  // namespace docuchat_core
