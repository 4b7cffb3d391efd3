#include "docuchat_core/store/ephemeral_chunk_store.hpp"

#include <algorithm>
#include <mutex>
#include <set>

#include "docuchat_core/errors.hpp"
#include "docuchat_core/store/lexical_scoring.hpp"

namespace docuchat_core {

EphemeralChunkStore::EphemeralChunkStore(int embedding_dimension)
    : embedding_dimension_(embedding_dimension) {
  if (embedding_dimension_ <= 0) {
    throw ConfigurationError("Embedding dimension must be positive");
  }
}

void EphemeralChunkStore::create_document(const Document &document) {
  std::unique_lock lock(mutex_);
  if (entries_.count(document.id)) {
    throw ConflictError("Document already exists: " + document.id);
  }
  entries_.emplace(document.id, Entry{document, {}});
}

std::optional<Document> EphemeralChunkStore::get_document(const std::string &document_id) {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(document_id);
  if (it == entries_.end())
    return std::nullopt;
  return it->second.document;
}

bool EphemeralChunkStore::has_document(const std::string &document_id) {
  std::shared_lock lock(mutex_);
  return entries_.count(document_id) > 0;
}

std::vector<DocumentMetadata> EphemeralChunkStore::list_documents(
    const std::optional<std::string> &owner_id) {
  std::vector<DocumentMetadata> documents;
  {
    std::shared_lock lock(mutex_);
    for (const auto &[id, entry] : entries_) {
      if (owner_id && entry.document.owner_id != owner_id)
        continue;
      documents.push_back(entry.document);
    }
  }
  std::stable_sort(documents.begin(), documents.end(),
                   [](const DocumentMetadata &a, const DocumentMetadata &b) {
                     return a.uploaded_at > b.uploaded_at;
                   });
  return documents;
}

size_t EphemeralChunkStore::put_chunks(const std::string &document_id,
                                       const std::vector<ChunkDraft> &chunks) {
  // Validate the whole set before touching shared state
  std::set<int> indices;
  for (const auto &draft : chunks) {
    if (!indices.insert(draft.chunk_index).second) {
      throw ConflictError("Duplicate chunk index " + std::to_string(draft.chunk_index) +
                          " for document " + document_id);
    }
    if (const auto *embedded = std::get_if<Embedded>(&draft.embedding)) {
      if (embedded->values.size() != static_cast<size_t>(embedding_dimension_)) {
        throw ValidationError("Embedding dimension mismatch for chunk " +
                              std::to_string(draft.chunk_index) + ". Expected " +
                              std::to_string(embedding_dimension_) + ", got " +
                              std::to_string(embedded->values.size()));
      }
    }
  }

  std::unique_lock lock(mutex_);
  auto it = entries_.find(document_id);
  if (it == entries_.end()) {
    throw NotFoundError("Document not found: " + document_id);
  }
  for (const auto &existing : it->second.chunks) {
    if (indices.count(existing.chunk_index)) {
      throw ConflictError("Chunk index " + std::to_string(existing.chunk_index) +
                          " already stored for document " + document_id);
    }
  }

  std::vector<Chunk> merged = it->second.chunks;
  for (const auto &draft : chunks) {
    merged.push_back({next_chunk_id_++, document_id, draft.content, draft.chunk_index,
                      draft.embedding});
  }
  std::sort(merged.begin(), merged.end(),
            [](const Chunk &a, const Chunk &b) { return a.chunk_index < b.chunk_index; });
  it->second.chunks = std::move(merged);
  return chunks.size();
}

std::vector<Chunk> EphemeralChunkStore::get_chunks_by_document(const std::string &document_id) {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(document_id);
  if (it == entries_.end())
    return {};
  return it->second.chunks;
}

VectorSearchOutcome EphemeralChunkStore::vector_search(const VectorQuery &query, size_t k) {
  return {VectorSearchStatus::LexicalProxy, lexical_search(query.text, k)};
}

std::vector<SearchResult> EphemeralChunkStore::lexical_search(const std::string &query_text,
                                                              size_t k) {
  const std::vector<std::string> terms = extract_query_terms(query_text);
  if (terms.empty() || k == 0)
    return {};

  std::vector<SearchResult> results;
  {
    std::shared_lock lock(mutex_);
    for (const auto &[id, entry] : entries_) {
      for (const auto &chunk : entry.chunks) {
        const float score = lexical_score(terms, chunk.content);
        if (score > 0.0f) {
          results.push_back({chunk, entry.document, score});
        }
      }
    }
  }

  sort_by_relevance(results);
  if (results.size() > k)
    results.resize(k);
  return results;
}

void EphemeralChunkStore::delete_document(const std::string &document_id) {
  std::unique_lock lock(mutex_);
  if (entries_.erase(document_id) == 0) {
    throw NotFoundError("Document not found: " + document_id);
  }
}

}  // namespace docuchat_core
