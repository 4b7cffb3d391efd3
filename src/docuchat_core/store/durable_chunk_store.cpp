#include "docuchat_core/store/durable_chunk_store.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/impl/IDSelector.h>
#include <faiss/utils/distances.h>

#include <algorithm>
#include <cstring>
#include <iostream>
#include <mutex>
#include <set>
#include <sstream>
#include <unordered_map>

#include "docuchat_core/db/pooled_connection.hpp"
#include "docuchat_core/db/sqlite_error_utils.hpp"
#include "docuchat_core/db/transaction.hpp"
#include "docuchat_core/errors.hpp"
#include "docuchat_core/services/compression_service.hpp"
#include "docuchat_core/store/lexical_scoring.hpp"

namespace docuchat_core {

namespace {

constexpr const char *kJoinedColumns =
    "SELECT c.id, c.document_id, c.chunk_index, c.content, c.embedding, "
    "d.title, d.category, d.source_file_name, d.uploaded_at_ms, d.owner_id, d.content_hash "
    "FROM chunks c JOIN documents d ON d.id = c.document_id ";

std::string id_list(const std::vector<int64_t> &ids) {
  std::stringstream ss;
  for (size_t i = 0; i < ids.size(); ++i) {
    ss << ids[i];
    if (i < ids.size() - 1)
      ss << ",";
  }
  return ss.str();
}

// LIKE pattern with the wildcard characters of the term escaped
std::string like_pattern(const std::string &term) {
  std::string pattern = "%";
  for (char c : term) {
    if (c == '%' || c == '_' || c == '\\')
      pattern.push_back('\\');
    pattern.push_back(c);
  }
  pattern.push_back('%');
  return pattern;
}

}  // namespace

DurableChunkStore::DurableChunkStore(std::shared_ptr<DatabaseManager> db_manager,
                                     int embedding_dimension)
    : db_manager_(std::move(db_manager)), embedding_dimension_(embedding_dimension) {
  if (!db_manager_) {
    throw ConfigurationError("DurableChunkStore requires a database manager");
  }
  if (embedding_dimension_ <= 0) {
    throw ConfigurationError("Embedding dimension must be positive");
  }
  rebuild_index();
}

std::unique_ptr<faiss::IndexIDMap> DurableChunkStore::create_index() const {
  auto index = std::make_unique<faiss::IndexIDMap>(new faiss::IndexFlatL2(embedding_dimension_));
  index->own_fields = true;
  return index;
}

void DurableChunkStore::rebuild_index() {
  std::vector<faiss::idx_t> ids;
  std::vector<float> vectors_flat;
  try {
    PooledConnection conn(*db_manager_);
    *conn << "SELECT id, embedding FROM chunks WHERE embedding IS NOT NULL" >>
        [&](int64_t id, std::vector<char> blob) {
          ChunkEmbedding embedding = embedding_from_blob(id, blob);
          if (const auto *embedded = std::get_if<Embedded>(&embedding)) {
            ids.push_back(id);
            vectors_flat.insert(vectors_flat.end(), embedded->values.begin(),
                                embedded->values.end());
          }
        };
  } catch (const sqlite::sqlite_exception &e) {
    throw ChunkStoreError(format_db_error("rebuild_index", e));
  }

  auto index = create_index();
  if (!ids.empty()) {
    faiss::fvec_renorm_L2(embedding_dimension_, ids.size(), vectors_flat.data());
    index->add_with_ids(static_cast<faiss::idx_t>(ids.size()), vectors_flat.data(), ids.data());
  }

  std::unique_lock lock(index_mutex_);
  index_ = std::move(index);
  std::cout << "Vector index rebuilt with " << ids.size() << " embedded chunks" << std::endl;
}

size_t DurableChunkStore::indexed_vector_count() const {
  std::shared_lock lock(index_mutex_);
  return static_cast<size_t>(index_->ntotal);
}

void DurableChunkStore::create_document(const Document &document) {
  try {
    PooledConnection conn(*db_manager_);
    std::vector<char> compressed = CompressionService::compress(document.content);
    *conn << "INSERT INTO documents (id, title, category, source_file_name, uploaded_at_ms, "
             "owner_id, content_hash, content) VALUES (?,?,?,?,?,?,?,?)"
          << document.id << document.title << to_string(document.category)
          << document.source_file_name << to_epoch_ms(document.uploaded_at) << document.owner_id
          << document.content_hash << compressed;
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("create_document " + document.id, e);
  }
}

std::optional<Document> DurableChunkStore::get_document(const std::string &document_id) {
  std::optional<Document> result;
  try {
    PooledConnection conn(*db_manager_);
    *conn << "SELECT id, title, category, source_file_name, uploaded_at_ms, owner_id, "
             "content_hash, content FROM documents WHERE id = ?"
          << document_id >>
        [&](std::string id, std::string title, std::string category, std::string source_file_name,
            int64_t uploaded_at_ms, std::optional<std::string> owner_id, std::string content_hash,
            std::vector<char> content) {
          Document document;
          document.id = std::move(id);
          document.title = std::move(title);
          document.category = document_category_from_string(category);
          document.source_file_name = std::move(source_file_name);
          document.uploaded_at = from_epoch_ms(uploaded_at_ms);
          document.owner_id = std::move(owner_id);
          document.content_hash = std::move(content_hash);
          document.content = CompressionService::decompress(content);
          result = std::move(document);
        };
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("get_document " + document_id, e);
  }
  return result;
}

bool DurableChunkStore::has_document(const std::string &document_id) {
  int found = 0;
  try {
    PooledConnection conn(*db_manager_);
    *conn << "SELECT EXISTS(SELECT 1 FROM documents WHERE id = ?)" << document_id >> found;
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("has_document " + document_id, e);
  }
  return found != 0;
}

std::vector<DocumentMetadata> DurableChunkStore::list_documents(
    const std::optional<std::string> &owner_id) {
  std::vector<DocumentMetadata> documents;
  auto row = [&](std::string id, std::string title, std::string category,
                 std::string source_file_name, int64_t uploaded_at_ms,
                 std::optional<std::string> owner, std::string content_hash) {
    DocumentMetadata metadata;
    metadata.id = std::move(id);
    metadata.title = std::move(title);
    metadata.category = document_category_from_string(category);
    metadata.source_file_name = std::move(source_file_name);
    metadata.uploaded_at = from_epoch_ms(uploaded_at_ms);
    metadata.owner_id = std::move(owner);
    metadata.content_hash = std::move(content_hash);
    documents.push_back(std::move(metadata));
  };

  const std::string columns =
      "SELECT id, title, category, source_file_name, uploaded_at_ms, owner_id, content_hash "
      "FROM documents ";
  try {
    PooledConnection conn(*db_manager_);
    if (owner_id) {
      *conn << columns + "WHERE owner_id = ? ORDER BY uploaded_at_ms DESC, id" << *owner_id >> row;
    } else {
      *conn << columns + "ORDER BY uploaded_at_ms DESC, id" >> row;
    }
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("list_documents", e);
  }
  return documents;
}

size_t DurableChunkStore::put_chunks(const std::string &document_id,
                                     const std::vector<ChunkDraft> &chunks) {
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

  std::vector<faiss::idx_t> new_ids;
  std::vector<float> new_vectors;
  try {
    PooledConnection conn(*db_manager_);
    Transaction tx(*conn, /*immediate*/ true);

    bool exists = false;
    *conn << "SELECT 1 FROM documents WHERE id = ? LIMIT 1" << document_id >>
        [&](int /*dummy*/) { exists = true; };
    if (!exists) {
      throw NotFoundError("Document not found: " + document_id);
    }

    for (const auto &draft : chunks) {
      if (const auto *embedded = std::get_if<Embedded>(&draft.embedding)) {
        *conn << "INSERT INTO chunks (document_id, chunk_index, content, embedding) "
                 "VALUES (?, ?, ?, ?)"
              << document_id << draft.chunk_index << draft.content
              << embedding_to_blob(embedded->values);
        new_ids.push_back(conn->last_insert_rowid());
        new_vectors.insert(new_vectors.end(), embedded->values.begin(), embedded->values.end());
      } else {
        *conn << "INSERT INTO chunks (document_id, chunk_index, content, embedding) "
                 "VALUES (?, ?, ?, NULL)"
              << document_id << draft.chunk_index << draft.content;
      }
    }

    // Searches wait until both the rows and their vectors are in place
    std::unique_lock lock(index_mutex_);
    tx.commit();
    if (!new_ids.empty()) {
      faiss::fvec_renorm_L2(embedding_dimension_, new_ids.size(), new_vectors.data());
      index_->add_with_ids(static_cast<faiss::idx_t>(new_ids.size()), new_vectors.data(),
                           new_ids.data());
    }
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("put_chunks " + document_id, e);
  } catch (const faiss::FaissException &e) {
    throw ChunkStoreError("Failed to index chunk vectors for " + document_id + ": " + e.what());
  }
  return chunks.size();
}

std::vector<Chunk> DurableChunkStore::get_chunks_by_document(const std::string &document_id) {
  std::vector<Chunk> chunks;
  try {
    PooledConnection conn(*db_manager_);
    *conn << "SELECT id, chunk_index, content, embedding FROM chunks WHERE document_id = ? "
             "ORDER BY chunk_index"
          << document_id >>
        [&](int64_t id, int chunk_index, std::string content,
            std::optional<std::vector<char>> blob) {
          Chunk chunk;
          chunk.id = id;
          chunk.document_id = document_id;
          chunk.chunk_index = chunk_index;
          chunk.content = std::move(content);
          if (blob)
            chunk.embedding = embedding_from_blob(id, *blob);
          chunks.push_back(std::move(chunk));
        };
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("get_chunks_by_document " + document_id, e);
  }
  return chunks;
}

VectorSearchOutcome DurableChunkStore::vector_search(const VectorQuery &query, size_t k) {
  if (query.embedding.size() != static_cast<size_t>(embedding_dimension_)) {
    throw ValidationError("Query vector dimension mismatch. Expected " +
                          std::to_string(embedding_dimension_) + ", got " +
                          std::to_string(query.embedding.size()));
  }

  std::vector<float> distances;
  std::vector<faiss::idx_t> labels;
  {
    std::shared_lock lock(index_mutex_);
    if (index_->ntotal == 0) {
      return {VectorSearchStatus::NoEmbeddedChunks, {}};
    }
    const auto actual_k = static_cast<faiss::idx_t>(
        std::min<size_t>(k, static_cast<size_t>(index_->ntotal)));
    if (actual_k == 0) {
      return {VectorSearchStatus::Ok, {}};
    }

    std::vector<float> normalized = query.embedding;
    faiss::fvec_renorm_L2(embedding_dimension_, 1, normalized.data());
    distances.resize(actual_k);
    labels.resize(actual_k);
    try {
      index_->search(1, normalized.data(), actual_k, distances.data(), labels.data());
    } catch (const faiss::FaissException &e) {
      throw ChunkStoreError("Vector search failed: " + std::string(e.what()));
    }
  }

  std::unordered_map<int64_t, float> score_by_id;
  std::vector<int64_t> ids;
  for (size_t i = 0; i < labels.size(); ++i) {
    if (labels[i] == -1)
      continue;
    // Squared L2 between unit vectors is 2 - 2cos
    const float similarity = std::clamp(1.0f - distances[i] / 2.0f, 0.0f, 1.0f);
    score_by_id[labels[i]] = similarity;
    ids.push_back(labels[i]);
  }

  std::vector<SearchResult> results = fetch_joined(ids);
  for (auto &result : results) {
    result.similarity_score = score_by_id[result.chunk.id];
  }
  if (results.size() < ids.size()) {
    std::cerr << "Warning: " << ids.size() - results.size()
              << " indexed chunks were deleted during the search" << std::endl;
  }
  sort_by_relevance(results);
  return {VectorSearchStatus::Ok, std::move(results)};
}

std::vector<SearchResult> DurableChunkStore::fetch_joined(const std::vector<int64_t> &chunk_ids) {
  std::vector<SearchResult> results;
  if (chunk_ids.empty())
    return results;
  try {
    PooledConnection conn(*db_manager_);
    *conn << std::string(kJoinedColumns) + "WHERE c.id IN (" + id_list(chunk_ids) + ")" >>
        [&](int64_t id, std::string document_id, int chunk_index, std::string content,
            std::optional<std::vector<char>> blob, std::string title, std::string category,
            std::string source_file_name, int64_t uploaded_at_ms,
            std::optional<std::string> owner_id, std::string content_hash) {
          SearchResult result;
          result.chunk.id = id;
          result.chunk.document_id = document_id;
          result.chunk.chunk_index = chunk_index;
          result.chunk.content = std::move(content);
          if (blob)
            result.chunk.embedding = embedding_from_blob(id, *blob);
          result.document.id = std::move(document_id);
          result.document.title = std::move(title);
          result.document.category = document_category_from_string(category);
          result.document.source_file_name = std::move(source_file_name);
          result.document.uploaded_at = from_epoch_ms(uploaded_at_ms);
          result.document.owner_id = std::move(owner_id);
          result.document.content_hash = std::move(content_hash);
          results.push_back(std::move(result));
        };
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("fetch_joined", e);
  }
  return results;
}

std::vector<SearchResult> DurableChunkStore::lexical_search(const std::string &query_text,
                                                            size_t k) {
  const std::vector<std::string> terms = extract_query_terms(query_text);
  if (terms.empty() || k == 0)
    return {};

  // SQL narrows to chunks matching any term; scoring happens here
  std::string sql = std::string(kJoinedColumns) + "WHERE ";
  for (size_t i = 0; i < terms.size(); ++i) {
    if (i > 0)
      sql += " OR ";
    sql += "lower(c.content) LIKE ? ESCAPE '\\'";
  }

  std::vector<SearchResult> results;
  try {
    PooledConnection conn(*db_manager_);
    auto statement = *conn << sql;
    for (const auto &term : terms) {
      statement << like_pattern(term);
    }
    statement >> [&](int64_t id, std::string document_id, int chunk_index, std::string content,
                     std::optional<std::vector<char>> blob, std::string title,
                     std::string category, std::string source_file_name,
                     int64_t uploaded_at_ms, std::optional<std::string> owner_id,
                     std::string content_hash) {
      const float score = lexical_score(terms, content);
      if (score <= 0.0f)
        return;
      SearchResult result;
      result.chunk.id = id;
      result.chunk.document_id = document_id;
      result.chunk.chunk_index = chunk_index;
      result.chunk.content = std::move(content);
      if (blob)
        result.chunk.embedding = embedding_from_blob(id, *blob);
      result.document.id = std::move(document_id);
      result.document.title = std::move(title);
      result.document.category = document_category_from_string(category);
      result.document.source_file_name = std::move(source_file_name);
      result.document.uploaded_at = from_epoch_ms(uploaded_at_ms);
      result.document.owner_id = std::move(owner_id);
      result.document.content_hash = std::move(content_hash);
      result.similarity_score = score;
      results.push_back(std::move(result));
    };
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("lexical_search", e);
  }

  sort_by_relevance(results);
  if (results.size() > k)
    results.resize(k);
  return results;
}

void DurableChunkStore::delete_document(const std::string &document_id) {
  try {
    PooledConnection conn(*db_manager_);
    Transaction tx(*conn, /*immediate*/ true);

    bool exists = false;
    *conn << "SELECT 1 FROM documents WHERE id = ? LIMIT 1" << document_id >>
        [&](int /*dummy*/) { exists = true; };
    if (!exists) {
      throw NotFoundError("Document not found: " + document_id);
    }

    std::vector<faiss::idx_t> chunk_ids;
    *conn << "SELECT id FROM chunks WHERE document_id = ? AND embedding IS NOT NULL"
          << document_id >>
        [&](int64_t id) { chunk_ids.push_back(id); };

    // chunks go with the document through ON DELETE CASCADE
    *conn << "DELETE FROM documents WHERE id = ?" << document_id;

    std::unique_lock lock(index_mutex_);
    tx.commit();
    if (!chunk_ids.empty()) {
      faiss::IDSelectorBatch selector(chunk_ids.size(), chunk_ids.data());
      index_->remove_ids(selector);
    }
  } catch (const sqlite::sqlite_exception &e) {
    rethrow_db_error("delete_document " + document_id, e);
  } catch (const faiss::FaissException &e) {
    throw ChunkStoreError("Failed to remove vectors for " + document_id + ": " + e.what());
  }
}

ChunkEmbedding DurableChunkStore::embedding_from_blob(int64_t chunk_id,
                                                      const std::vector<char> &blob) const {
  const size_t expected = static_cast<size_t>(embedding_dimension_) * sizeof(float);
  if (blob.size() != expected) {
    if (!blob.empty()) {
      std::cerr << "Warning: Ignoring embedding of chunk " << chunk_id
                << " due to mismatched vector dimension. Expected " << expected
                << " bytes, got " << blob.size() << " bytes." << std::endl;
    }
    return Unembedded{};
  }
  Embedded embedded;
  embedded.values.resize(embedding_dimension_);
  std::memcpy(embedded.values.data(), blob.data(), blob.size());
  return embedded;
}

std::vector<char> DurableChunkStore::embedding_to_blob(const std::vector<float> &values) {
  std::vector<char> blob(values.size() * sizeof(float));
  std::memcpy(blob.data(), values.data(), blob.size());
  return blob;
}

int64_t DurableChunkStore::to_epoch_ms(const std::chrono::system_clock::time_point &tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point DurableChunkStore::from_epoch_ms(int64_t ms) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::milliseconds(ms)));
}

}  // namespace docuchat_core
