#include "docuchat_core/services/document_service.hpp"

#include <iostream>

#include "docuchat_core/errors.hpp"

namespace docuchat_core {

DocumentService::DocumentService(std::shared_ptr<ChunkStore> chunk_store)
    : chunk_store_(std::move(chunk_store)) {}

std::vector<DocumentMetadata> DocumentService::list_documents(
    const std::optional<std::string> &owner_id) {
  return chunk_store_->list_documents(owner_id);
}

Document DocumentService::get_document(const std::string &document_id) {
  std::optional<Document> document = chunk_store_->get_document(document_id);
  if (!document) {
    throw NotFoundError("Document not found: " + document_id);
  }
  return *document;
}

std::vector<Chunk> DocumentService::get_chunks(const std::string &document_id) {
  // Distinguish an unknown document from one without chunks
  if (!chunk_store_->has_document(document_id)) {
    throw NotFoundError("Document not found: " + document_id);
  }
  return chunk_store_->get_chunks_by_document(document_id);
}

void DocumentService::delete_document(const std::string &document_id) {
  chunk_store_->delete_document(document_id);
  std::cout << "Deleted document " << document_id << std::endl;
}

}  // namespace docuchat_core
