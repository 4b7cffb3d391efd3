#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docuchat_core/store/chunk_store.hpp"

namespace docuchat_core {

class DocumentService {
 public:
  explicit DocumentService(std::shared_ptr<ChunkStore> chunk_store);

  std::vector<DocumentMetadata> list_documents(const std::optional<std::string> &owner_id = std::nullopt);
  // Throws NotFoundError for an unknown id
  Document get_document(const std::string &document_id);
  std::vector<Chunk> get_chunks(const std::string &document_id);
  void delete_document(const std::string &document_id);

 private:
  std::shared_ptr<ChunkStore> chunk_store_;
};

}  // namespace docuchat_core
