#include <algorithm>

#include "docuchat_core/errors.hpp"
#include "docuchat_core/types/document.hpp"
#include "docuchat_core/types/search_result.hpp"

namespace docuchat_core {

std::string to_string(DocumentCategory category) {
  switch (category) {
    case DocumentCategory::Politics:
      return "politics";
    case DocumentCategory::Operations:
      return "operations";
    case DocumentCategory::Manual:
      return "manual";
    default:
      return "unknown";
  }
}

DocumentCategory document_category_from_string(const std::string &str) {
  if (str == "politics")
    return DocumentCategory::Politics;
  if (str == "operations")
    return DocumentCategory::Operations;
  if (str == "manual")
    return DocumentCategory::Manual;
  throw ValidationError("Category must be one of: politics, operations, manual (got '" + str +
                        "')");
}

const std::vector<DocumentCategory> &all_document_categories() {
  static const std::vector<DocumentCategory> categories = {
      DocumentCategory::Politics, DocumentCategory::Operations, DocumentCategory::Manual};
  return categories;
}

void sort_by_relevance(std::vector<SearchResult> &results) {
  std::sort(results.begin(), results.end(), [](const SearchResult &a, const SearchResult &b) {
    if (a.similarity_score != b.similarity_score)
      return a.similarity_score > b.similarity_score;
    if (a.chunk.chunk_index != b.chunk.chunk_index)
      return a.chunk.chunk_index < b.chunk.chunk_index;
    if (a.document.uploaded_at != b.document.uploaded_at)
      return a.document.uploaded_at < b.document.uploaded_at;
    if (a.document.id != b.document.id)
      return a.document.id < b.document.id;
    return a.chunk.id < b.chunk.id;
  });
}

}  // namespace docuchat_core
