#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace docuchat_core {

enum class DocumentCategory { Politics, Operations, Manual };

std::string to_string(DocumentCategory category);
// Throws ValidationError for anything outside the fixed category set
DocumentCategory document_category_from_string(const std::string &str);
const std::vector<DocumentCategory> &all_document_categories();

struct DocumentMetadata {
  std::string id;
  std::string title;
  DocumentCategory category = DocumentCategory::Manual;
  std::string source_file_name;
  std::chrono::system_clock::time_point uploaded_at;
  std::optional<std::string> owner_id;
  std::string content_hash;
};

struct Document : public DocumentMetadata {
  std::string content;
};

}  // namespace docuchat_core
