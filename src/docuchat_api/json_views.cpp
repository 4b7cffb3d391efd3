#include "docuchat_api/json_views.hpp"

#include <cstdint>
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

#include "docuchat_core/errors.hpp"

namespace docuchat_api {

using docuchat_core::ValidationError;

std::string format_timestamp(const std::chrono::system_clock::time_point &tp) {
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  std::time_t seconds = static_cast<std::time_t>(ms / 1000);
  std::tm tm_struct{};
  gmtime_r(&seconds, &tm_struct);
  std::ostringstream ss;
  ss << std::put_time(&tm_struct, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
     << (ms % 1000) << 'Z';
  return ss.str();
}

nlohmann::json document_to_json(const docuchat_core::DocumentMetadata &document) {
  nlohmann::json json;
  json["id"] = document.id;
  json["title"] = document.title;
  json["category"] = docuchat_core::to_string(document.category);
  json["source_file_name"] = document.source_file_name;
  json["uploaded_at"] = format_timestamp(document.uploaded_at);
  json["owner_id"] = document.owner_id ? nlohmann::json(*document.owner_id) : nlohmann::json();
  json["content_hash"] = document.content_hash;
  return json;
}

nlohmann::json chunk_to_json(const docuchat_core::Chunk &chunk) {
  nlohmann::json json;
  json["id"] = chunk.id;
  json["document_id"] = chunk.document_id;
  json["chunk_index"] = chunk.chunk_index;
  json["content"] = chunk.content;
  json["embedded"] = docuchat_core::is_embedded(chunk.embedding);
  return json;
}

nlohmann::json search_result_to_json(const docuchat_core::SearchResult &result) {
  nlohmann::json json;
  json["chunk"] = chunk_to_json(result.chunk);
  json["document"] = document_to_json(result.document);
  json["score"] = result.similarity_score;
  return json;
}

nlohmann::json retrieval_outcome_to_json(const docuchat_core::RetrievalOutcome &outcome) {
  nlohmann::json results = nlohmann::json::array();
  for (const auto &result : outcome.results) {
    results.push_back(search_result_to_json(result));
  }
  nlohmann::json json;
  json["mode"] = docuchat_core::to_string(outcome.mode);
  json["results"] = results;
  return json;
}

nlohmann::json ingest_result_to_json(const docuchat_core::IngestResult &result) {
  nlohmann::json json;
  json["document"] = document_to_json(result.document);
  json["chunks_created"] = result.chunks_created;
  json["embedded_chunks"] = result.embedded_chunks;
  json["embedding_state"] = docuchat_core::to_string(result.embedding_state);
  return json;
}

nlohmann::json answer_to_json(const docuchat_core::Answer &answer) {
  nlohmann::json sources = nlohmann::json::array();
  for (const auto &source : answer.sources) {
    sources.push_back(search_result_to_json(source));
  }
  nlohmann::json json;
  json["response"] = answer.response;
  json["agent_type"] = docuchat_core::to_string(answer.mode);
  json["sources"] = sources;
  return json;
}

std::string required_string(const nlohmann::json &body, const std::string &field) {
  if (!body.is_object() || !body.contains(field) || !body[field].is_string()) {
    throw ValidationError("Field '" + field + "' is required and must be a string");
  }
  return body[field].get<std::string>();
}

namespace {

std::optional<std::string> optional_string(const nlohmann::json &body, const std::string &field) {
  if (!body.contains(field) || body[field].is_null())
    return std::nullopt;
  if (!body[field].is_string()) {
    throw ValidationError("Field '" + field + "' must be a string");
  }
  return body[field].get<std::string>();
}

}  // namespace

docuchat_core::IngestRequest ingest_request_from_json(const nlohmann::json &body) {
  docuchat_core::IngestRequest request;
  request.content = required_string(body, "content");
  request.category = required_string(body, "category");
  request.title = optional_string(body, "title");
  request.source_file_name = optional_string(body, "source_file_name");
  request.owner_id = optional_string(body, "owner_id");
  return request;
}

std::optional<int> optional_k_from_json(const nlohmann::json &body) {
  for (const char *field : {"k", "top_k"}) {
    if (body.contains(field) && !body[field].is_null()) {
      const nlohmann::json &value = body[field];
      if (!value.is_number_integer()) {
        throw ValidationError(std::string("Field '") + field + "' must be an integer");
      }
      // Unsigned values above INT64_MAX would wrap when read as signed
      constexpr int kMax = std::numeric_limits<int>::max();
      const bool in_range = value.is_number_unsigned()
                                ? value.get<uint64_t>() >= 1 &&
                                      value.get<uint64_t>() <= static_cast<uint64_t>(kMax)
                                : value.get<int64_t>() >= 1 && value.get<int64_t>() <= kMax;
      if (!in_range) {
        throw ValidationError(std::string("Field '") + field + "' must be between 1 and " +
                              std::to_string(kMax));
      }
      return static_cast<int>(value.get<int64_t>());
    }
  }
  return std::nullopt;
}

int status_code_for(const std::exception &e) {
  if (dynamic_cast<const docuchat_core::ValidationError *>(&e) ||
      dynamic_cast<const docuchat_core::ConfigurationError *>(&e) ||
      dynamic_cast<const nlohmann::json::exception *>(&e))
    return 400;
  if (dynamic_cast<const docuchat_core::NotFoundError *>(&e))
    return 404;
  if (dynamic_cast<const docuchat_core::ConflictError *>(&e))
    return 409;
  if (dynamic_cast<const docuchat_core::PermanentServiceError *>(&e))
    return 502;
  if (dynamic_cast<const docuchat_core::TransientServiceError *>(&e))
    return 503;
  return 500;
}

}  // namespace docuchat_api
