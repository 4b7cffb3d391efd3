#pragma once

#include <chrono>
#include <exception>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "docuchat_core/services/answer_service.hpp"
#include "docuchat_core/services/ingestion_service.hpp"
#include "docuchat_core/services/retrieval_service.hpp"

namespace docuchat_api {

// JSON shapes of the HTTP API, kept apart from the handlers so they can be tested alone

nlohmann::json document_to_json(const docuchat_core::DocumentMetadata &document);
nlohmann::json chunk_to_json(const docuchat_core::Chunk &chunk);
nlohmann::json search_result_to_json(const docuchat_core::SearchResult &result);
nlohmann::json retrieval_outcome_to_json(const docuchat_core::RetrievalOutcome &outcome);
nlohmann::json ingest_result_to_json(const docuchat_core::IngestResult &result);
nlohmann::json answer_to_json(const docuchat_core::Answer &answer);

// Throws ValidationError for a missing or mistyped field
docuchat_core::IngestRequest ingest_request_from_json(const nlohmann::json &body);
std::optional<int> optional_k_from_json(const nlohmann::json &body);
std::string required_string(const nlohmann::json &body, const std::string &field);

std::string format_timestamp(const std::chrono::system_clock::time_point &tp);

// HTTP status for an exception escaping a handler
int status_code_for(const std::exception &e);

}  // namespace docuchat_api
