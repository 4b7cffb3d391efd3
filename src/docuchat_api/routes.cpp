#include "docuchat_api/routes.hpp"

#include <iostream>

#include "docuchat_api/json_views.hpp"
#include "docuchat_core/errors.hpp"
#include "docuchat_core/llm/embedding_client.hpp"
#include "docuchat_core/services/answer_service.hpp"
#include "docuchat_core/services/document_service.hpp"
#include "docuchat_core/services/ingestion_service.hpp"
#include "docuchat_core/services/retrieval_service.hpp"
#include "docuchat_core/store/chunk_store.hpp"

namespace docuchat_api {

Routes::Routes(std::shared_ptr<docuchat_core::ChunkStore> chunk_store,
               std::shared_ptr<docuchat_core::EmbeddingClient> embedding_client,
               std::shared_ptr<docuchat_core::IngestionService> ingestion_service,
               std::shared_ptr<docuchat_core::RetrievalService> retrieval_service,
               std::shared_ptr<docuchat_core::DocumentService> document_service,
               std::shared_ptr<docuchat_core::AnswerService> answer_service)
    : chunk_store_(std::move(chunk_store)),
      embedding_client_(std::move(embedding_client)),
      ingestion_service_(std::move(ingestion_service)),
      retrieval_service_(std::move(retrieval_service)),
      document_service_(std::move(document_service)),
      answer_service_(std::move(answer_service)) {}

void Routes::register_routes(Server &server) {
  auto &app = server.get_app();

  CROW_ROUTE(app, "/")
  ([this](const crow::request &req) { return handle_health_check(req); });

  CROW_ROUTE(app, "/api/documents")
      .methods(crow::HTTPMethod::GET)(
          [this](const crow::request &req) { return handle_list_documents(req); });

  CROW_ROUTE(app, "/api/documents")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_ingest_document(req); });

  CROW_ROUTE(app, "/api/documents/<string>")
      .methods(crow::HTTPMethod::GET)([this](const crow::request &req, const std::string &id) {
        return handle_get_document(req, id);
      });

  CROW_ROUTE(app, "/api/documents/<string>")
      .methods(crow::HTTPMethod::DELETE)([this](const crow::request &req, const std::string &id) {
        return handle_delete_document(req, id);
      });

  CROW_ROUTE(app, "/api/documents/<string>/chunks")
  ([this](const crow::request &req, const std::string &id) {
    return handle_get_document_chunks(req, id);
  });

  CROW_ROUTE(app, "/api/search").methods(crow::HTTPMethod::POST)([this](const crow::request &req) {
    return handle_search(req);
  });

  CROW_ROUTE(app, "/api/generate")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request &req) { return handle_generate(req); });

  std::cout << "All routes registered successfully" << std::endl;
}

crow::response Routes::handle_health_check(const crow::request &req) {
  return guarded("handle_health_check", [&]() {
    nlohmann::json response = create_success_response("Docuchat API is running");
    response["version"] = "0.1.0";
    response["status"] = "healthy";
    response["backend"] = chunk_store_->backend_name();
    response["embedding"] = embedding_client_ && embedding_client_->is_available();
    return create_json_response(response);
  });
}

crow::response Routes::handle_list_documents(const crow::request &req) {
  return guarded("handle_list_documents", [&]() {
    std::optional<std::string> owner;
    if (const char *owner_param = req.url_params.get("owner")) {
      owner = std::string(owner_param);
    }
    nlohmann::json documents = nlohmann::json::array();
    for (const auto &document : document_service_->list_documents(owner)) {
      documents.push_back(document_to_json(document));
    }
    nlohmann::json response = create_success_response("Documents retrieved successfully");
    response["data"]["documents"] = documents;
    response["data"]["count"] = documents.size();
    return create_json_response(response);
  });
}

crow::response Routes::handle_ingest_document(const crow::request &req) {
  return guarded("handle_ingest_document", [&]() {
    docuchat_core::IngestRequest request = ingest_request_from_json(parse_json_body(req.body));
    std::cout << "Ingesting document (" << request.content.size() << " bytes, category "
              << request.category << ")" << std::endl;
    docuchat_core::IngestResult result = ingestion_service_->ingest(request);
    nlohmann::json response =
        create_success_response("Document ingested successfully", ingest_result_to_json(result));
    return create_json_response(response, 201);
  });
}

crow::response Routes::handle_get_document(const crow::request &req, const std::string &id) {
  return guarded("handle_get_document", [&]() {
    docuchat_core::Document document = document_service_->get_document(id);
    nlohmann::json data = document_to_json(document);
    data["content"] = document.content;
    return create_json_response(create_success_response("Document retrieved successfully", data));
  });
}

crow::response Routes::handle_get_document_chunks(const crow::request &req,
                                                  const std::string &id) {
  return guarded("handle_get_document_chunks", [&]() {
    nlohmann::json chunks = nlohmann::json::array();
    for (const auto &chunk : document_service_->get_chunks(id)) {
      chunks.push_back(chunk_to_json(chunk));
    }
    nlohmann::json response = create_success_response("Chunks retrieved successfully");
    response["data"]["chunks"] = chunks;
    response["data"]["count"] = chunks.size();
    return create_json_response(response);
  });
}

crow::response Routes::handle_delete_document(const crow::request &req, const std::string &id) {
  return guarded("handle_delete_document", [&]() {
    document_service_->delete_document(id);
    return create_json_response(create_success_response("Document deleted successfully"));
  });
}

crow::response Routes::handle_search(const crow::request &req) {
  return guarded("handle_search", [&]() {
    nlohmann::json body = parse_json_body(req.body);
    std::string query = required_string(body, "query");
    std::optional<int> k = optional_k_from_json(body);

    std::cout << "Search for: " << query << std::endl;
    docuchat_core::RetrievalOutcome outcome = retrieval_service_->search_detailed(query, k);
    std::cout << "Search results: " << outcome.results.size() << " ("
              << docuchat_core::to_string(outcome.mode) << ")" << std::endl;

    nlohmann::json response = retrieval_outcome_to_json(outcome);
    response["success"] = true;
    return create_json_response(response);
  });
}

crow::response Routes::handle_generate(const crow::request &req) {
  return guarded("handle_generate", [&]() {
    nlohmann::json body = parse_json_body(req.body);
    std::string prompt = required_string(body, "prompt");
    docuchat_core::AgentMode mode = docuchat_core::agent_mode_from_string(
        body.value("agent_type", std::string("document-search")));
    std::optional<int> k = optional_k_from_json(body);

    docuchat_core::Answer answer = answer_service_->answer(prompt, mode, k);
    nlohmann::json response = answer_to_json(answer);
    response["success"] = true;
    return create_json_response(response);
  });
}

crow::response Routes::guarded(const std::string &handler,
                               const std::function<crow::response()> &body) {
  try {
    return body();
  } catch (const std::exception &e) {
    const int status = status_code_for(e);
    if (status >= 500) {
      std::cerr << "Exception in " << handler << ": " << e.what() << std::endl;
    }
    return create_json_response(create_error_response(e.what()), status);
  }
}

crow::response Routes::create_json_response(const nlohmann::json &json_data, int status_code) {
  crow::response resp(status_code, json_data.dump(2));
  resp.add_header("Content-Type", "application/json");
  return resp;
}

nlohmann::json Routes::create_success_response(const std::string &message,
                                               const nlohmann::json &data) {
  nlohmann::json response;
  response["success"] = true;
  response["message"] = message;
  if (!data.is_null()) {
    response["data"] = data;
  }
  return response;
}

nlohmann::json Routes::create_error_response(const std::string &error) {
  nlohmann::json response;
  response["success"] = false;
  response["error"] = error;
  return response;
}

nlohmann::json Routes::parse_json_body(const std::string &body) {
  if (body.empty()) {
    throw docuchat_core::ValidationError("Request body must be a JSON object");
  }
  return nlohmann::json::parse(body);
}

}  // namespace docuchat_api
