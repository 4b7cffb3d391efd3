#pragma once
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>

#include "server.hpp"

namespace docuchat_core {
class ChunkStore;
class EmbeddingClient;
class IngestionService;
class RetrievalService;
class DocumentService;
class AnswerService;
}  // namespace docuchat_core

namespace docuchat_api {

class Routes {
 public:
  // embedding_client may be null when embeddings are disabled
  Routes(std::shared_ptr<docuchat_core::ChunkStore> chunk_store,
         std::shared_ptr<docuchat_core::EmbeddingClient> embedding_client,
         std::shared_ptr<docuchat_core::IngestionService> ingestion_service,
         std::shared_ptr<docuchat_core::RetrievalService> retrieval_service,
         std::shared_ptr<docuchat_core::DocumentService> document_service,
         std::shared_ptr<docuchat_core::AnswerService> answer_service);
  ~Routes() = default;

  // Disable copy constructor and assignment
  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  void register_routes(Server &server);

 private:
  std::shared_ptr<docuchat_core::ChunkStore> chunk_store_;
  std::shared_ptr<docuchat_core::EmbeddingClient> embedding_client_;
  std::shared_ptr<docuchat_core::IngestionService> ingestion_service_;
  std::shared_ptr<docuchat_core::RetrievalService> retrieval_service_;
  std::shared_ptr<docuchat_core::DocumentService> document_service_;
  std::shared_ptr<docuchat_core::AnswerService> answer_service_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_list_documents(const crow::request &req);
  crow::response handle_ingest_document(const crow::request &req);
  crow::response handle_get_document(const crow::request &req, const std::string &id);
  crow::response handle_get_document_chunks(const crow::request &req, const std::string &id);
  crow::response handle_delete_document(const crow::request &req, const std::string &id);
  crow::response handle_search(const crow::request &req);
  crow::response handle_generate(const crow::request &req);

  // Helper methods
  crow::response guarded(const std::string &handler, const std::function<crow::response()> &body);
  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace docuchat_api
