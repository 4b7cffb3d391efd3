#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>

#include "docuchat_api/config.hpp"
#include "docuchat_api/routes.hpp"
#include "docuchat_api/server.hpp"
#include "docuchat_api/store_factory.hpp"
#include "docuchat_core/chunking/chunker.hpp"
#include "docuchat_core/llm/embedding_client.hpp"
#include "docuchat_core/llm/ollama_embedding_provider.hpp"
#include "docuchat_core/llm/ollama_text_generator.hpp"
#include "docuchat_core/services/answer_service.hpp"
#include "docuchat_core/services/document_service.hpp"
#include "docuchat_core/services/generation_service.hpp"
#include "docuchat_core/services/ingestion_service.hpp"
#include "docuchat_core/services/retrieval_service.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();
}

namespace {

constexpr const char *kDefaultConfigPath = "docuchatrc.json";

// --config wins over DOCUCHAT_CONFIG, which wins over the default file
docuchat_api::Config load_config(int argc, char **argv) {
  std::string path;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      path = argv[++i];
    }
  }
  if (path.empty()) {
    if (const char *env_path = std::getenv("DOCUCHAT_CONFIG")) {
      path = env_path;
    }
  }
  if (path.empty()) {
    if (!std::filesystem::exists(kDefaultConfigPath)) {
      std::cout << "No " << kDefaultConfigPath << " found, using default configuration"
                << std::endl;
      return docuchat_api::Config::from_json(nlohmann::json::object());
    }
    path = kDefaultConfigPath;
  }
  std::cout << "Loading configuration from " << path << std::endl;
  return docuchat_api::Config::from_file(path);
}

}  // namespace

int main(int argc, char **argv) {
  try {
    docuchat_api::Config config = load_config(argc, argv);

    std::cout << "Starting Docuchat API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model
              << (config.embedding_enabled ? "" : " (disabled)") << std::endl;
    std::cout << "Generation Model: " << config.generation_model << std::endl;

    // Initialize core components
    docuchat_api::SelectedStore selected =
        docuchat_api::select_chunk_store(config, docuchat_api::database_key_from_env());

    docuchat_core::RetryPolicy retry_policy(config.max_retries,
                                            std::chrono::milliseconds(config.retry_base_delay_ms));

    std::shared_ptr<docuchat_core::EmbeddingClient> embedding_client;
    if (config.embedding_enabled) {
      auto provider = std::make_shared<docuchat_core::OllamaEmbeddingProvider>(
          config.ollama_url, config.embedding_model, config.request_timeout_seconds);
      docuchat_core::EmbeddingLimits limits;
      limits.max_text_chars = static_cast<size_t>(config.embedding_max_text_chars);
      limits.max_batch_size = static_cast<size_t>(config.embedding_max_batch_size);
      limits.dimension = config.embedding_dimension;
      embedding_client =
          std::make_shared<docuchat_core::EmbeddingClient>(provider, limits, retry_policy);
      if (!embedding_client->is_available()) {
        std::cerr << "Warning: Ollama is not reachable at " << config.ollama_url
                  << ", documents will be stored without embeddings until it is" << std::endl;
      }
    }

    auto generator = std::make_shared<docuchat_core::OllamaTextGenerator>(
        config.ollama_url, config.generation_model, config.request_timeout_seconds);

    auto ingestion_service = std::make_shared<docuchat_core::IngestionService>(
        selected.store, embedding_client,
        docuchat_core::Chunker(config.chunk_window_size, config.chunk_overlap));
    docuchat_core::RetrievalOptions retrieval_options;
    retrieval_options.default_top_k = static_cast<size_t>(config.default_top_k);
    retrieval_options.max_top_k = static_cast<size_t>(config.max_top_k);
    auto retrieval_service = std::make_shared<docuchat_core::RetrievalService>(
        selected.store, embedding_client, retrieval_options);
    auto document_service = std::make_shared<docuchat_core::DocumentService>(selected.store);
    auto generation_service =
        std::make_shared<docuchat_core::GenerationService>(generator, retry_policy);
    auto answer_service = std::make_shared<docuchat_core::AnswerService>(
        retrieval_service, generation_service, static_cast<size_t>(config.max_context_chars));

    docuchat_api::Server server(config.host(), config.port());
    docuchat_api::Routes routes(selected.store, embedding_client, ingestion_service,
                                retrieval_service, document_service, answer_service);
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();

    server.start();
    std::cout << "Server started successfully (" << selected.store->backend_name()
              << " store). Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    std::cout << "[2/2] Shutting down database connections..." << std::endl;
    if (selected.db_manager) {
      selected.db_manager->shutdown();
    }

    std::cout << "Shutdown complete." << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
