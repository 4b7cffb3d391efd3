#pragma once

#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "docuchat_core/errors.hpp"
#include "docuchat_core/llm/retry_policy.hpp"

namespace docuchat_api {

class Config {
 public:
  std::string api_base_url;

  // Durable store
  bool durable_store_enabled;
  std::string database_path;
  int database_pool_size;

  // Ollama
  bool embedding_enabled;
  std::string ollama_url;
  std::string embedding_model;
  int embedding_dimension;
  int embedding_max_text_chars;
  int embedding_max_batch_size;
  std::string generation_model;
  int request_timeout_seconds;

  // Pipeline
  int chunk_window_size;
  int chunk_overlap;
  int default_top_k;
  int max_top_k;
  int max_context_chars;
  int max_retries;
  int retry_base_delay_ms;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string &filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw docuchat_core::ConfigurationError("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const nlohmann::json::exception &e) {
      throw docuchat_core::ConfigurationError(std::string("Failed to parse JSON in config file '") +
                                              filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json &json_config) {
    if (!json_config.is_object()) {
      throw docuchat_core::ConfigurationError("Configuration must be a JSON object");
    }

    Config config;
    try {
      config.api_base_url = json_config.value("api_base_url", std::string("127.0.0.1:3030"));

      config.durable_store_enabled = json_config.value("durable_store_enabled", true);
      config.database_path = json_config.value("database_path", std::string("./data/docuchat.db"));
      config.database_pool_size = json_config.value("database_pool_size", 4);

      config.embedding_enabled = json_config.value("embedding_enabled", true);
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("all-minilm"));
      config.embedding_dimension = json_config.value("embedding_dimension", 384);
      config.embedding_max_text_chars = json_config.value("embedding_max_text_chars", 8000);
      config.embedding_max_batch_size = json_config.value("embedding_max_batch_size", 100);
      config.generation_model = json_config.value("generation_model", std::string("llama3.2"));
      config.request_timeout_seconds = json_config.value("request_timeout_seconds", 60);

      config.chunk_window_size = json_config.value("chunk_window_size", 1000);
      config.chunk_overlap = json_config.value("chunk_overlap", 200);
      config.default_top_k = json_config.value("default_top_k", 5);
      config.max_top_k = json_config.value("max_top_k", 50);
      config.max_context_chars = json_config.value("max_context_chars", 12000);
      config.max_retries = json_config.value("max_retries", 3);
      config.retry_base_delay_ms = json_config.value("retry_base_delay_ms", 1000);
    } catch (const nlohmann::json::type_error &e) {
      throw docuchat_core::ConfigurationError(std::string("Invalid configuration value: ") +
                                              e.what());
    }

    config.validate();
    return config;
  }

  // "host:port" split for the server
  std::string host() const {
    return api_base_url.substr(0, api_base_url.find(':'));
  }
  int port() const {
    return std::stoi(api_base_url.substr(api_base_url.find(':') + 1));
  }

 private:
  void validate() const {
    using docuchat_core::ConfigurationError;
    const auto colon = api_base_url.find(':');
    if (api_base_url.empty() || colon == std::string::npos || colon == 0 ||
        colon + 1 == api_base_url.size() ||
        api_base_url.find_first_not_of("0123456789", colon + 1) != std::string::npos) {
      throw ConfigurationError("api_base_url must have the form host:port");
    }
    if (durable_store_enabled && database_path.empty()) {
      throw ConfigurationError("database_path cannot be empty when durable_store_enabled is true");
    }
    if (database_pool_size <= 0) {
      throw ConfigurationError("database_pool_size must be greater than 0");
    }
    if (ollama_url.empty()) {
      throw ConfigurationError("ollama_url cannot be empty");
    }
    if (embedding_model.empty() || generation_model.empty()) {
      throw ConfigurationError("embedding_model and generation_model cannot be empty");
    }
    if (embedding_dimension <= 0) {
      throw ConfigurationError("embedding_dimension must be greater than 0");
    }
    if (embedding_max_text_chars <= 0 || embedding_max_batch_size <= 0) {
      throw ConfigurationError("embedding limits must be greater than 0");
    }
    if (request_timeout_seconds <= 0) {
      throw ConfigurationError("request_timeout_seconds must be greater than 0");
    }
    if (chunk_window_size <= 0) {
      throw ConfigurationError("chunk_window_size must be greater than 0");
    }
    if (chunk_overlap < 0 || chunk_overlap >= chunk_window_size) {
      throw ConfigurationError("chunk_overlap must satisfy 0 <= chunk_overlap < chunk_window_size");
    }
    if (chunk_window_size > embedding_max_text_chars) {
      throw ConfigurationError("chunk_window_size cannot exceed embedding_max_text_chars");
    }
    if (default_top_k <= 0 || max_top_k <= 0 || default_top_k > max_top_k) {
      throw ConfigurationError("top k values must satisfy 0 < default_top_k <= max_top_k");
    }
    if (max_context_chars <= 0) {
      throw ConfigurationError("max_context_chars must be greater than 0");
    }
    if (max_retries < 0 || retry_base_delay_ms < 0) {
      throw ConfigurationError("max_retries and retry_base_delay_ms cannot be negative");
    }
    if (max_retries > docuchat_core::RetryPolicy::kMaxRetries) {
      throw ConfigurationError("max_retries cannot exceed " +
                               std::to_string(docuchat_core::RetryPolicy::kMaxRetries));
    }
  }
};

}  // namespace docuchat_api
