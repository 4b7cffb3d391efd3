#include "docuchat_api/store_factory.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>

#include "docuchat_core/errors.hpp"
#include "docuchat_core/store/durable_chunk_store.hpp"
#include "docuchat_core/store/ephemeral_chunk_store.hpp"

namespace docuchat_api {

std::optional<std::string> database_key_from_env() {
  const char *key = std::getenv("DOCUCHAT_DB_KEY");
  if (!key || std::string(key).empty())
    return std::nullopt;
  return std::string(key);
}

SelectedStore select_chunk_store(const Config &config, const std::optional<std::string> &db_key) {
  SelectedStore selected;
  if (!config.durable_store_enabled) {
    std::cout << "Durable store disabled, using ephemeral store" << std::endl;
  } else if (!db_key) {
    std::cerr << "Warning: DOCUCHAT_DB_KEY is not set, using ephemeral store. "
                 "Documents will be lost on exit."
              << std::endl;
  } else {
    try {
      auto db_manager = std::make_shared<docuchat_core::DatabaseManager>(
          config.database_path, *db_key, config.database_pool_size);
      selected.store = std::make_shared<docuchat_core::DurableChunkStore>(
          db_manager, config.embedding_dimension);
      selected.db_manager = db_manager;
      std::cout << "Using durable store at " << config.database_path << std::endl;
      return selected;
    } catch (const docuchat_core::DocuchatError &e) {
      std::cerr << "Warning: durable store unavailable (" << e.what()
                << "), using ephemeral store" << std::endl;
    } catch (const std::filesystem::filesystem_error &e) {
      std::cerr << "Warning: durable store unavailable (" << e.what()
                << "), using ephemeral store" << std::endl;
    }
  }

  selected.store = std::make_shared<docuchat_core::EphemeralChunkStore>(config.embedding_dimension);
  return selected;
}

}  // namespace docuchat_api
