#pragma once

#include <memory>
#include <optional>
#include <string>

#include "docuchat_api/config.hpp"
#include "docuchat_core/db/database_manager.hpp"
#include "docuchat_core/store/chunk_store.hpp"

namespace docuchat_api {

struct SelectedStore {
  std::shared_ptr<docuchat_core::ChunkStore> store;
  // Set only for the durable backend, for shutdown
  std::shared_ptr<docuchat_core::DatabaseManager> db_manager;
};

/**
 * Picks the backend once at startup. The durable store is used when it is enabled,
 * a key is present and the database opens; otherwise the ephemeral store is
 * returned and the reason is logged.
 */
SelectedStore select_chunk_store(const Config &config, const std::optional<std::string> &db_key);

// DOCUCHAT_DB_KEY, if set and non-empty
std::optional<std::string> database_key_from_env();

}  // namespace docuchat_api
