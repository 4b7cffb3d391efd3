#pragma once

#include <string>

namespace docuchat_core {

// Hex-encoded SHA-256 of the given bytes
std::string sha256_hex(const std::string &content);

// Random RFC 4122 version 4 identifier, e.g. "3b241101-e2bb-4255-8caf-4136c566a962"
std::string generate_uuid_v4();

}  // namespace docuchat_core
