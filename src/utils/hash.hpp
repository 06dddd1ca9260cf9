#pragma once

#include <cstddef>
#include <string>

namespace kiln::utils {

// Lowercase hex SHA-256 of the given bytes.
std::string Sha256Hex(const std::string& input);

// Lowercase hex HMAC-SHA256.
std::string HmacSha256Hex(const std::string& key, const std::string& message);

std::string RandomHex(std::size_t bytes);

}  // namespace kiln::utils
