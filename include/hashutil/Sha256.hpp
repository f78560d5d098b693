#pragma once
#include <string>

namespace hashutil {

// Lowercase hex SHA-256 of `data`. Throws std::runtime_error if libcrypto fails.
std::string sha256_hex(const std::string& data);

} // namespace hashutil
