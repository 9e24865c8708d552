#pragma once
#include <string>

namespace yieldguard {

// Lower-case hex SHA-256 of `data`. Throws StorageWriteError if libcrypto fails.
std::string sha256_hex(const std::string& data);

} // namespace yieldguard
