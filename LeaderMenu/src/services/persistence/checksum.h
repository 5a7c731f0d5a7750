#pragma once
#include <optional>
#include <string>
#include <string_view>

namespace lmenu::checksum {

// Lowercase hex SHA-256 of `bytes`. Empty string only if libcrypto fails.
std::string sha256Hex(std::string_view bytes);

// Checksum of a file's current content, std::nullopt if it cannot be read.
std::optional<std::string> fileChecksum(const std::string& path);
}
