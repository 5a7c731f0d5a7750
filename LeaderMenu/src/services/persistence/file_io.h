#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lmenu::fileio {

// Files larger than this are treated as unreadable.
inline constexpr std::uintmax_t kMaxConfigBytes = 8u * 1024u * 1024u; // 8 MiB

std::optional<std::string> readFile(const std::string& path);

// Writes to a sibling temp file and renames it over `path`. A reader never
// observes a partially written file. *outError is set on failure.
bool writeFileAtomic(const std::string& path, std::string_view bytes, std::string* outError = nullptr);

bool exists(const std::string& path);
bool isDirectory(const std::string& path);
}
