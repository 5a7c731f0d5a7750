#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "model/ConfigTree.h"

namespace lmenu::codec {

// Indentation used for the config file. Part of the checksum contract: changing
// it makes every existing file look externally modified.
inline constexpr int kIndent = 2;

[[nodiscard]] nlohmann::json encodeNode(const Node& node);
[[nodiscard]] nlohmann::json encodeGroup(const Group& group);

// Deterministic text form of the tree: sorted keys, empty optionals omitted,
// special keys written by name.
[[nodiscard]] std::string encodeTree(const Group& root);

// Returns std::nullopt on malformed input; *outError then names the location.
std::optional<Group> decodeTree(std::string_view text, std::string* outError = nullptr);
std::optional<Group> decodeDocument(const nlohmann::json& document, std::string* outError = nullptr);

} // namespace lmenu::codec
