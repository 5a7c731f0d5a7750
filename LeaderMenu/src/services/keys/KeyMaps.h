#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lmenu::keys {

// One special (non-printable) key. Config files store `text`, the menu shows `glyph`.
struct KeyMapEntry {
    std::string text;
    std::string glyph;
    bool navigation{false}; // intercepted by the menu before item lookup
};

const std::vector<KeyMapEntry>& entries();

// Glyph for a special-key name or glyph ("enter", "Return", "↵" -> "↵").
std::optional<std::string> glyphFor(std::string_view key);
// Canonical text for a special-key glyph or name ("↵", "ENTER" -> "enter").
std::optional<std::string> textFor(std::string_view key);

// Display form of a key: the glyph for special keys, the key itself otherwise.
std::string normalize(std::string_view key);
// Persisted form of a key: the text name for special keys, the key itself otherwise.
std::string toTextual(std::string_view key);

bool matches(std::string_view configured, std::string_view typed);

// Number of logical characters in a key (special keys count as one).
std::size_t logicalLength(std::string_view key);

} // namespace lmenu::keys
