#include "services/keys/KeyMaps.h"

#include <cctype>

namespace lmenu::keys {

namespace {

std::string toLower(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

struct AliasEntry {
    const char* alias;
    const char* text;
};

// Accepted spellings that are not the canonical text.
constexpr AliasEntry kAliases[] = {
    {"return", "enter"},
    {"esc", "escape"},
    {"arrowup", "up"},
    {"arrowdown", "down"},
    {"arrowleft", "left"},
    {"arrowright", "right"},
    {"del", "delete"},
};

const KeyMapEntry* findEntry(std::string_view key) {
    if (key.empty()) {
        return nullptr;
    }
    for (const auto& entry : entries()) {
        if (key == entry.glyph) {
            return &entry;
        }
    }
    // Single printable characters are never names ("a" is not an alias).
    if (key.size() == 1) {
        return nullptr;
    }
    std::string lower = toLower(key);
    for (const auto& alias : kAliases) {
        if (lower == alias.alias) {
            lower = alias.text;
            break;
        }
    }
    for (const auto& entry : entries()) {
        if (lower == entry.text) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace

const std::vector<KeyMapEntry>& entries() {
    static const std::vector<KeyMapEntry> kEntries = {
        {"enter", "↵", true},
        {"space", "␣", true},
        {"tab", "⇥", false},
        {"backspace", "⌫", true},
        {"escape", "⎋", true},
        {"delete", "⌦", false},
        {"up", "↑", true},
        {"down", "↓", true},
        {"left", "←", true},
        {"right", "→", true},
    };
    return kEntries;
}

std::optional<std::string> glyphFor(std::string_view key) {
    if (const auto* entry = findEntry(key)) {
        return entry->glyph;
    }
    return std::nullopt;
}

std::optional<std::string> textFor(std::string_view key) {
    if (const auto* entry = findEntry(key)) {
        return entry->text;
    }
    return std::nullopt;
}

std::string normalize(std::string_view key) {
    if (auto glyph = glyphFor(key)) {
        return *glyph;
    }
    return std::string{key};
}

std::string toTextual(std::string_view key) {
    if (auto text = textFor(key)) {
        return *text;
    }
    return std::string{key};
}

bool matches(std::string_view configured, std::string_view typed) {
    if (configured.empty() || typed.empty()) {
        return false;
    }
    return normalize(configured) == normalize(typed);
}

std::size_t logicalLength(std::string_view key) {
    if (findEntry(key) != nullptr) {
        return 1;
    }
    // Count UTF-8 code points.
    std::size_t count = 0;
    for (char ch : key) {
        if ((static_cast<unsigned char>(ch) & 0xC0u) != 0x80u) {
            ++count;
        }
    }
    return count;
}

} // namespace lmenu::keys
