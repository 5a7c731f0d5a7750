#include "services/navigation/ModifierPolicy.h"

#include <cctype>

#include "services/keys/KeyMaps.h"

namespace lmenu::input {

namespace {

std::string trimCopy(std::string_view text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string{text.substr(begin, end - begin + 1)};
}

std::string toLower(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

std::optional<std::uint32_t> modifierForToken(std::string_view token) {
    const std::string lower = toLower(token);
    if (lower == "c" || lower == "ctrl" || lower == "control") {
        return kModifierControl;
    }
    if (lower == "s" || lower == "shift") {
        return kModifierShift;
    }
    if (lower == "a" || lower == "alt" || lower == "option" || lower == "opt") {
        return kModifierOption;
    }
    if (lower == "m" || lower == "cmd" || lower == "command" || lower == "super") {
        return kModifierCommand;
    }
    return std::nullopt;
}

// Splits on '+' (long form) or '-' (short form "C-x"). A trailing separator
// belongs to the key, so "C--" is control plus '-'.
bool splitTokens(const std::string& text, char separator, std::string& key, std::uint32_t& modifiers) {
    std::size_t start = 0;
    modifiers = 0;
    for (;;) {
        std::size_t pos = text.find(separator, start);
        if (pos == std::string::npos || pos == text.size() - 1 || pos == start) {
            key = text.substr(start);
            return !key.empty();
        }
        auto mod = modifierForToken(text.substr(start, pos - start));
        if (!mod) {
            return false;
        }
        modifiers |= *mod;
        start = pos + 1;
    }
}

} // namespace

const char* toString(ModifierKeyConfig config) noexcept {
    switch (config) {
    case ModifierKeyConfig::ControlGroupOptionSticky: return "control_group_option_sticky";
    case ModifierKeyConfig::OptionGroupControlSticky: return "option_group_control_sticky";
    }
    return "control_group_option_sticky";
}

std::optional<ModifierKeyConfig> modifierKeyConfigFromString(std::string_view text) noexcept {
    if (text == "control_group_option_sticky") {
        return ModifierKeyConfig::ControlGroupOptionSticky;
    }
    if (text == "option_group_control_sticky") {
        return ModifierKeyConfig::OptionGroupControlSticky;
    }
    return std::nullopt;
}

bool ModifierPolicy::isSticky(std::uint32_t modifiers) const noexcept {
    switch (config_) {
    case ModifierKeyConfig::ControlGroupOptionSticky: return (modifiers & kModifierOption) != 0;
    case ModifierKeyConfig::OptionGroupControlSticky: return (modifiers & kModifierControl) != 0;
    }
    return false;
}

bool ModifierPolicy::isGroupRun(std::uint32_t modifiers) const noexcept {
    switch (config_) {
    case ModifierKeyConfig::ControlGroupOptionSticky: return (modifiers & kModifierControl) != 0;
    case ModifierKeyConfig::OptionGroupControlSticky: return (modifiers & kModifierOption) != 0;
    }
    return false;
}

std::optional<KeyEvent> parseKeyEvent(std::string_view text) {
    const std::string trimmed = trimCopy(text);
    if (trimmed.empty()) {
        // A lone space typed at the prompt is the space key.
        if (!text.empty() && text.find(' ') != std::string_view::npos) {
            return KeyEvent{keys::normalize("space"), 0};
        }
        return std::nullopt;
    }

    std::string key;
    std::uint32_t modifiers = 0;
    const std::size_t plus = trimmed.find('+');
    const char separator = plus != std::string::npos && plus + 1 < trimmed.size() ? '+' : '-';
    if (!splitTokens(trimmed, separator, key, modifiers)) {
        return std::nullopt;
    }
    if (keys::logicalLength(key) != 1) {
        return std::nullopt;
    }
    return KeyEvent{keys::normalize(key), modifiers};
}

std::string formatKeyEvent(const KeyEvent& event) {
    std::string out;
    if (event.has(kModifierControl)) out += "C-";
    if (event.has(kModifierOption)) out += "A-";
    if (event.has(kModifierShift)) out += "S-";
    if (event.has(kModifierCommand)) out += "M-";
    out += event.key;
    return out;
}

} // namespace lmenu::input
