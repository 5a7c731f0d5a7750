#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lmenu::input {

constexpr std::uint32_t kModifierControl = 1u << 0;
constexpr std::uint32_t kModifierShift   = 1u << 1;
constexpr std::uint32_t kModifierOption  = 1u << 2; // Alt
constexpr std::uint32_t kModifierCommand = 1u << 3; // Super

// Which physical modifier means "run whole group" and which means "stay open".
enum class ModifierKeyConfig {
    ControlGroupOptionSticky,
    OptionGroupControlSticky,
};

const char* toString(ModifierKeyConfig config) noexcept;
std::optional<ModifierKeyConfig> modifierKeyConfigFromString(std::string_view text) noexcept;

class ModifierPolicy {
public:
    explicit ModifierPolicy(ModifierKeyConfig config = ModifierKeyConfig::ControlGroupOptionSticky) noexcept
        : config_(config) {}

    [[nodiscard]] bool isSticky(std::uint32_t modifiers) const noexcept;
    [[nodiscard]] bool isGroupRun(std::uint32_t modifiers) const noexcept;

    [[nodiscard]] ModifierKeyConfig config() const noexcept { return config_; }
    void setConfig(ModifierKeyConfig config) noexcept { config_ = config; }

private:
    ModifierKeyConfig config_;
};

// A logical key press: the key in display form (glyph for special keys) plus
// modifier bits.
struct KeyEvent {
    std::string key;
    std::uint32_t modifiers{0};

    [[nodiscard]] bool has(std::uint32_t modifier) const noexcept { return (modifiers & modifier) != 0; }
};

// Parses "a", "enter", "C-a", "A-x", "ctrl+shift+a", "cmd+w".
// std::nullopt when no key or more than one key is named.
std::optional<KeyEvent> parseKeyEvent(std::string_view text);

std::string formatKeyEvent(const KeyEvent& event);

} // namespace lmenu::input
