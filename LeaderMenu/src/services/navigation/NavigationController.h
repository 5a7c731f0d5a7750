#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "model/ConfigTree.h"
#include "services/navigation/ModifierPolicy.h"
#include "services/navigation/NavigationState.h"

namespace lmenu {

class ConfigStore;
class DispatchSink;
class MenuPresenter;
class AlertHandler;

enum class KeyOutcome {
    Preview,            // matched an action, not executed
    RanAction,          // ran an action and closed
    RanActionStayOpen,  // sticky modifier held
    RanGroup,           // group-run modifier held
    Descended,
    NotFound,
    Cheatsheet,
    Navigated,          // selection or level changed by a navigation key
    Cleared,
    Hidden,
    Ignored,
};

const char* toString(KeyOutcome outcome) noexcept;

// Turns key events into navigation, dispatch and tree edits. Edits always go
// through ConfigStore::edit against the current canonical tree.
class NavigationController {
public:
    NavigationController(ConfigStore& store, DispatchSink& dispatch, MenuPresenter& presenter,
                         AlertHandler& alerts, input::ModifierPolicy policy = input::ModifierPolicy{});
    ~NavigationController();

    NavigationController(const NavigationController&) = delete;
    NavigationController& operator=(const NavigationController&) = delete;

    void show();
    void hide();
    [[nodiscard]] bool isVisible() const noexcept { return visible_; }

    // Maps navigation keys (arrows, enter, escape, backspace, space) before
    // falling through to handleKey. With execute false matched actions are only
    // previewed.
    KeyOutcome keyDown(const input::KeyEvent& event, bool execute = true);

    // Looks `key` up among the current level's children; first match wins.
    KeyOutcome handleKey(const std::string& key, std::uint32_t modifiers = 0, bool execute = true);

    KeyOutcome executeSelected();
    KeyOutcome enterSelectedGroup();
    KeyOutcome goBack();
    KeyOutcome moveSelection(int delta);
    void clear();

    // Adds `action` relative to the selection: into the selected group,
    // after the selected action, or at the end of the current group. Falls
    // back to the root when the current path no longer resolves.
    bool addAction(Action action);
    // Removes the selected row from the current group. Reports an alert and
    // leaves the tree unchanged when the row cannot be found.
    bool deleteSelectedItem();

    [[nodiscard]] NavigationState& state() noexcept { return state_; }
    [[nodiscard]] const NavigationState& state() const noexcept { return state_; }
    [[nodiscard]] input::ModifierPolicy& policy() noexcept { return policy_; }

private:
    void enterGroup(const Group& group);
    void runAndClose(const Action& action);
    void runGroupAndClose(const Group& group);
    void refreshPresenter();
    [[nodiscard]] std::optional<std::size_t> selectedRow() const;

    ConfigStore& store_;
    DispatchSink& dispatch_;
    MenuPresenter& presenter_;
    AlertHandler& alerts_;
    input::ModifierPolicy policy_;
    NavigationState state_;
    bool visible_{false};
    int reloadSubscription_{0};
};

} // namespace lmenu
