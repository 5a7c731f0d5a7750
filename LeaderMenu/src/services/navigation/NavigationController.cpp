#include "services/navigation/NavigationController.h"

#include "services/alerts/AlertHandler.h"
#include "services/dispatch/DispatchSink.h"
#include "services/keys/KeyMaps.h"
#include "services/logger/LogManager.h"
#include "services/navigation/MenuPresenter.h"
#include "services/persistence/ConfigStore.h"

namespace lmenu {

namespace {

bool isKey(const std::string& typed, std::string_view name) {
    return keys::normalize(typed) == keys::normalize(name);
}

} // namespace

const char* toString(KeyOutcome outcome) noexcept {
    switch (outcome) {
    case KeyOutcome::Preview: return "preview";
    case KeyOutcome::RanAction: return "ran_action";
    case KeyOutcome::RanActionStayOpen: return "ran_action_stay_open";
    case KeyOutcome::RanGroup: return "ran_group";
    case KeyOutcome::Descended: return "descended";
    case KeyOutcome::NotFound: return "not_found";
    case KeyOutcome::Cheatsheet: return "cheatsheet";
    case KeyOutcome::Navigated: return "navigated";
    case KeyOutcome::Cleared: return "cleared";
    case KeyOutcome::Hidden: return "hidden";
    case KeyOutcome::Ignored: return "ignored";
    }
    return "unknown";
}

NavigationController::NavigationController(ConfigStore& store, DispatchSink& dispatch, MenuPresenter& presenter,
                                           AlertHandler& alerts, input::ModifierPolicy policy)
    : store_(store),
      dispatch_(dispatch),
      presenter_(presenter),
      alerts_(alerts),
      policy_(policy),
      state_(&store) {
    reloadSubscription_ = store_.subscribe(StoreEvent::DidReload, [this]() {
        state_.clear();
        state_.isShowingRefreshState = true;
        refreshPresenter();
    });
}

NavigationController::~NavigationController() {
    store_.unsubscribe(reloadSubscription_);
}

void NavigationController::show() {
    visible_ = true;
    presenter_.show(state_);
}

void NavigationController::hide() {
    presenter_.hide();
    visible_ = false;
    state_.clear();
}

void NavigationController::clear() {
    state_.clear();
    refreshPresenter();
}

void NavigationController::refreshPresenter() {
    if (visible_) {
        presenter_.refresh(state_);
    }
}

KeyOutcome NavigationController::keyDown(const input::KeyEvent& event, bool execute) {
    if (event.has(input::kModifierCommand) && (event.key == "w" || event.key == "W")) {
        hide();
        return KeyOutcome::Hidden;
    }
    if (isKey(event.key, "backspace")) {
        clear();
        return KeyOutcome::Cleared;
    }
    if (isKey(event.key, "escape")) {
        hide();
        return KeyOutcome::Hidden;
    }
    if (isKey(event.key, "down") || isKey(event.key, "space")) {
        return moveSelection(1);
    }
    if (isKey(event.key, "up")) {
        return moveSelection(-1);
    }
    if (isKey(event.key, "enter")) {
        if (!state_.selectedIndex) {
            return KeyOutcome::Ignored;
        }
        return executeSelected();
    }
    if (isKey(event.key, "right")) {
        return enterSelectedGroup();
    }
    if (isKey(event.key, "left")) {
        return goBack();
    }
    return handleKey(event.key, event.modifiers, execute);
}

KeyOutcome NavigationController::handleKey(const std::string& key, std::uint32_t modifiers, bool execute) {
    if (key == "?") {
        presenter_.showCheatsheet(state_);
        return KeyOutcome::Cheatsheet;
    }

    std::optional<Node> hit;
    if (const Group* group = state_.currentGroup()) {
        for (const auto& child : group->children) {
            if (child.key() && keys::matches(*child.key(), key)) {
                hit = child;
                break;
            }
        }
    }

    if (!hit) {
        logging::LogManager::debug("No item for key '{}'", key);
        presenter_.notFound(key);
        return KeyOutcome::NotFound;
    }

    if (const Action* action = hit->action()) {
        if (!execute) {
            return KeyOutcome::Preview;
        }
        if (policy_.isSticky(modifiers)) {
            dispatch_.runAction(*action);
            return KeyOutcome::RanActionStayOpen;
        }
        runAndClose(*action);
        return KeyOutcome::RanAction;
    }

    const Group& group = *hit->group();
    if (execute && policy_.isGroupRun(modifiers)) {
        runGroupAndClose(group);
        return KeyOutcome::RanGroup;
    }
    enterGroup(group);
    return KeyOutcome::Descended;
}

KeyOutcome NavigationController::executeSelected() {
    auto item = state_.selectedItem();
    if (!item) {
        return KeyOutcome::Ignored;
    }
    if (const Action* action = item->action()) {
        runAndClose(*action);
        return KeyOutcome::RanAction;
    }
    enterGroup(*item->group());
    return KeyOutcome::Descended;
}

KeyOutcome NavigationController::enterSelectedGroup() {
    auto item = state_.selectedItem();
    if (!item || !item->isGroup()) {
        return KeyOutcome::Ignored;
    }
    enterGroup(*item->group());
    return KeyOutcome::Descended;
}

KeyOutcome NavigationController::goBack() {
    if (!state_.goBack()) {
        return KeyOutcome::Ignored;
    }
    refreshPresenter();
    return KeyOutcome::Navigated;
}

KeyOutcome NavigationController::moveSelection(int delta) {
    if (state_.currentActionCount() == 0) {
        return KeyOutcome::Ignored;
    }
    state_.moveSelection(delta);
    refreshPresenter();
    return KeyOutcome::Navigated;
}

void NavigationController::enterGroup(const Group& group) {
    state_.display = group.key;
    state_.navigateToGroup(group);
    refreshPresenter();
}

void NavigationController::runAndClose(const Action& action) {
    const Action copy = action;
    hide();
    dispatch_.runAction(copy);
}

void NavigationController::runGroupAndClose(const Group& group) {
    const Group copy = group;
    hide();
    dispatch_.runGroupRecursively(copy);
}

std::optional<std::size_t> NavigationController::selectedRow() const {
    if (!state_.selectedIndex || *state_.selectedIndex < 0) {
        return std::nullopt;
    }
    return static_cast<std::size_t>(*state_.selectedIndex);
}

bool NavigationController::addAction(Action action) {
    const treepath::GroupPath path = state_.currentPath();
    const std::optional<Node> selected = state_.selectedItem();
    const auto row = selectedRow();

    return store_.edit([&](Group& root) {
        bool placed = false;
        if (selected && selected->isGroup()) {
            treepath::GroupPath into = path;
            into.push_back(treepath::GroupMatcher::from(*selected->group()));
            placed = treepath::appendChild(root, into, Node(action));
        } else if (selected) {
            placed = treepath::insertAfter(root, path, *selected, Node(action), row);
        } else {
            placed = treepath::appendChild(root, path, Node(action));
        }
        if (!placed) {
            logging::LogManager::warn("Could not place '{}' at the current location; adding it to the root",
                                      action.displayName());
            root.children.emplace_back(action);
        }
    });
}

bool NavigationController::deleteSelectedItem() {
    const std::optional<Node> selected = state_.selectedItem();
    if (!selected) {
        return false;
    }
    const treepath::GroupPath path = state_.currentPath();
    const auto row = selectedRow();
    bool removed = false;
    store_.edit([&](Group& root) { removed = treepath::removeChild(root, path, *selected, row); });
    if (!removed) {
        alerts_.showAlert(AlertStyle::Warning, "Could not delete " + selected->displayName(),
                          "The item is no longer in the configuration.");
        return false;
    }

    const auto count = static_cast<int>(state_.currentActionCount());
    if (count == 0) {
        state_.selectedIndex.reset();
    } else if (state_.selectedIndex && *state_.selectedIndex >= count) {
        state_.selectedIndex = count - 1;
    }
    refreshPresenter();
    return true;
}

} // namespace lmenu
