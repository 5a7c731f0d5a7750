#include "services/navigation/NavigationState.h"

#include "services/persistence/ConfigStore.h"

namespace lmenu {

const Group* NavigationState::currentGroup() const {
    if (!provider_) {
        return navigationPath.empty() ? nullptr : &navigationPath.back();
    }
    const Group& root = provider_->root();
    if (navigationPath.empty()) {
        return &root;
    }
    if (const Group* resolved = treepath::resolveGroup(root, currentPath())) {
        return resolved;
    }
    return &root;
}

std::vector<Node> NavigationState::currentActions() const {
    const Group* group = currentGroup();
    if (!group) {
        return {};
    }
    return group->children;
}

std::size_t NavigationState::currentActionCount() const {
    const Group* group = currentGroup();
    return group ? group->children.size() : 0;
}

std::optional<Node> NavigationState::selectedItem() const {
    if (!selectedIndex || *selectedIndex < 0) {
        return std::nullopt;
    }
    const Group* group = currentGroup();
    if (!group || static_cast<std::size_t>(*selectedIndex) >= group->children.size()) {
        return std::nullopt;
    }
    return group->children[static_cast<std::size_t>(*selectedIndex)];
}

void NavigationState::navigateToGroup(const Group& group) {
    selectionHistory.push_back(selectedIndex);
    navigationPath.push_back(group);
    selectedIndex.reset();
}

bool NavigationState::goBack() {
    if (navigationPath.empty()) {
        return false;
    }
    navigationPath.pop_back();
    if (!selectionHistory.empty()) {
        selectedIndex = selectionHistory.back();
        selectionHistory.pop_back();
    } else {
        selectedIndex.reset();
    }
    display = navigationPath.empty() ? std::nullopt : navigationPath.back().key;
    return true;
}

void NavigationState::moveSelection(int delta) {
    const auto count = static_cast<int>(currentActionCount());
    if (count == 0) {
        return;
    }
    if (!selectedIndex || *selectedIndex < 0 || *selectedIndex >= count) {
        if (delta == 0) {
            return;
        }
        selectedIndex = delta > 0 ? 0 : count - 1;
        return;
    }
    selectedIndex = ((*selectedIndex + delta) % count + count) % count;
}

void NavigationState::clear() {
    display.reset();
    isShowingRefreshState = false;
    navigationPath.clear();
    selectedIndex.reset();
    selectionHistory.clear();
}

} // namespace lmenu
