#pragma once

#include <optional>
#include <string>
#include <vector>

#include "model/ConfigTree.h"
#include "model/TreePaths.h"

namespace lmenu {

class TreeProvider;

// Where the user is in the menu: the groups descended into, the highlighted
// row and the rows highlighted at each parent level.
//
// Group snapshots in navigationPath are only used as (key, label) matchers;
// every read resolves them against the provider's current tree.
class NavigationState {
public:
    explicit NavigationState(const TreeProvider* provider = nullptr) noexcept : provider_(provider) {}

    void setProvider(const TreeProvider* provider) noexcept { provider_ = provider; }

    // Last group on the path resolved in the current tree. The root when the
    // path is empty or went stale (resolution logs the stale segment). Without
    // a provider the stored snapshot is used; nullptr when there is none.
    [[nodiscard]] const Group* currentGroup() const;
    [[nodiscard]] std::vector<Node> currentActions() const;
    [[nodiscard]] std::size_t currentActionCount() const;
    [[nodiscard]] std::optional<Node> selectedItem() const;

    [[nodiscard]] treepath::GroupPath currentPath() const { return treepath::pathFor(navigationPath); }

    void navigateToGroup(const Group& group);
    bool goBack();
    void moveSelection(int delta);
    void clear();

    std::optional<std::string> display;
    bool isShowingRefreshState{false};
    std::vector<Group> navigationPath;
    std::optional<int> selectedIndex;
    std::vector<std::optional<int>> selectionHistory;

private:
    const TreeProvider* provider_;
};

} // namespace lmenu
