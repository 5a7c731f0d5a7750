#pragma once

#include <optional>
#include <string>
#include <vector>

#include "model/ConfigTree.h"

namespace lmenu::treepath {

// Identifies a group by (key, label) so a path survives the tree being
// replaced by a freshly decoded copy.
struct GroupMatcher {
    std::optional<std::string> key;
    std::optional<std::string> label;

    static GroupMatcher from(const Group& group);
    [[nodiscard]] bool matches(const Group& group) const;
};

using GroupPath = std::vector<GroupMatcher>;

GroupPath pathFor(const std::vector<Group>& navigationPath);

// nullptr when any segment no longer resolves. An empty path is the root.
const Group* resolveGroup(const Group& root, const GroupPath& path);
Group* resolveGroup(Group& root, const GroupPath& path);

// Locates `node` among the children of `group`: by uiid (preferring
// `indexHint`), then at `indexHint` when that child is structurally equal,
// then the first structural match. The structural steps only matter once the
// tree was decoded afresh.
std::optional<std::size_t> findChild(const Group& group, const Node& node,
                                     std::optional<std::size_t> indexHint = std::nullopt);

bool appendChild(Group& root, const GroupPath& path, Node child);
bool insertAfter(Group& root, const GroupPath& path, const Node& sibling, Node child,
                 std::optional<std::size_t> indexHint = std::nullopt);
bool removeChild(Group& root, const GroupPath& path, const Node& child,
                 std::optional<std::size_t> indexHint = std::nullopt);
bool replaceChild(Group& root, const GroupPath& path, const Node& existing, Node replacement,
                  std::optional<std::size_t> indexHint = std::nullopt);

} // namespace lmenu::treepath
