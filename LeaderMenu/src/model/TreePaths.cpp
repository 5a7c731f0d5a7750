#include "model/TreePaths.h"

#include "services/logger/LogManager.h"

namespace lmenu::treepath {

namespace {

std::string describe(const GroupMatcher& matcher) {
    return "key=" + matcher.key.value_or("nil") + ", label=" + matcher.label.value_or("nil");
}

template <typename GroupT>
GroupT* resolveImpl(GroupT& root, const GroupPath& path) {
    GroupT* current = &root;
    for (const auto& segment : path) {
        GroupT* next = nullptr;
        for (auto& child : current->children) {
            auto* group = child.group();
            if (group && segment.matches(*group)) {
                next = group;
                break;
            }
        }
        if (!next) {
            logging::LogManager::warn("Group in navigation path not found ({}); path may be stale", describe(segment));
            return nullptr;
        }
        current = next;
    }
    return current;
}

} // namespace

GroupMatcher GroupMatcher::from(const Group& group) {
    return GroupMatcher{group.key, group.label};
}

bool GroupMatcher::matches(const Group& group) const {
    Group probe;
    probe.key = key;
    probe.label = label;
    return sameLogicalGroup(group, probe);
}

GroupPath pathFor(const std::vector<Group>& navigationPath) {
    GroupPath path;
    path.reserve(navigationPath.size());
    for (const auto& group : navigationPath) {
        path.push_back(GroupMatcher::from(group));
    }
    return path;
}

const Group* resolveGroup(const Group& root, const GroupPath& path) {
    return resolveImpl(root, path);
}

Group* resolveGroup(Group& root, const GroupPath& path) {
    return resolveImpl(root, path);
}

std::optional<std::size_t> findChild(const Group& group, const Node& node, std::optional<std::size_t> indexHint) {
    const auto& children = group.children;
    const bool hintInRange = indexHint && *indexHint < children.size();
    // A copied row shares its uiid with the original, so the hint wins ties.
    if (hintInRange && children[*indexHint].uiid() == node.uiid()) {
        return indexHint;
    }
    for (std::size_t i = 0; i < children.size(); ++i) {
        if (children[i].uiid() == node.uiid()) {
            return i;
        }
    }
    if (hintInRange && children[*indexHint] == node) {
        return indexHint;
    }
    for (std::size_t i = 0; i < children.size(); ++i) {
        if (children[i] == node) {
            return i;
        }
    }
    return std::nullopt;
}

bool appendChild(Group& root, const GroupPath& path, Node child) {
    Group* target = resolveGroup(root, path);
    if (!target) {
        return false;
    }
    target->children.push_back(std::move(child));
    return true;
}

bool insertAfter(Group& root, const GroupPath& path, const Node& sibling, Node child,
                 std::optional<std::size_t> indexHint) {
    Group* target = resolveGroup(root, path);
    if (!target) {
        return false;
    }
    auto index = findChild(*target, sibling, indexHint);
    if (!index) {
        return false;
    }
    target->children.insert(target->children.begin() + static_cast<std::ptrdiff_t>(*index + 1), std::move(child));
    return true;
}

bool removeChild(Group& root, const GroupPath& path, const Node& child, std::optional<std::size_t> indexHint) {
    Group* target = resolveGroup(root, path);
    if (!target) {
        return false;
    }
    auto index = findChild(*target, child, indexHint);
    if (!index) {
        return false;
    }
    target->children.erase(target->children.begin() + static_cast<std::ptrdiff_t>(*index));
    return true;
}

bool replaceChild(Group& root, const GroupPath& path, const Node& existing, Node replacement,
                  std::optional<std::size_t> indexHint) {
    Group* target = resolveGroup(root, path);
    if (!target) {
        return false;
    }
    auto index = findChild(*target, existing, indexHint);
    if (!index) {
        return false;
    }
    target->children[*index] = std::move(replacement);
    return true;
}

} // namespace lmenu::treepath
