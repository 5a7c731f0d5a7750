#include "model/ConfigTree.h"

#include <atomic>
#include <filesystem>

#include "services/keys/KeyMaps.h"
#include "services/logger/LogManager.h"

namespace lmenu {

namespace {

constexpr const char* kErrorSentinelKey = "🚫";
constexpr const char* kErrorSentinelLabel = "Config error";

std::string lastPathComponent(const std::string& value) {
    std::string trimmed = value;
    while (trimmed.size() > 1 && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    return std::filesystem::path(trimmed).filename().string();
}

std::string removeAll(std::string text, std::string_view needle) {
    if (needle.empty()) {
        return text;
    }
    std::size_t pos = 0;
    while ((pos = text.find(needle, pos)) != std::string::npos) {
        text.erase(pos, needle.size());
    }
    return text;
}

bool sameKey(const std::optional<std::string>& lhs, const std::optional<std::string>& rhs) {
    if (lhs.has_value() != rhs.has_value()) {
        return false;
    }
    if (!lhs) {
        return true;
    }
    return keys::toTextual(*lhs) == keys::toTextual(*rhs);
}

// Empty labels are never written, so they equal an absent label.
bool sameLabel(const std::optional<std::string>& lhs, const std::optional<std::string>& rhs) {
    const bool lhsEmpty = !lhs || lhs->empty();
    const bool rhsEmpty = !rhs || rhs->empty();
    if (lhsEmpty || rhsEmpty) {
        return lhsEmpty == rhsEmpty;
    }
    return *lhs == *rhs;
}

bool sameArguments(const std::optional<std::vector<ScriptArgument>>& lhs,
                   const std::optional<std::vector<ScriptArgument>>& rhs) {
    const bool lhsEmpty = !lhs || lhs->empty();
    const bool rhsEmpty = !rhs || rhs->empty();
    if (lhsEmpty || rhsEmpty) {
        return lhsEmpty == rhsEmpty;
    }
    return *lhs == *rhs;
}

void collectValues(const Group& group, const std::set<ActionType>& types, std::set<std::string>& out) {
    for (const auto& child : group.children) {
        if (const auto* action = child.action()) {
            if (types.count(action->type) != 0) {
                out.insert(action->value);
            }
        } else if (const auto* nested = child.group()) {
            collectValues(*nested, types, out);
        }
    }
}

} // namespace

const char* toString(ActionType type) noexcept {
    switch (type) {
    case ActionType::Application: return "application";
    case ActionType::Url: return "url";
    case ActionType::Command: return "command";
    case ActionType::Folder: return "folder";
    case ActionType::File: return "file";
    case ActionType::Script: return "script";
    }
    return "application";
}

std::optional<ActionType> actionTypeFromString(std::string_view text) noexcept {
    if (text == "application") return ActionType::Application;
    if (text == "url") return ActionType::Url;
    if (text == "command") return ActionType::Command;
    if (text == "folder") return ActionType::Folder;
    if (text == "file") return ActionType::File;
    if (text == "script") return ActionType::Script;
    return std::nullopt;
}

NodeId nextNodeId() noexcept {
    static std::atomic<NodeId> counter{1};
    return counter.fetch_add(1, std::memory_order_relaxed);
}

std::string Action::displayName() const {
    if (!label || label->empty()) {
        return bestGuessDisplayName();
    }
    return *label;
}

std::string Action::bestGuessDisplayName() const {
    switch (type) {
    case ActionType::Application:
        return removeAll(lastPathComponent(value), ".app");
    case ActionType::Command: {
        const auto space = value.find(' ');
        return space == std::string::npos ? value : value.substr(0, space);
    }
    case ActionType::Folder:
    case ActionType::File:
        return lastPathComponent(value);
    case ActionType::Script:
        return removeAll(lastPathComponent(value), ".sh");
    case ActionType::Url:
        return "URL";
    }
    return value;
}

std::string Group::displayName() const {
    if (!label || label->empty()) {
        return "Group";
    }
    return *label;
}

Node::Node(Action action) : value_(std::move(action)) {}
Node::Node(Group group) : value_(std::move(group)) {}

bool Node::isAction() const noexcept { return std::holds_alternative<Action>(value_); }
bool Node::isGroup() const noexcept { return std::holds_alternative<Group>(value_); }

const Action* Node::action() const noexcept { return std::get_if<Action>(&value_); }
Action* Node::action() noexcept { return std::get_if<Action>(&value_); }
const Group* Node::group() const noexcept { return std::get_if<Group>(&value_); }
Group* Node::group() noexcept { return std::get_if<Group>(&value_); }

const std::optional<std::string>& Node::key() const noexcept {
    return std::visit([](const auto& item) -> const std::optional<std::string>& { return item.key; }, value_);
}

const std::optional<std::string>& Node::label() const noexcept {
    return std::visit([](const auto& item) -> const std::optional<std::string>& { return item.label; }, value_);
}

NodeId Node::uiid() const noexcept {
    return std::visit([](const auto& item) { return item.uiid; }, value_);
}

std::string Node::displayName() const {
    return std::visit([](const auto& item) { return item.displayName(); }, value_);
}

bool operator==(const Action& lhs, const Action& rhs) {
    return sameKey(lhs.key, rhs.key) && lhs.type == rhs.type && sameLabel(lhs.label, rhs.label) &&
           lhs.value == rhs.value && lhs.iconPath == rhs.iconPath && lhs.openWith == rhs.openWith &&
           sameArguments(lhs.arguments, rhs.arguments);
}

bool operator==(const Group& lhs, const Group& rhs) {
    return sameKey(lhs.key, rhs.key) && sameLabel(lhs.label, rhs.label) && lhs.iconPath == rhs.iconPath &&
           lhs.children == rhs.children;
}

bool operator==(const Node& lhs, const Node& rhs) {
    if (const auto* a = lhs.action()) {
        const auto* b = rhs.action();
        return b != nullptr && *a == *b;
    }
    const auto* b = rhs.group();
    return b != nullptr && *lhs.group() == *b;
}

bool sameLogicalGroup(const Group& lhs, const Group& rhs) {
    if (lhs.key != rhs.key) {
        return false;
    }
    if (lhs.label != rhs.label) {
        return false;
    }
    if (!lhs.key && !lhs.label) {
        logging::LogManager::warn("Matching groups with neither key nor label; first match in child order is used");
    }
    return true;
}

void forEachActionDepthFirst(const Group& group, const std::function<void(const Action&)>& fn) {
    for (const auto& child : group.children) {
        if (const auto* action = child.action()) {
            fn(*action);
        } else if (const auto* nested = child.group()) {
            forEachActionDepthFirst(*nested, fn);
        }
    }
}

std::set<std::string> collectActionValues(const Group& root, const std::set<ActionType>& types) {
    std::set<std::string> values;
    collectValues(root, types, values);
    return values;
}

Group makeErrorSentinel() {
    Group group;
    group.key = kErrorSentinelKey;
    group.label = kErrorSentinelLabel;
    return group;
}

bool isErrorSentinel(const Group& group) {
    return group.key == std::optional<std::string>{kErrorSentinelKey} &&
           group.label == std::optional<std::string>{kErrorSentinelLabel} && group.children.empty();
}

} // namespace lmenu
