#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lmenu {

enum class ActionType {
    Application,
    Url,
    Command,
    Folder,
    File,
    Script,
};

const char* toString(ActionType type) noexcept;
std::optional<ActionType> actionTypeFromString(std::string_view text) noexcept;

// Process-local identity used to follow a row across edits. Never persisted and
// never part of equality.
using NodeId = std::uint64_t;
NodeId nextNodeId() noexcept;

struct ScriptArgument {
    std::string name;
    std::optional<std::string> defaultValue;

    bool operator==(const ScriptArgument&) const = default;
};

struct Action {
    NodeId uiid{nextNodeId()};

    std::optional<std::string> key;
    ActionType type{ActionType::Application};
    std::optional<std::string> label;
    std::string value;                 // path, URL or command text
    std::optional<std::string> iconPath;
    std::optional<std::string> openWith;   // app used instead of the default handler
    std::optional<std::vector<ScriptArgument>> arguments;

    [[nodiscard]] std::string displayName() const;
    [[nodiscard]] std::string bestGuessDisplayName() const;
};

class Node;

struct Group {
    NodeId uiid{nextNodeId()};

    std::optional<std::string> key;
    std::optional<std::string> label;
    std::optional<std::string> iconPath;
    std::vector<Node> children;

    [[nodiscard]] std::string displayName() const;
};

// Action or Group. Copies keep the uiid of the original.
class Node {
public:
    Node(Action action);
    Node(Group group);

    [[nodiscard]] bool isAction() const noexcept;
    [[nodiscard]] bool isGroup() const noexcept;

    [[nodiscard]] const Action* action() const noexcept;
    [[nodiscard]] Action* action() noexcept;
    [[nodiscard]] const Group* group() const noexcept;
    [[nodiscard]] Group* group() noexcept;

    [[nodiscard]] const std::optional<std::string>& key() const noexcept;
    [[nodiscard]] const std::optional<std::string>& label() const noexcept;
    [[nodiscard]] NodeId uiid() const noexcept;
    [[nodiscard]] std::string displayName() const;

private:
    std::variant<Action, Group> value_;
};

// Structural equality over persisted fields. Keys compare in textual form so
// "enter" and its glyph are the same key.
bool operator==(const Action& lhs, const Action& rhs);
bool operator==(const Group& lhs, const Group& rhs);
bool operator==(const Node& lhs, const Node& rhs);

// Two groups are the same logical node when key and label agree (both absent
// included). A match with neither key nor label is ambiguous and is logged.
bool sameLogicalGroup(const Group& lhs, const Group& rhs);

// Depth-first, child order, nested groups included.
void forEachActionDepthFirst(const Group& group, const std::function<void(const Action&)>& fn);

std::set<std::string> collectActionValues(const Group& root, const std::set<ActionType>& types);

// Root shown when the config file could not be decoded.
Group makeErrorSentinel();
bool isErrorSentinel(const Group& group);

} // namespace lmenu
