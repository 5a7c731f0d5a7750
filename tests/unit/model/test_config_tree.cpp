#include <catch2/catch_test_macros.hpp>
#include "model/ConfigTree.h"
#include "services/logger/LogManager.h"
#include "test_helpers.h"

using namespace lmenu;
using lmenu::test::make_action;
using lmenu::test::make_group;

TEST_CASE("equality ignores transient identity", "[model]") {
    Action a = make_action("a", "/usr/bin/app");
    Action b = make_action("a", "/usr/bin/app");
    REQUIRE(a.uiid != b.uiid);
    REQUIRE(a == b);

    Group g1 = make_group("g", std::string("G"), {a});
    Group g2 = make_group("g", std::string("G"), {b});
    REQUIRE(g1 == g2);
}

TEST_CASE("equality is deep over persisted fields", "[model]") {
    Action a = make_action("a", "/usr/bin/app");
    Action b = a;
    b.openWith = "/usr/bin/other";
    REQUIRE_FALSE(a == b);

    Group g1 = make_group("g", std::nullopt, {make_group("n", std::nullopt, {a})});
    Group g2 = make_group("g", std::nullopt, {make_group("n", std::nullopt, {make_action("a", "/usr/bin/changed")})});
    REQUIRE_FALSE(g1 == g2);

    // Child order is significant.
    Group ordered = make_group(std::nullopt, std::nullopt, {make_action("x", "1"), make_action("y", "2")});
    Group swapped = make_group(std::nullopt, std::nullopt, {make_action("y", "2"), make_action("x", "1")});
    REQUIRE_FALSE(ordered == swapped);
}

TEST_CASE("empty label and empty arguments equal absent ones", "[model]") {
    Action a = make_action("a", "v", ActionType::Script);
    Action b = a;
    b.label = std::string();
    b.arguments = std::vector<ScriptArgument>{};
    REQUIRE(a == b);
}

TEST_CASE("special keys compare by name or glyph", "[model]") {
    Action a = make_action("enter", "v");
    Action b = make_action("↵", "v");
    REQUIRE(a == b);
}

TEST_CASE("copies keep the identity of the original", "[model]") {
    Node node(make_action("a", "v"));
    Node copy = node;
    REQUIRE(copy.uiid() == node.uiid());
}

TEST_CASE("display names fall back to the value", "[model]") {
    REQUIRE(make_action("a", "/Applications/Safari.app").displayName() == "Safari");
    REQUIRE(make_action("a", "open -a Mail", ActionType::Command).displayName() == "open");
    REQUIRE(make_action("a", "/home/me/docs/", ActionType::Folder).displayName() == "docs");
    REQUIRE(make_action("a", "/home/me/bin/deploy.sh", ActionType::Script).displayName() == "deploy");
    REQUIRE(make_action("a", "https://example.com", ActionType::Url).displayName() == "URL");
    REQUIRE(make_action("a", "https://example.com", ActionType::Url, std::string("Example")).displayName() == "Example");
    REQUIRE(make_group("g", std::nullopt, {}).displayName() == "Group");
    REQUIRE(make_group("g", std::string("Web"), {}).displayName() == "Web");
}

TEST_CASE("action types round-trip through their names", "[model]") {
    for (auto type : {ActionType::Application, ActionType::Url, ActionType::Command,
                      ActionType::Folder, ActionType::File, ActionType::Script}) {
        auto parsed = actionTypeFromString(toString(type));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == type);
    }
    REQUIRE_FALSE(actionTypeFromString("group").has_value());
    REQUIRE_FALSE(actionTypeFromString("Application").has_value());
}

TEST_CASE("depth-first traversal visits nested groups in child order", "[model]") {
    Group root = make_group(std::nullopt, std::nullopt, {
        make_action("a", "1"),
        make_group("g", std::nullopt, {make_action("b", "2"), make_group("h", std::nullopt, {make_action("c", "3")})}),
        make_action("d", "4"),
    });
    std::vector<std::string> seen;
    forEachActionDepthFirst(root, [&](const Action& a) { seen.push_back(a.value); });
    REQUIRE(seen == std::vector<std::string>{"1", "2", "3", "4"});
}

TEST_CASE("collectActionValues filters by type across the tree", "[model]") {
    Group root = make_group(std::nullopt, std::nullopt, {
        make_action("a", "/usr/bin/a"),
        make_action("u", "https://x", ActionType::Url),
        make_group("g", std::nullopt, {make_action("b", "/usr/bin/b"), make_action("a", "/usr/bin/a")}),
    });
    auto apps = collectActionValues(root, {ActionType::Application});
    REQUIRE(apps == std::set<std::string>{"/usr/bin/a", "/usr/bin/b"});
    auto urls = collectActionValues(root, {ActionType::Url, ActionType::File});
    REQUIRE(urls == std::set<std::string>{"https://x"});
}

TEST_CASE("error sentinel is recognised", "[model]") {
    Group sentinel = makeErrorSentinel();
    REQUIRE(isErrorSentinel(sentinel));
    REQUIRE(sentinel.label == std::optional<std::string>("Config error"));
    REQUIRE_FALSE(isErrorSentinel(test::sample_tree()));
}

TEST_CASE("same logical group requires equal key and label", "[model]") {
    REQUIRE(sameLogicalGroup(make_group("g", std::string("G"), {}), make_group("g", std::string("G"), {make_action("x", "1")})));
    REQUIRE_FALSE(sameLogicalGroup(make_group("g", std::string("G"), {}), make_group("g", std::string("H"), {})));
    REQUIRE_FALSE(sameLogicalGroup(make_group("g", std::nullopt, {}), make_group("g", std::string("G"), {})));
}

TEST_CASE("matching groups with neither key nor label is flagged as ambiguous", "[model]") {
    logging::clear_log_buffer();
    REQUIRE(sameLogicalGroup(make_group(std::nullopt, std::nullopt, {}), make_group(std::nullopt, std::nullopt, {})));
    bool warned = false;
    for (const auto& line : logging::read_log_lines_snapshot()) {
        if (line.level == logging::Level::warn && line.text.find("neither key nor label") != std::string::npos) {
            warned = true;
        }
    }
    REQUIRE(warned);
}
