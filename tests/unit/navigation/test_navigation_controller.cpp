#include <catch2/catch_test_macros.hpp>
#include "services/navigation/NavigationController.h"
#include "test_helpers.h"

using namespace lmenu;
using lmenu::input::KeyEvent;
using lmenu::test::make_action;
using lmenu::test::make_group;

namespace {
struct ControllerFixture : test::StoreFixture {
    explicit ControllerFixture(const std::string& name)
        : test::StoreFixture(name), controller(*store, dispatch, presenter, alerts) {
        loadTree(test::sample_tree());
        controller.show();
    }

    KeyOutcome press(const std::string& key, std::uint32_t modifiers = 0, bool execute = true) {
        return controller.keyDown(KeyEvent{key, modifiers}, execute);
    }

    test::RecordingDispatchSink dispatch;
    test::RecordingPresenter presenter;
    NavigationController controller;
};
}

TEST_CASE("typing a key runs the action and closes", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_run");
    REQUIRE(f.press("a") == KeyOutcome::RanAction);
    REQUIRE(f.dispatch.values() == std::vector<std::string>{"/Applications/App1.app"});
    REQUIRE_FALSE(f.controller.isVisible());
    REQUIRE(f.presenter.hides == 1);
    REQUIRE(f.controller.state().navigationPath.empty());
}

TEST_CASE("typing a group key descends into it", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_descend");
    REQUIRE(f.press("c") == KeyOutcome::Descended);
    REQUIRE(f.controller.state().display == std::optional<std::string>("c"));
    REQUIRE(f.controller.state().navigationPath.size() == 1);
    REQUIRE(f.controller.state().currentActionCount() == 2);

    REQUIRE(f.press("e") == KeyOutcome::RanAction);
    REQUIRE(f.dispatch.values() == std::vector<std::string>{"/Applications/App4.app"});
}

TEST_CASE("unknown keys are reported without side effects", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_notfound");
    REQUIRE(f.press("z") == KeyOutcome::NotFound);
    REQUIRE(f.presenter.lastNotFound == "z");
    REQUIRE(f.dispatch.actions.empty());
    REQUIRE(f.controller.isVisible());

    // Keys of nested items are not visible from the root.
    REQUIRE(f.press("d") == KeyOutcome::NotFound);
}

TEST_CASE("question mark opens the cheatsheet", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_cheatsheet");
    REQUIRE(f.press("?") == KeyOutcome::Cheatsheet);
    REQUIRE(f.presenter.cheatsheets == 1);
}

TEST_CASE("the sticky modifier keeps the menu open", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_sticky");
    REQUIRE(f.press("a", input::kModifierOption) == KeyOutcome::RanActionStayOpen);
    REQUIRE(f.controller.isVisible());
    REQUIRE(f.press("b", input::kModifierOption) == KeyOutcome::RanActionStayOpen);
    REQUIRE(f.dispatch.values() == std::vector<std::string>{"/Applications/App1.app", "/Applications/App2.app"});
}

TEST_CASE("the group modifier runs every action in the group", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_group_run");
    REQUIRE(f.press("c", input::kModifierControl) == KeyOutcome::RanGroup);
    REQUIRE(f.dispatch.groupRuns == 1);
    REQUIRE(f.dispatch.values() == std::vector<std::string>{"/Applications/App3.app", "/Applications/App4.app"});
    REQUIRE_FALSE(f.controller.isVisible());
}

TEST_CASE("the group modifier on an action runs just that action", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_group_mod_action");
    REQUIRE(f.press("a", input::kModifierControl) == KeyOutcome::RanAction);
    REQUIRE(f.dispatch.groupRuns == 0);
}

TEST_CASE("swapped modifier layout swaps the roles", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_swapped");
    f.controller.policy().setConfig(input::ModifierKeyConfig::OptionGroupControlSticky);
    REQUIRE(f.press("a", input::kModifierControl) == KeyOutcome::RanActionStayOpen);
    REQUIRE(f.press("c", input::kModifierOption) == KeyOutcome::RanGroup);
}

TEST_CASE("preview mode matches without running", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_preview");
    REQUIRE(f.press("a", 0, false) == KeyOutcome::Preview);
    REQUIRE(f.dispatch.actions.empty());
    REQUIRE(f.controller.isVisible());
    // Groups are still entered.
    REQUIRE(f.press("c", input::kModifierControl, false) == KeyOutcome::Descended);
}

TEST_CASE("arrow keys move the selection and enter runs it", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_arrows");
    REQUIRE(f.press("↵") == KeyOutcome::Ignored);
    REQUIRE(f.press("↓") == KeyOutcome::Navigated);
    REQUIRE(f.press("↓") == KeyOutcome::Navigated);
    REQUIRE(f.controller.state().selectedIndex == std::optional<int>(1));
    REQUIRE(f.press("↑") == KeyOutcome::Navigated);
    REQUIRE(f.press("␣") == KeyOutcome::Navigated);
    REQUIRE(f.controller.state().selectedIndex == std::optional<int>(1));
    REQUIRE(f.press("↵") == KeyOutcome::RanAction);
    REQUIRE(f.dispatch.values() == std::vector<std::string>{"/Applications/App2.app"});
}

TEST_CASE("right enters the selected group and left returns", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_right_left");
    REQUIRE(f.press("→") == KeyOutcome::Ignored);
    f.controller.state().selectedIndex = 0;
    REQUIRE(f.press("→") == KeyOutcome::Ignored);
    f.controller.state().selectedIndex = 2;
    REQUIRE(f.press("→") == KeyOutcome::Descended);
    REQUIRE(f.controller.state().navigationPath.size() == 1);
    REQUIRE(f.press("←") == KeyOutcome::Navigated);
    REQUIRE(f.controller.state().navigationPath.empty());
    REQUIRE(f.controller.state().selectedIndex == std::optional<int>(2));
    REQUIRE(f.press("←") == KeyOutcome::Ignored);
}

TEST_CASE("escape and cmd+w hide, backspace clears", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_escape");
    f.press("c");
    REQUIRE(f.press("⌫") == KeyOutcome::Cleared);
    REQUIRE(f.controller.state().navigationPath.empty());
    REQUIRE(f.controller.isVisible());

    REQUIRE(f.press("⎋") == KeyOutcome::Hidden);
    REQUIRE_FALSE(f.controller.isVisible());

    f.controller.show();
    REQUIRE(f.press("w", input::kModifierCommand) == KeyOutcome::Hidden);
    REQUIRE_FALSE(f.controller.isVisible());
}

TEST_CASE("adding without a selection appends to the current group", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_add_append");
    f.press("c");
    REQUIRE(f.controller.addAction(make_action("f", "/Applications/App5.app")));
    const Group& sub = *f.store->root().children[2].group();
    REQUIRE(sub.children.size() == 3);
    REQUIRE(sub.children[2].action()->value == "/Applications/App5.app");

    f.store->waitForIdle();
    auto onDisk = codec::decodeTree(test::read_text(f.configPath()));
    REQUIRE(onDisk.has_value());
    REQUIRE(*onDisk == f.store->root());
}

TEST_CASE("adding with a group selected adds into that group", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_add_into");
    f.controller.state().selectedIndex = 2;
    REQUIRE(f.controller.addAction(make_action("f", "/f")));
    REQUIRE(f.store->root().children.size() == 3);
    REQUIRE(f.store->root().children[2].group()->children.size() == 3);
}

TEST_CASE("adding with an action selected inserts after it", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_add_after");
    f.controller.state().selectedIndex = 0;
    REQUIRE(f.controller.addAction(make_action("f", "/f")));
    REQUIRE(f.store->root().children.size() == 4);
    REQUIRE(f.store->root().children[1].key() == std::optional<std::string>("f"));
}

TEST_CASE("adding under a stale path falls back to the root", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_add_stale");
    f.press("c");
    REQUIRE(f.store->replaceRoot(make_group(std::nullopt, std::nullopt, {make_action("a", "/a")})));
    REQUIRE(f.controller.addAction(make_action("f", "/f")));
    REQUIRE(f.store->root().children.size() == 2);
    REQUIRE(f.store->root().children[1].key() == std::optional<std::string>("f"));
}

TEST_CASE("keys under a stale path act on the root level", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_key_stale");
    f.press("c");
    REQUIRE(f.store->replaceRoot(make_group(std::nullopt, std::nullopt, {make_action("a", "/a")})));

    // "d" only existed inside the removed group.
    REQUIRE(f.press("d") == KeyOutcome::NotFound);
    REQUIRE(f.dispatch.actions.empty());
    REQUIRE(f.press("a") == KeyOutcome::RanAction);
    REQUIRE(f.dispatch.values() == std::vector<std::string>{"/a"});
}

TEST_CASE("deleting the selection removes it and clamps", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_delete");
    REQUIRE_FALSE(f.controller.deleteSelectedItem());

    f.controller.state().selectedIndex = 2;
    REQUIRE(f.controller.deleteSelectedItem());
    REQUIRE(f.store->root().children.size() == 2);
    REQUIRE(f.controller.state().selectedIndex == std::optional<int>(1));
}

TEST_CASE("deleting an item that vanished reports it", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_delete_stale");
    f.press("c");
    f.controller.state().selectedIndex = 0;
    REQUIRE(f.store->replaceRoot(make_group(std::nullopt, std::nullopt, {make_action("a", "/a")})));
    REQUIRE_FALSE(f.controller.deleteSelectedItem());
    REQUIRE(f.alerts.count(AlertStyle::Warning) == 1);
    REQUIRE(f.store->root().children.size() == 1);
}

TEST_CASE("duplicate rows are edited at the selected position", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_duplicates");
    REQUIRE(f.store->replaceRoot(make_group(std::nullopt, std::nullopt, {
        make_action("x", "/x"),
        make_action("m", "/m"),
        make_action("x", "/x"),
    })));

    f.controller.state().selectedIndex = 2;
    REQUIRE(f.controller.addAction(make_action("y", "/y")));
    REQUIRE(f.store->root().children.size() == 4);
    REQUIRE(f.store->root().children[3].key() == std::optional<std::string>("y"));

    REQUIRE(f.controller.deleteSelectedItem());
    const auto& rows = f.store->root().children;
    REQUIRE(rows.size() == 3);
    REQUIRE(rows[0].key() == std::optional<std::string>("x"));
    REQUIRE(rows[1].key() == std::optional<std::string>("m"));
    REQUIRE(rows[2].key() == std::optional<std::string>("y"));
}

TEST_CASE("duplicate rows decoded from disk are deleted at the selected position", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_duplicates_reloaded");
    f.loadTree(make_group(std::nullopt, std::nullopt, {
        make_action("x", "/x"),
        make_action("m", "/m"),
        make_action("x", "/x"),
    }));
    f.controller.state().selectedIndex = 2;
    REQUIRE(f.controller.deleteSelectedItem());
    const auto& rows = f.store->root().children;
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0].key() == std::optional<std::string>("x"));
    REQUIRE(rows[1].key() == std::optional<std::string>("m"));
}

TEST_CASE("a reload from file resets navigation", "[navigation][controller]") {
    ControllerFixture f("lmenu_nav_reload");
    f.press("c");
    f.controller.state().selectedIndex = 1;
    const int refreshesBefore = f.presenter.refreshes;

    f.store->reloadFromFile();
    f.store->waitForIdle();

    REQUIRE(f.controller.state().navigationPath.empty());
    REQUIRE_FALSE(f.controller.state().selectedIndex.has_value());
    REQUIRE(f.controller.state().isShowingRefreshState);
    REQUIRE(f.presenter.refreshes > refreshesBefore);
}

TEST_CASE("outcomes have stable names", "[navigation][controller]") {
    REQUIRE(std::string(toString(KeyOutcome::RanGroup)) == "ran_group");
    REQUIRE(std::string(toString(KeyOutcome::NotFound)) == "not_found");
}
