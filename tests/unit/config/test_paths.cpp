#include <catch2/catch_test_macros.hpp>
#include "services/configuration/paths.h"
#include "test_helpers.h"

#include <filesystem>

TEST_CASE("default config directory follows XDG_CONFIG_HOME", "[config][paths]") {
    const char* previous = std::getenv("XDG_CONFIG_HOME");
    const std::string saved = previous ? previous : "";

    lmenu::test::set_env("XDG_CONFIG_HOME", "/tmp/lmenu-xdg");
    REQUIRE(lmenu::paths::defaultConfigDirectory() == (std::filesystem::path("/tmp/lmenu-xdg") / "leadermenu").string());

    if (previous) {
        lmenu::test::set_env("XDG_CONFIG_HOME", saved.c_str());
    } else {
        unsetenv("XDG_CONFIG_HOME");
    }
}

TEST_CASE("settings directory override is created on demand", "[config][paths]") {
    lmenu::test::TempDir dir("lmenu_paths_settings");
    const auto nested = (dir / "nested").string();
    lmenu::test::set_env("LMENU_SETTINGS_DIR", nested.c_str());
    REQUIRE(lmenu::paths::settingsFilePath() == (std::filesystem::path(nested) / "settings.json").string());
    REQUIRE(std::filesystem::is_directory(nested));
}

TEST_CASE("test hooks override both locations", "[config][paths]") {
    lmenu::paths::lmenu_set_default_config_dir_for_tests("/tmp/lmenu-hook-dir");
    lmenu::paths::lmenu_set_settings_path_for_tests("/tmp/lmenu-hook-dir/s.json");
    REQUIRE(lmenu::paths::defaultConfigDirectory() == "/tmp/lmenu-hook-dir");
    REQUIRE(lmenu::paths::settingsFilePath() == "/tmp/lmenu-hook-dir/s.json");
    lmenu::paths::lmenu_set_default_config_dir_for_tests("");
    lmenu::paths::lmenu_set_settings_path_for_tests("");
}

TEST_CASE("config file lives inside its directory", "[config][paths]") {
    REQUIRE(lmenu::paths::configFileIn("/srv/menus") == (std::filesystem::path("/srv/menus") / "config.json").string());
}
