#include <catch2/catch_test_macros.hpp>
#include "services/configuration/SettingsManager.h"
#include "test_helpers.h"

#include <filesystem>

TEST_CASE("corrupt settings fall back to defaults and keep a bak", "[config]") {
    namespace fs = std::filesystem;
    lmenu::test::TempDir dir("lmenu_settings_corrupt");
    lmenu::test::set_env("LMENU_SETTINGS_DIR", dir.str().c_str());
    lmenu::test::write_text(dir / "settings.json", "{ this is not valid json ");

    REQUIRE_FALSE(fs::exists(dir / "settings.json.bak"));
    REQUIRE_FALSE(lmenu::SettingsManager::load());
    REQUIRE(lmenu::SettingsManager::logLevel() == "info");
    REQUIRE(fs::exists(dir / "settings.json.bak"));
    REQUIRE(lmenu::test::read_text(dir / "settings.json.bak") == "{ this is not valid json ");
}

TEST_CASE("settings from a newer version are ignored", "[config]") {
    lmenu::test::TempDir dir("lmenu_settings_newer");
    lmenu::test::set_env("LMENU_SETTINGS_DIR", dir.str().c_str());
    lmenu::test::write_text(dir / "settings.json", R"({"version":99,"logging":{"level":"trace"}})");

    REQUIRE_FALSE(lmenu::SettingsManager::load());
    REQUIRE(lmenu::SettingsManager::logLevel() == "info");
    // The newer file is left for the newer version.
    REQUIRE(lmenu::test::read_text(dir / "settings.json").find("99") != std::string::npos);
}
