#pragma once
#include <string>

namespace lmenu::paths {

// Name of the menu tree file inside the config directory.
inline constexpr const char* kConfigFileName = "config.json";

// ~/.config/leadermenu (XDG_CONFIG_HOME respected).
std::string defaultConfigDirectory();

// settings.json location; LMENU_SETTINGS_DIR overrides the default directory.
std::string settingsFilePath();

std::string configFileIn(const std::string& directory);

#ifdef LMENU_INTERNAL_TESTING
void lmenu_set_settings_path_for_tests(const std::string& p);
void lmenu_set_default_config_dir_for_tests(const std::string& dir);
#endif
}
