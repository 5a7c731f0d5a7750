#include "paths.h"
#include <cstdlib>
#include <filesystem>

namespace lmenu::paths {
namespace {
#ifdef LMENU_INTERNAL_TESTING
	static std::string g_test_settings_path;
	static std::string g_test_default_dir;
#endif

	std::filesystem::path config_home() {
		if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
			return std::filesystem::path(xdg);
		}
		if (const char* home = std::getenv("HOME"); home && *home) {
			return std::filesystem::path(home) / ".config";
		}
		std::error_code ec;
		std::filesystem::path cwd = std::filesystem::current_path(ec);
		return ec ? std::filesystem::path(".") : cwd;
	}
}

#ifdef LMENU_INTERNAL_TESTING
void lmenu_set_settings_path_for_tests(const std::string& p) { g_test_settings_path = p; }
void lmenu_set_default_config_dir_for_tests(const std::string& dir) { g_test_default_dir = dir; }
#endif

std::string defaultConfigDirectory() {
#ifdef LMENU_INTERNAL_TESTING
	if (!g_test_default_dir.empty()) return g_test_default_dir;
#endif
	return (config_home() / "leadermenu").string();
}

std::string settingsFilePath() {
#ifdef LMENU_INTERNAL_TESTING
	if (!g_test_settings_path.empty()) return g_test_settings_path;
#endif
	if (const char* dir = std::getenv("LMENU_SETTINGS_DIR"); dir && *dir) {
		std::filesystem::path p(dir);
		std::error_code ec; std::filesystem::create_directories(p, ec);
		return (p / "settings.json").string();
	}
	return (config_home() / "leadermenu" / "settings.json").string();
}

std::string configFileIn(const std::string& directory) {
	return (std::filesystem::path(directory) / kConfigFileName).string();
}
}
