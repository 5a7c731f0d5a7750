#pragma once
#include <string>
#include <cstdint>
#include <functional>
#include <nlohmann/json_fwd.hpp>

namespace lmenu {

// Application preferences (settings.json). Separate from the menu tree file,
// which lives inside general.config_dir.
class SettingsManager {
public:
    static void loadOrDefault();
    static bool load();
    static bool save();

    static bool getBool(const std::string& key, bool defaultValue);
    static int64_t getInt(const std::string& key, int64_t defaultValue);
    static std::string getString(const std::string& key, const std::string& defaultValue);

    static void set(const std::string& key, bool value);
    static void set(const std::string& key, int64_t value);
    static void set(const std::string& key, const std::string& value);
    static void set(const std::string& key, const char* value);

    // Called after a successful save(). Returns subscription id.
    static int subscribeOnChange(const std::function<void()>& cb);
    static void unsubscribe(int id);

    static std::string exportCompact();
    [[nodiscard]] static const nlohmann::json& raw();

    // Typed accessors for the keys the application reads.
    static std::string configDirectory();
    static void setConfigDirectory(const std::string& dir);
    static std::string modifierKeys();
    static int64_t saveDebounceMs();
    static std::string logLevel();
    static std::string opener();
};
}
