#include "SettingsManager.h"
#include "paths.h"
#include "services/logger/LogManager.h"
#include "services/persistence/file_io.h"
#include <nlohmann/json.hpp>
using nlohmann::json;
#include <filesystem>
#include <cstdlib>
#include <string_view>
#include <cctype>
#include <mutex>
#include <map>
#include <stdexcept>

#if !defined(_WIN32)
extern "C" char **environ;
#endif

namespace lmenu {
namespace {
	static constexpr int kCurrentSettingsVersion = 1;

	json& cfg() {
		static json c;
		return c;
	}

	std::mutex& mtx() {
		static std::mutex m;
		return m;
	}

	std::map<int, std::function<void()>>& subscribers() {
		static std::map<int, std::function<void()>> subs;
		return subs;
	}

	int& next_sub_id() {
		static int id = 1;
		return id;
	}

	// Navigate JSON by dotted path; returns pointer if found else nullptr
	const json* get_by_path(const json& j, const std::string& path) {
		const json* cur = &j;
		size_t start = 0;
		while (start <= path.size()) {
			size_t dot = path.find('.', start);
			std::string key = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
			if (!cur->is_object()) return nullptr;
			auto it = cur->find(key);
			if (it == cur->end()) return nullptr;
			if (dot == std::string::npos) {
				return &(*it);
			}
			cur = &(*it);
			start = dot + 1;
		}
		return nullptr;
	}

	// Ensure objects exist along path and return reference to leaf slot
	json& ensure_json_path(json& j, const std::string& path) {
		json* cur = &j;
		size_t start = 0;
		while (start <= path.size()) {
			size_t dot = path.find('.', start);
			std::string key = path.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
			if (!cur->is_object()) {
				*cur = json::object();
			}
			cur = &((*cur)[key]);
			if (dot == std::string::npos) break;
			start = dot + 1;
		}
		return *cur;
	}

	bool starts_with(std::string_view s, std::string_view pfx) {
		return s.size() >= pfx.size() && 0 == s.compare(0, pfx.size(), pfx);
	}

	std::string lower(std::string_view s) {
		std::string out(s);
		for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
		return out;
	}

	bool is_integer(const std::string& v) {
		if (v.empty()) return false;
		size_t i = (v[0] == '-' || v[0] == '+') ? 1 : 0;
		if (i == v.size()) return false;
		for (; i < v.size(); ++i) {
			if (!std::isdigit(static_cast<unsigned char>(v[i]))) return false;
		}
		return true;
	}

	json parse_env_value(const std::string& v) {
		const std::string l = lower(v);
		if (l == "true" || l == "yes" || l == "on") return json(true);
		if (l == "false" || l == "no" || l == "off") return json(false);
		if (is_integer(v)) {
			try { return json(std::stoll(v)); } catch (const std::out_of_range&) {}
		}
		return json(v);
	}

	std::string map_env_key_to_config_key(std::string_view key) {
		// Double underscores become '.', everything else is lowercased
		std::string out;
		out.reserve(key.size());
		for (size_t i = 0; i < key.size(); ++i) {
			if (key[i] == '_' && i + 1 < key.size() && key[i + 1] == '_') {
				out.push_back('.');
				++i;
			} else {
				out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(key[i]))));
			}
		}
		return out;
	}

	size_t apply_env_overrides(json& j) {
#if defined(_WIN32)
		char** envp = _environ;
#else
		char** envp = environ;
#endif
		if (!envp) return 0;
		const std::string prefix = "LMENU_";
		size_t count = 0;
		for (char** e = envp; *e; ++e) {
			std::string_view entry(*e);
			size_t eq = entry.find('=');
			if (eq == std::string_view::npos) continue;
			std::string_view name = entry.substr(0, eq);
			std::string_view value = entry.substr(eq + 1);
			if (!starts_with(name, prefix)) continue;
			std::string_view suffix = name.substr(prefix.size());
			// Control vars like LMENU_SETTINGS_DIR have no section separator
			if (suffix.find("__") == std::string_view::npos) continue;
			ensure_json_path(j, map_env_key_to_config_key(suffix)) = parse_env_value(std::string(value));
			++count;
		}
		return count;
	}

	void backup_corrupt(const std::string& path) {
		std::error_code ec;
		std::filesystem::path p(path);
		if (!std::filesystem::exists(p, ec)) return;
		std::filesystem::path bak = p;
		bak += ".bak";
		std::filesystem::remove(bak, ec);
		ec.clear();
		std::filesystem::rename(p, bak, ec);
		if (ec) {
			logging::LogManager::warn("Could not back up unreadable settings {}: {}", path, ec.message());
		} else {
			logging::LogManager::warn("Settings file {} was unreadable; moved to {}", path, bak.string());
		}
	}

	void fill_defaults(json& c) {
		auto set_default = [&](const std::string& key, json value) {
			if (!get_by_path(c, key)) ensure_json_path(c, key) = std::move(value);
		};
		set_default("version", kCurrentSettingsVersion);
		set_default("general.config_dir", paths::defaultConfigDirectory());
		set_default("input.modifier_keys", "control_group_option_sticky");
		set_default("persistence.save_debounce_ms", 300);
		set_default("logging.level", "info");
		set_default("dispatch.opener", "xdg-open");
	}
}

void SettingsManager::loadOrDefault() {
	json& c = cfg();
	c = json::object();
	fill_defaults(c);
	size_t overrides = apply_env_overrides(c);
	if (overrides > 0) {
		logging::LogManager::debug("Applied {} settings override(s) from environment", overrides);
	}
}

bool SettingsManager::load() {
	auto path = paths::settingsFilePath();
	auto bytes = fileio::readFile(path);
	if (!bytes) {
		loadOrDefault();
		return false;
	}
	json j = json::parse(*bytes, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		backup_corrupt(path);
		loadOrDefault();
		return false;
	}
	if (const json* v = get_by_path(j, "version"); v && v->is_number_integer() && v->get<int>() > kCurrentSettingsVersion) {
		logging::LogManager::warn("Settings version {} is newer than supported; using defaults", v->get<int>());
		loadOrDefault();
		return false;
	}
	fill_defaults(j);
	cfg() = std::move(j);
	apply_env_overrides(cfg());
	return true;
}

bool SettingsManager::save() {
	auto path = paths::settingsFilePath();
	std::string error;
	bool ok = fileio::writeFileAtomic(path, cfg().dump(2), &error);
	if (!ok) {
		logging::LogManager::error("Failed to save settings: {}", error);
		return false;
	}
	std::map<int, std::function<void()>> copy;
	{
		std::lock_guard<std::mutex> lock(mtx());
		copy = subscribers();
	}
	for (auto& [id, cb] : copy) {
		if (cb) cb();
	}
	return true;
}

bool SettingsManager::getBool(const std::string& key, bool defaultValue) {
	const json* v = get_by_path(cfg(), key);
	if (v && v->is_boolean()) return v->get<bool>();
	return defaultValue;
}

int64_t SettingsManager::getInt(const std::string& key, int64_t defaultValue) {
	const json* v = get_by_path(cfg(), key);
	if (v && (v->is_number_integer() || v->is_number_unsigned())) return v->get<int64_t>();
	return defaultValue;
}

std::string SettingsManager::getString(const std::string& key, const std::string& defaultValue) {
	const json* v = get_by_path(cfg(), key);
	if (v && v->is_string()) return v->get<std::string>();
	return defaultValue;
}

void SettingsManager::set(const std::string& key, bool value) { ensure_json_path(cfg(), key) = value; }
void SettingsManager::set(const std::string& key, int64_t value) { ensure_json_path(cfg(), key) = value; }
void SettingsManager::set(const std::string& key, const std::string& value) { ensure_json_path(cfg(), key) = value; }
void SettingsManager::set(const std::string& key, const char* value) { ensure_json_path(cfg(), key) = std::string(value ? value : ""); }

int SettingsManager::subscribeOnChange(const std::function<void()>& cb) {
	std::lock_guard<std::mutex> lock(mtx());
	int id = next_sub_id()++;
	subscribers()[id] = cb;
	return id;
}

void SettingsManager::unsubscribe(int id) {
	std::lock_guard<std::mutex> lock(mtx());
	subscribers().erase(id);
}

std::string SettingsManager::exportCompact() {
	return cfg().dump();
}

const json& SettingsManager::raw() {
	return cfg();
}

std::string SettingsManager::configDirectory() {
	return getString("general.config_dir", paths::defaultConfigDirectory());
}

void SettingsManager::setConfigDirectory(const std::string& dir) {
	set("general.config_dir", dir);
}

std::string SettingsManager::modifierKeys() {
	return getString("input.modifier_keys", "control_group_option_sticky");
}

int64_t SettingsManager::saveDebounceMs() {
	int64_t ms = getInt("persistence.save_debounce_ms", 300);
	return ms < 0 ? 0 : ms;
}

std::string SettingsManager::logLevel() {
	return getString("logging.level", "info");
}

std::string SettingsManager::opener() {
	return getString("dispatch.opener", "xdg-open");
}
}
