#pragma once
// Shared fixtures and recording doubles for LeaderMenu tests.

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "model/ConfigTree.h"
#include "model/TreeCodec.h"
#include "services/alerts/AlertHandler.h"
#include "services/dispatch/DispatchSink.h"
#include "services/navigation/MenuPresenter.h"
#include "services/persistence/ConfigStore.h"
#include "services/persistence/ConflictPrompt.h"
#include "services/persistence/MainThreadQueue.h"

namespace lmenu::test {

inline void set_env(const char* k, const char* v) {
#if defined(_WIN32)
    _putenv_s(k, v);
#else
    setenv(k, v, 1);
#endif
}

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& name) {
        namespace fs = std::filesystem;
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                (name + "_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
                 std::to_string(counter++));
        std::error_code ec;
        fs::remove_all(path_, ec);
        fs::create_directories(path_, ec);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }
    std::filesystem::path operator/(const std::string& child) const { return path_ / child; }

private:
    std::filesystem::path path_;
};

inline std::string read_text(const std::filesystem::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

inline void write_text(const std::filesystem::path& p, const std::string& text) {
    std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
    ofs << text;
}

inline std::size_t count_temp_files(const std::filesystem::path& dir) {
    std::size_t count = 0;
    for (auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().filename().string().find(".tmp") != std::string::npos) ++count;
    }
    return count;
}

struct RecordedAlert {
    AlertStyle style;
    std::string message;
    std::string informativeText;
};

class RecordingAlertHandler : public AlertHandler {
public:
    void showAlert(AlertStyle style, const std::string& message, const std::string& informativeText = {}) override {
        alerts.push_back({style, message, informativeText});
    }
    std::size_t count(AlertStyle style) const {
        std::size_t n = 0;
        for (const auto& a : alerts) {
            if (a.style == style) ++n;
        }
        return n;
    }
    std::vector<RecordedAlert> alerts;
};

// Answers from a script; Cancel once the script runs out.
class ScriptedConflictPrompt : public ConflictPrompt {
public:
    ConflictResolution askOverwriteCancelReload() override {
        ++asked;
        if (onAsk) onAsk();
        if (answers.empty()) return ConflictResolution::Cancel;
        auto answer = answers.front();
        answers.pop_front();
        return answer;
    }
    std::deque<ConflictResolution> answers;
    std::function<void()> onAsk;
    int asked = 0;
};

class RecordingDispatchSink : public DispatchSink {
public:
    void runAction(const Action& action) override { actions.push_back(action); }
    void runGroupRecursively(const Group& group) override {
        ++groupRuns;
        DispatchSink::runGroupRecursively(group);
    }
    std::vector<std::string> values() const {
        std::vector<std::string> out;
        for (const auto& a : actions) out.push_back(a.value);
        return out;
    }
    std::vector<Action> actions;
    int groupRuns = 0;
};

class RecordingPresenter : public MenuPresenter {
public:
    void show(const NavigationState&) override { ++shows; }
    void hide() override { ++hides; }
    void notFound(const std::string& key) override {
        ++notFounds;
        lastNotFound = key;
    }
    void showCheatsheet(const NavigationState&) override { ++cheatsheets; }
    void refresh(const NavigationState&) override { ++refreshes; }

    int shows = 0;
    int hides = 0;
    int notFounds = 0;
    int cheatsheets = 0;
    int refreshes = 0;
    std::string lastNotFound;
};

inline Action make_action(const std::string& key, const std::string& value,
                          ActionType type = ActionType::Application,
                          std::optional<std::string> label = std::nullopt) {
    Action action;
    action.key = key;
    action.type = type;
    action.value = value;
    action.label = std::move(label);
    return action;
}

inline Group make_group(std::optional<std::string> key, std::optional<std::string> label, std::vector<Node> children) {
    Group group;
    group.key = std::move(key);
    group.label = std::move(label);
    group.children = std::move(children);
    return group;
}

// a -> App1, b -> App2, c "Subgroup" { d -> App3, e -> App4 }
inline Group sample_tree() {
    return make_group(std::nullopt, std::nullopt, {
        make_action("a", "/Applications/App1.app"),
        make_action("b", "/Applications/App2.app"),
        make_group("c", std::string("Subgroup"), {
            make_action("d", "/Applications/App3.app"),
            make_action("e", "/Applications/App4.app"),
        }),
    });
}

// Store over a private temp directory.
struct StoreFixture {
    explicit StoreFixture(const std::string& name, std::chrono::milliseconds debounce = std::chrono::milliseconds(30))
        : dir(name) {
        ConfigStore::Options options;
        options.directory = dir.str();
        options.fallbackDirectory = (dir / "fallback").string();
        options.debounce = debounce;
        options.onDirectoryReset = [this](const std::string& d) { resetTo = d; };
        store = std::make_unique<ConfigStore>(std::move(options), alerts, prompt, mainQueue);
    }

    std::filesystem::path configPath() const { return std::filesystem::path(store->filePath()); }

    // Writes `root` as the config file and loads it synchronously.
    void loadTree(const Group& root) {
        write_text(configPath(), codec::encodeTree(root));
        store->load();
        store->waitForIdle();
    }

    TempDir dir;
    MainThreadQueue mainQueue;
    RecordingAlertHandler alerts;
    ScriptedConflictPrompt prompt;
    std::string resetTo;
    std::unique_ptr<ConfigStore> store;
};

} // namespace lmenu::test
