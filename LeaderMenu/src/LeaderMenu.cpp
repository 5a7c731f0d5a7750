// LeaderMenu.cpp : Defines the entry point for the application.
//

#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#include "services/alerts/AlertHandler.h"
#include "services/configuration/SettingsManager.h"
#include "services/configuration/paths.h"
#include "services/dispatch/DispatchSink.h"
#include "services/logger/LogManager.h"
#include "services/navigation/ModifierPolicy.h"
#include "services/navigation/NavigationController.h"
#include "services/persistence/ConfigStore.h"
#include "services/persistence/MainThreadQueue.h"
#include "ui/ConsoleInput.h"
#include "ui/ConsoleMenu.h"

namespace {

struct CommandLineOptions {
    std::string configDir;
    bool preview = false;
    bool help = false;
};

bool parseArgs(int argc, char** argv, CommandLineOptions& out) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "--config-dir") {
            if (i + 1 >= argc) {
                std::cerr << "--config-dir needs a directory\n";
                return false;
            }
            out.configDir = argv[++i];
        } else if (arg == "--preview") {
            out.preview = true;
        } else if (arg == "-h" || arg == "--help") {
            out.help = true;
        } else {
            std::cerr << "unknown argument: " << arg << '\n';
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv)
{
    CommandLineOptions options;
    if (!parseArgs(argc, argv, options)) {
        return 2;
    }
    if (options.help) {
        std::cout << "usage: leadermenu [--config-dir DIR] [--preview]\n";
        return 0;
    }

    lmenu::logging::LogManager::init({"LeaderMenu", lmenu::logging::Level::info, "[%H:%M:%S] [%^%l%$] %v"});
    if (!lmenu::SettingsManager::load()) {
        lmenu::logging::LogManager::warn("Settings file missing or invalid; using defaults");
    }
    lmenu::logging::LogManager::reconfigure({"LeaderMenu",
                                             lmenu::logging::level_from_name(lmenu::SettingsManager::logLevel()),
                                             "[%H:%M:%S] [%^%l%$] %v"});
    lmenu::logging::LogManager::info("Starting LeaderMenu");

    auto modifierConfig = lmenu::input::modifierKeyConfigFromString(lmenu::SettingsManager::modifierKeys());
    if (!modifierConfig) {
        lmenu::logging::LogManager::warn("Unknown input.modifier_keys '{}'; using control_group_option_sticky",
                                         lmenu::SettingsManager::modifierKeys());
        modifierConfig = lmenu::input::ModifierKeyConfig::ControlGroupOptionSticky;
    }

    lmenu::MainThreadQueue mainQueue;
    lmenu::LoggingAlertHandler alerts;
    auto input = std::make_shared<lmenu::ConsoleInput>();
    lmenu::ConsoleConflictPrompt prompt(*input, std::cout);

    lmenu::ConfigStore::Options storeOptions;
    storeOptions.directory = options.configDir.empty() ? lmenu::SettingsManager::configDirectory() : options.configDir;
    storeOptions.fallbackDirectory = lmenu::paths::defaultConfigDirectory();
    storeOptions.debounce = std::chrono::milliseconds(lmenu::SettingsManager::saveDebounceMs());
    storeOptions.onDirectoryReset = [](const std::string& dir) {
        lmenu::SettingsManager::setConfigDirectory(dir);
        if (!lmenu::SettingsManager::save()) {
            lmenu::logging::LogManager::warn("Could not persist reset config directory");
        }
    };

    lmenu::ConfigStore store(std::move(storeOptions), alerts, prompt, mainQueue);
    store.ensureAndLoad();
    store.waitForIdle();

    lmenu::ShellDispatchSink dispatch(lmenu::dispatch::launchContextFromEnvironment(lmenu::SettingsManager::opener()), alerts);
    lmenu::ConsolePresenter presenter(std::cout);
    lmenu::NavigationController controller(store, dispatch, presenter, alerts, lmenu::input::ModifierPolicy(*modifierConfig));
    lmenu::ConsoleSession session(store, controller, mainQueue, std::cout, options.preview);

    controller.show();
    lmenu::ConsoleInput::startReader(input, std::cin);
    session.run(*input);

    // Flush a pending debounced save before exit.
    store.waitForIdle();
    lmenu::logging::LogManager::info("Exiting LeaderMenu");
    lmenu::logging::LogManager::shutdown();
    return 0;
}
