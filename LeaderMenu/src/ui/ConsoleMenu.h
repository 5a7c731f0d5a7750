#pragma once

#include <chrono>
#include <iosfwd>
#include <string>
#include <vector>

#include "services/navigation/MenuPresenter.h"
#include "services/persistence/ConflictPrompt.h"

namespace lmenu {

class ConfigStore;
class ConsoleInput;
class MainThreadQueue;
class NavigationController;

// Prints the current level as a list of "key  name" rows.
class ConsolePresenter : public MenuPresenter {
public:
    explicit ConsolePresenter(std::ostream& out) : out_(out) {}

    void show(const NavigationState& state) override;
    void hide() override;
    void notFound(const std::string& key) override;
    void showCheatsheet(const NavigationState& state) override;
    void refresh(const NavigationState& state) override;

private:
    void render(const NavigationState& state, bool withValues);

    std::ostream& out_;
};

// Asks the three-way question on the terminal.
class ConsoleConflictPrompt : public ConflictPrompt {
public:
    ConsoleConflictPrompt(ConsoleInput& in, std::ostream& out) : in_(in), out_(out) {}

    ConflictResolution askOverwriteCancelReload() override;

private:
    ConsoleInput& in_;
    std::ostream& out_;
};

// Line-oriented driver: one key token or ':' command per line.
class ConsoleSession {
public:
    ConsoleSession(ConfigStore& store, NavigationController& controller, MainThreadQueue& mainQueue,
                   std::ostream& out, bool preview = false);

    // Returns false once the session should end.
    bool handleLine(const std::string& line);

    // Handles lines from `input` until :quit or end of input. Between lines the
    // main queue is serviced every `idlePoll`, so debounced saves and reload
    // results land without waiting for the next keystroke.
    void run(ConsoleInput& input, std::chrono::milliseconds idlePoll = std::chrono::milliseconds(20));

    static std::vector<std::string> tokenize(const std::string& line);

private:
    bool handleCommand(const std::vector<std::string>& tokens, const std::string& line);
    void addFromCommand(const std::vector<std::string>& tokens);
    void printErrors();
    void printLog();
    void printHelp();

    ConfigStore& store_;
    NavigationController& controller_;
    MainThreadQueue& main_;
    std::ostream& out_;
    bool preview_;
};

} // namespace lmenu
