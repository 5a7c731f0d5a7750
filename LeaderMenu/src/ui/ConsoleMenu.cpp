#include "ui/ConsoleMenu.h"

#include <ostream>
#include <sstream>

#include "model/ConfigTree.h"
#include "services/keys/KeyMaps.h"
#include "services/logger/LogManager.h"
#include "services/navigation/NavigationController.h"
#include "services/navigation/NavigationState.h"
#include "services/persistence/ConfigStore.h"
#include "services/persistence/MainThreadQueue.h"
#include "services/validation/ConfigValidator.h"
#include "ui/ConsoleInput.h"

namespace lmenu {

// MARK: presenter

void ConsolePresenter::show(const NavigationState& state) {
    render(state, false);
}

void ConsolePresenter::hide() {
    out_ << "(menu closed)\n";
}

void ConsolePresenter::notFound(const std::string& key) {
    out_ << "no item for '" << key << "'\n";
}

void ConsolePresenter::showCheatsheet(const NavigationState& state) {
    render(state, true);
}

void ConsolePresenter::refresh(const NavigationState& state) {
    render(state, false);
}

void ConsolePresenter::render(const NavigationState& state, bool withValues) {
    if (state.isShowingRefreshState) {
        out_ << "(config reloaded)\n";
    }
    const Group* group = state.currentGroup();
    out_ << "[" << (group && !state.navigationPath.empty() ? group->displayName() : std::string("root")) << "]\n";
    if (!group) {
        return;
    }
    const auto selected = state.selectedIndex;
    for (std::size_t i = 0; i < group->children.size(); ++i) {
        const Node& node = group->children[i];
        const bool isSelected = selected && *selected == static_cast<int>(i);
        out_ << (isSelected ? "> " : "  ") << keys::normalize(node.key().value_or(" ")) << "  " << node.displayName();
        if (node.isGroup()) {
            out_ << " …";
        } else if (withValues) {
            out_ << "  (" << toString(node.action()->type) << ": " << node.action()->value << ")";
        }
        out_ << '\n';
    }
}

// MARK: conflict prompt

ConflictResolution ConsoleConflictPrompt::askOverwriteCancelReload() {
    out_ << "Configuration file changed on disk.\n"
         << "[o]verwrite, [c]ancel, [r]ead from file? " << std::flush;
    while (auto line = in_.next()) {
        const std::string& answer = *line;
        if (!answer.empty()) {
            switch (answer[0]) {
            case 'o': case 'O': return ConflictResolution::Overwrite;
            case 'c': case 'C': return ConflictResolution::Cancel;
            case 'r': case 'R': return ConflictResolution::Reload;
            default: break;
            }
        }
        out_ << "[o]verwrite, [c]ancel, [r]ead from file? " << std::flush;
    }
    // Input closed: never overwrite silently.
    return ConflictResolution::Cancel;
}

// MARK: session

ConsoleSession::ConsoleSession(ConfigStore& store, NavigationController& controller, MainThreadQueue& mainQueue,
                               std::ostream& out, bool preview)
    : store_(store), controller_(controller), main_(mainQueue), out_(out), preview_(preview) {}

std::vector<std::string> ConsoleSession::tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

bool ConsoleSession::handleLine(const std::string& line) {
    bool keepGoing = true;
    const auto tokens = tokenize(line);
    if (!tokens.empty() && tokens[0].size() > 1 && tokens[0][0] == ':') {
        keepGoing = handleCommand(tokens, line);
    } else if (auto event = input::parseKeyEvent(line)) {
        if (!controller_.isVisible()) {
            controller_.show();
        }
        const KeyOutcome outcome = controller_.keyDown(*event, !preview_);
        logging::LogManager::debug("{} -> {}", input::formatKeyEvent(*event), toString(outcome));
        if (outcome == KeyOutcome::Preview) {
            out_ << "would run '" << line << "'\n";
        }
    } else if (!line.empty()) {
        out_ << "not a key: '" << line << "' (try :help)\n";
    }
    main_.drain();
    return keepGoing;
}

void ConsoleSession::run(ConsoleInput& input, std::chrono::milliseconds idlePoll) {
    for (;;) {
        if (auto line = input.tryNext()) {
            if (!handleLine(*line)) {
                return;
            }
            continue;
        }
        if (input.exhausted()) {
            main_.drain();
            return;
        }
        main_.waitAndDrain(idlePoll);
    }
}

bool ConsoleSession::handleCommand(const std::vector<std::string>& tokens, const std::string& line) {
    const std::string& command = tokens[0];
    if (command == ":quit" || command == ":q") {
        return false;
    }
    if (command == ":help") {
        printHelp();
    } else if (command == ":up") {
        controller_.moveSelection(-1);
    } else if (command == ":down") {
        controller_.moveSelection(1);
    } else if (command == ":enter") {
        controller_.executeSelected();
    } else if (command == ":back") {
        controller_.goBack();
    } else if (command == ":clear") {
        controller_.clear();
    } else if (command == ":show") {
        controller_.show();
    } else if (command == ":reload") {
        store_.reloadFromFile();
    } else if (command == ":save") {
        out_ << "save: " << toString(store_.save()) << '\n';
    } else if (command == ":errors") {
        printErrors();
    } else if (command == ":log") {
        printLog();
    } else if (command == ":add") {
        addFromCommand(tokens);
    } else if (command == ":delete") {
        if (!controller_.deleteSelectedItem()) {
            out_ << "nothing deleted\n";
        }
    } else {
        out_ << "unknown command '" << line << "' (try :help)\n";
    }
    return true;
}

void ConsoleSession::addFromCommand(const std::vector<std::string>& tokens) {
    if (tokens.size() < 4) {
        out_ << "usage: :add KEY TYPE VALUE [LABEL]\n";
        return;
    }
    auto type = actionTypeFromString(tokens[2]);
    if (!type) {
        out_ << "unknown action type '" << tokens[2] << "'\n";
        return;
    }
    Action action;
    action.key = keys::normalize(tokens[1]);
    action.type = *type;
    action.value = tokens[3];
    if (tokens.size() > 4) {
        std::string label = tokens[4];
        for (std::size_t i = 5; i < tokens.size(); ++i) {
            label += ' ';
            label += tokens[i];
        }
        action.label = label;
    }
    if (!controller_.addAction(std::move(action))) {
        out_ << "nothing added\n";
    }
}

void ConsoleSession::printErrors() {
    const auto& errors = store_.validationErrors();
    if (errors.empty()) {
        out_ << "no validation errors\n";
        return;
    }
    for (const auto& error : errors) {
        out_ << validation::pathKey(error.path) << ": " << validation::describe(error.type) << '\n';
    }
}

void ConsoleSession::printLog() {
    for (const auto& line : logging::read_log_lines_snapshot(20)) {
        out_ << line.text << '\n';
    }
}

void ConsoleSession::printHelp() {
    out_ << "Type a key to navigate (C-x control, A-x option, M-x command).\n"
         << ":up :down :enter :back :clear :show :reload :save :errors :log :delete :quit\n"
         << ":add KEY TYPE VALUE [LABEL]   TYPE is application|url|command|folder|file|script\n";
}

} // namespace lmenu
