#include "services/dispatch/DispatchSink.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <system_error>
#include <thread>

#include <spawn.h>
#include <sys/wait.h>

#include <spdlog/spdlog.h>

#include "services/alerts/AlertHandler.h"
#include "services/logger/LogManager.h"
#include "services/persistence/file_io.h"

extern "C" char **environ;

namespace lmenu {

void DispatchSink::runGroupRecursively(const Group& group) {
    forEachActionDepthFirst(group, [this](const Action& action) { runAction(action); });
}

namespace dispatch {

namespace {

bool isShellSafe(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) || ch == '-' || ch == '_' || ch == '.' || ch == '/';
}

// RFC 3986 scheme: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) followed by ':'.
bool hasScheme(std::string_view url) {
    auto colon = url.find(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(url[0]))) {
        return false;
    }
    for (std::size_t i = 1; i < colon; ++i) {
        char ch = url[i];
        if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '+' && ch != '-' && ch != '.') {
            return false;
        }
    }
    return true;
}

void setError(std::string* outError, std::string message) {
    if (outError) {
        *outError = std::move(message);
    }
}

} // namespace

std::string shellEscape(std::string_view text) {
    bool safe = !text.empty();
    for (char ch : text) {
        if (!isShellSafe(ch)) {
            safe = false;
            break;
        }
    }
    if (safe) {
        return std::string(text);
    }
    std::string out = "'";
    for (char ch : text) {
        if (ch == '\'') {
            out += "'\"'\"'";
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('\'');
    return out;
}

std::string expandTilde(std::string_view path, std::string_view home) {
    if (home.empty() || path.empty() || path[0] != '~') {
        return std::string(path);
    }
    if (path.size() == 1) {
        return std::string(home);
    }
    if (path[1] == '/') {
        return std::string(home) + std::string(path.substr(1));
    }
    return std::string(path);
}

std::optional<std::vector<std::string>> buildCommandLine(const Action& action, const LaunchContext& context,
                                                         std::string* outError) {
    if (action.value.empty()) {
        setError(outError, "Action has no value");
        return std::nullopt;
    }
    const std::string opener = action.openWith && !action.openWith->empty() ? *action.openWith : context.opener;
    switch (action.type) {
    case ActionType::Command:
        return std::vector<std::string>{context.shell, "-c", action.value};
    case ActionType::Script: {
        std::string command = shellEscape(expandTilde(action.value, context.home));
        if (action.arguments) {
            for (const auto& argument : *action.arguments) {
                command += ' ';
                command += shellEscape(argument.defaultValue.value_or(""));
            }
        }
        return std::vector<std::string>{context.shell, "-c", command};
    }
    case ActionType::Application:
        return std::vector<std::string>{expandTilde(action.value, context.home)};
    case ActionType::Url:
        if (!hasScheme(action.value)) {
            setError(outError, "URL is missing protocol (e.g. https://): " + action.value);
            return std::nullopt;
        }
        return std::vector<std::string>{opener, action.value};
    case ActionType::Folder:
    case ActionType::File:
        return std::vector<std::string>{opener, expandTilde(action.value, context.home)};
    }
    setError(outError, "Unknown action type");
    return std::nullopt;
}

LaunchContext launchContextFromEnvironment(const std::string& opener) {
    LaunchContext context;
    if (const char* shell = std::getenv("SHELL"); shell && *shell) {
        context.shell = shell;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        context.home = home;
    }
    if (!opener.empty()) {
        context.opener = opener;
    }
    return context;
}

} // namespace dispatch

ShellDispatchSink::ShellDispatchSink(dispatch::LaunchContext context, AlertHandler& alerts)
    : context_(std::move(context)), alerts_(alerts) {}

void ShellDispatchSink::runAction(const Action& action) {
    if (action.type == ActionType::Script) {
        const std::string path = dispatch::expandTilde(action.value, context_.home);
        if (!fileio::exists(path)) {
            alerts_.showAlert(AlertStyle::Critical, "Script not found", "The script file does not exist: " + action.value);
            return;
        }
    }

    std::string error;
    auto argv = dispatch::buildCommandLine(action, context_, &error);
    if (!argv) {
        alerts_.showAlert(AlertStyle::Warning, "Cannot run " + action.displayName(), error);
        return;
    }

    std::vector<char*> raw;
    raw.reserve(argv->size() + 1);
    for (auto& arg : *argv) {
        raw.push_back(arg.data());
    }
    raw.push_back(nullptr);

    pid_t pid = 0;
    const int rc = posix_spawnp(&pid, raw[0], nullptr, nullptr, raw.data(), environ);
    if (rc != 0) {
        alerts_.showAlert(AlertStyle::Critical, "Failed to run " + action.displayName(),
                          std::error_code(rc, std::generic_category()).message());
        return;
    }
    logging::LogManager::info("Started '{}' (pid {})", action.displayName(), static_cast<long>(pid));

    // The reaper may outlive LogManager::shutdown(); it logs through its own
    // handle, which keeps the logger alive.
    std::thread([pid, name = action.displayName(), log = logging::LogManager::acquire()]() {
        int status = 0;
        while (waitpid(pid, &status, 0) == -1) {
            if (errno != EINTR) {
                if (log) {
                    log->warn("waitpid failed for '{}': {}", name, std::error_code(errno, std::generic_category()).message());
                }
                return;
            }
        }
        if (!log) {
            return;
        }
        if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
            log->error("'{}' failed with exit code {}", name, WEXITSTATUS(status));
        } else if (WIFSIGNALED(status)) {
            log->error("'{}' terminated by signal {}", name, WTERMSIG(status));
        }
    }).detach();
}

} // namespace lmenu
