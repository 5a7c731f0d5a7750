#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "model/ConfigTree.h"

namespace lmenu {

class AlertHandler;

// Performs the real-world effect of an action. Fire-and-forget: callers never
// wait for the effect to finish.
class DispatchSink {
public:
    virtual ~DispatchSink() = default;
    virtual void runAction(const Action& action) = 0;
    // Every action below `group`, depth-first in child order.
    virtual void runGroupRecursively(const Group& group);
};

namespace dispatch {

// Quotes `text` for /bin/sh unless it only contains [A-Za-z0-9-_./].
std::string shellEscape(std::string_view text);

// "~" and "~/x" expanded against `home`; anything else unchanged.
std::string expandTilde(std::string_view path, std::string_view home);

struct LaunchContext {
    std::string shell = "/bin/sh";
    std::string opener = "xdg-open";
    std::string home;
};

// Argument vector that performs `action`, or std::nullopt with *outError set
// when the action cannot be launched as written (e.g. URL without a scheme).
std::optional<std::vector<std::string>> buildCommandLine(const Action& action, const LaunchContext& context,
                                                         std::string* outError = nullptr);

LaunchContext launchContextFromEnvironment(const std::string& opener);

} // namespace dispatch

// Spawns a child process per action and reaps it on a detached thread.
class ShellDispatchSink : public DispatchSink {
public:
    ShellDispatchSink(dispatch::LaunchContext context, AlertHandler& alerts);

    void runAction(const Action& action) override;

    [[nodiscard]] const dispatch::LaunchContext& context() const noexcept { return context_; }

private:
    dispatch::LaunchContext context_;
    AlertHandler& alerts_;
};

} // namespace lmenu
