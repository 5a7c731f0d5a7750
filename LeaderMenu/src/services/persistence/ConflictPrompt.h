#pragma once

namespace lmenu {

enum class ConflictResolution { Overwrite, Cancel, Reload };

const char* toString(ConflictResolution resolution) noexcept;

// Asked on the primary context when the config file changed on disk since it
// was last read. Blocks until the user picks one of the three options.
class ConflictPrompt {
public:
    virtual ~ConflictPrompt() = default;
    virtual ConflictResolution askOverwriteCancelReload() = 0;
};
}
