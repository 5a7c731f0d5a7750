#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "model/ConfigTree.h"
#include "services/persistence/ConflictPrompt.h"
#include "services/persistence/SaveScheduler.h"
#include "services/persistence/SerialExecutor.h"
#include "services/validation/ConfigValidator.h"

namespace lmenu {

class AlertHandler;
class ConflictPrompt;
class MainThreadQueue;

// Read-only view of the canonical tree for consumers that must not mutate it.
class TreeProvider {
public:
    virtual ~TreeProvider() = default;
    [[nodiscard]] virtual const Group& root() const = 0;
};

enum class StoreEvent { WillReload, DidReload, DidLoad, DidSave };

enum class SaveResult {
    Written,
    Cancelled,   // conflict prompt answered Cancel
    Reloaded,    // conflict prompt answered Read from File
    Failed,      // I/O error, in-memory tree kept
    Skipped,     // nothing savable (error tree or load in progress)
};

const char* toString(SaveResult result) noexcept;

// Owns the canonical menu tree and keeps it in sync with config.json.
//
// All public methods are called from the primary context, the thread that
// drains `mainQueue`. File I/O runs on an internal worker; results come back
// through `mainQueue`, so root and validation state only change inside
// drain(). The checksum of the last read or written bytes is set by the
// worker as soon as a write lands, so a save queued behind that write never
// mistakes it for an external edit. `mainQueue` must outlive the store.
class ConfigStore : public TreeProvider {
public:
    struct Options {
        std::string directory;
        std::string fallbackDirectory;  // used when `directory` vanished
        std::chrono::milliseconds debounce{300};
        // Called with the new directory after a reset to the fallback.
        std::function<void(const std::string&)> onDirectoryReset;
    };

    ConfigStore(Options options, AlertHandler& alerts, ConflictPrompt& prompt, MainThreadQueue& mainQueue);
    ~ConfigStore() override;

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    void ensureAndLoad();
    // Starts an asynchronous load. With suppressConflictPrompt a pending
    // debounced save is dropped instead of being written or prompted.
    void load(bool suppressConflictPrompt = false);
    SaveResult save();
    void saveDebounced();
    void reloadFromFile();

    // Applies `mutation` to a copy of the tree; on a structural change the copy
    // becomes the root, is revalidated and a debounced save is scheduled.
    // Returns false when nothing changed or the tree is not editable.
    bool edit(const std::function<void(Group&)>& mutation);
    bool replaceRoot(Group root);

    [[nodiscard]] const Group& root() const override { return root_; }
    [[nodiscard]] bool isLoading() const noexcept { return isLoading_; }
    [[nodiscard]] std::optional<std::string> lastReadChecksum() const;

    [[nodiscard]] const std::vector<validation::ValidationError>& validationErrors() const noexcept { return validation_.errors(); }
    [[nodiscard]] std::optional<validation::ValidationErrorType> validationErrorAt(const std::vector<int>& path) const { return validation_.errorAt(path); }
    [[nodiscard]] const validation::ValidationIndex& validation() const noexcept { return validation_; }

    [[nodiscard]] const std::string& directory() const noexcept { return options_.directory; }
    [[nodiscard]] std::string filePath() const;

    int subscribe(StoreEvent event, std::function<void()> cb);
    void unsubscribe(int id);

    [[nodiscard]] std::size_t writeCount() const noexcept { return writeCount_.load(); }

    // Blocks until background I/O has finished and every result has been
    // applied. Pending debounced saves are flushed, not dropped.
    void waitForIdle();

private:
    struct LoadOutcome {
        std::optional<Group> root;
        std::string checksum;
        std::vector<validation::ValidationError> errors;
        std::string error;
        bool missing{false};
    };

    void ensureValidDirectory();
    void ensureFileExists();
    void startLoad(bool notifyReload);
    void applyLoad(std::uint64_t generation, LoadOutcome outcome);
    void flushDebounced();
    void resolveConflictThenWrite(const std::string& path, std::string bytes);
    void writeInBackground(const std::string& path, const std::string& bytes);
    void onWritten();
    void setLastReadChecksum(std::optional<std::string> checksum);
    // Worker side: true when the file exists and no longer hashes to the
    // last read or written bytes.
    bool changedOnDisk(const std::string& path) const;
    void onWriteFailed(const std::string& error);
    ConflictResolution askConflict();
    void emit(StoreEvent event);
    void postToMain(std::function<void()> task);

    template <typename Fn>
    auto runOnIo(Fn&& fn) -> decltype(fn());

    Options options_;
    AlertHandler& alerts_;
    ConflictPrompt& prompt_;
    MainThreadQueue& main_;
    std::shared_ptr<int> alive_ = std::make_shared<int>(0);

    Group root_;
    validation::ValidationIndex validation_;
    mutable std::mutex checksumMu_;
    std::optional<std::string> lastReadChecksum_;
    bool isLoading_{false};
    std::uint64_t loadGeneration_{0};
    bool notifyReloadOnApply_{false};
    bool promptOpen_{false};
    bool saveAfterPrompt_{false};
    std::atomic<std::size_t> writeCount_{0};

    std::map<int, std::pair<StoreEvent, std::function<void()>>> subscribers_;
    int nextSubscriberId_{1};

    SerialExecutor io_;
    SaveScheduler scheduler_;
};

} // namespace lmenu
