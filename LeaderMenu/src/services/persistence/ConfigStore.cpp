#include "services/persistence/ConfigStore.h"

#include <filesystem>
#include <future>

#include "model/DefaultConfig.h"
#include "model/TreeCodec.h"
#include "services/alerts/AlertHandler.h"
#include "services/configuration/paths.h"
#include "services/logger/LogManager.h"
#include "services/persistence/MainThreadQueue.h"
#include "services/persistence/checksum.h"
#include "services/persistence/file_io.h"

namespace lmenu {

namespace {

constexpr const char* kConflictMessage = "Configuration file changed on disk";
constexpr const char* kConflictDetail =
    "The configuration file has been modified outside of the app. Choose 'Read from File' to load the "
    "external changes, or 'Overwrite' to save your current changes.";

} // namespace

const char* toString(SaveResult result) noexcept {
    switch (result) {
    case SaveResult::Written: return "written";
    case SaveResult::Cancelled: return "cancelled";
    case SaveResult::Reloaded: return "reloaded";
    case SaveResult::Failed: return "failed";
    case SaveResult::Skipped: return "skipped";
    }
    return "unknown";
}

const char* toString(ConflictResolution resolution) noexcept {
    switch (resolution) {
    case ConflictResolution::Overwrite: return "overwrite";
    case ConflictResolution::Cancel: return "cancel";
    case ConflictResolution::Reload: return "reload";
    }
    return "unknown";
}

ConfigStore::ConfigStore(Options options, AlertHandler& alerts, ConflictPrompt& prompt, MainThreadQueue& mainQueue)
    : options_(std::move(options)),
      alerts_(alerts),
      prompt_(prompt),
      main_(mainQueue),
      root_(makeErrorSentinel()),
      scheduler_(io_, options_.debounce) {
    if (options_.fallbackDirectory.empty()) {
        options_.fallbackDirectory = paths::defaultConfigDirectory();
    }
    if (options_.directory.empty()) {
        options_.directory = options_.fallbackDirectory;
    }
}

ConfigStore::~ConfigStore() {
    scheduler_.cancel();
    io_.shutdown();
    alive_.reset();
}

std::string ConfigStore::filePath() const {
    return paths::configFileIn(options_.directory);
}

template <typename Fn>
auto ConfigStore::runOnIo(Fn&& fn) -> decltype(fn()) {
    using Result = decltype(fn());
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    auto future = task->get_future();
    if (!io_.post([task]() { (*task)(); })) {
        (*task)();
    }
    return future.get();
}

std::optional<std::string> ConfigStore::lastReadChecksum() const {
    std::lock_guard<std::mutex> lock(checksumMu_);
    return lastReadChecksum_;
}

void ConfigStore::setLastReadChecksum(std::optional<std::string> checksum) {
    std::lock_guard<std::mutex> lock(checksumMu_);
    lastReadChecksum_ = std::move(checksum);
}

bool ConfigStore::changedOnDisk(const std::string& path) const {
    const std::optional<std::string> expected = lastReadChecksum();
    if (!expected || !fileio::exists(path)) {
        return false;
    }
    return checksum::fileChecksum(path) != expected;
}

void ConfigStore::postToMain(std::function<void()> task) {
    std::weak_ptr<int> alive = alive_;
    main_.post([alive, task = std::move(task)]() {
        if (alive.expired()) {
            return;
        }
        task();
    });
}

// MARK: directory and bootstrap

void ConfigStore::ensureAndLoad() {
    ensureValidDirectory();
    ensureFileExists();
    load();
}

void ConfigStore::ensureValidDirectory() {
    if (fileio::isDirectory(options_.directory)) {
        return;
    }
    std::error_code ec;
    if (options_.directory == options_.fallbackDirectory) {
        // First run: the default location does not exist yet.
        std::filesystem::create_directories(options_.directory, ec);
        if (ec) {
            alerts_.showAlert(AlertStyle::Critical, "Could not create config directory " + options_.directory,
                              ec.message());
        } else {
            logging::LogManager::info("Created config directory {}", options_.directory);
        }
        return;
    }
    alerts_.showAlert(AlertStyle::Warning,
                      "Config directory does not exist: " + options_.directory,
                      "Resetting to default location.");
    options_.directory = options_.fallbackDirectory;
    std::filesystem::create_directories(options_.directory, ec);
    if (ec) {
        logging::LogManager::error("Could not create config directory {}: {}", options_.directory, ec.message());
    }
    if (options_.onDirectoryReset) {
        options_.onDirectoryReset(options_.directory);
    }
}

void ConfigStore::ensureFileExists() {
    const std::string path = filePath();
    if (fileio::exists(path)) {
        return;
    }
    std::string error;
    if (!fileio::writeFileAtomic(path, defaultConfigDocument(), &error)) {
        alerts_.showAlert(AlertStyle::Critical, "Failed to create default config", error);
        return;
    }
    logging::LogManager::info("Wrote default config to {}", path);
}

// MARK: loading

void ConfigStore::load(bool suppressConflictPrompt) {
    if (suppressConflictPrompt) {
        scheduler_.cancel();
    }
    startLoad(false);
}

void ConfigStore::reloadFromFile() {
    emit(StoreEvent::WillReload);
    scheduler_.cancel();
    startLoad(true);
}

void ConfigStore::startLoad(bool notifyReload) {
    isLoading_ = true;
    const std::uint64_t generation = ++loadGeneration_;
    notifyReloadOnApply_ = notifyReloadOnApply_ || notifyReload;
    const std::string path = filePath();

    auto read = [this, generation, path]() {
        LoadOutcome outcome;
        if (!fileio::exists(path)) {
            outcome.missing = true;
        } else if (auto bytes = fileio::readFile(path); !bytes) {
            outcome.error = "Could not read " + path;
        } else {
            std::string error;
            outcome.root = codec::decodeTree(*bytes, &error);
            if (outcome.root) {
                outcome.checksum = checksum::sha256Hex(*bytes);
                outcome.errors = validation::ConfigValidator::validate(*outcome.root);
            } else {
                outcome.error = error;
            }
        }
        postToMain([this, generation, outcome = std::move(outcome)]() mutable {
            applyLoad(generation, std::move(outcome));
        });
    };
    if (!io_.post(read)) {
        read();
    }
}

void ConfigStore::applyLoad(std::uint64_t generation, LoadOutcome outcome) {
    if (generation != loadGeneration_) {
        logging::LogManager::debug("Dropping superseded config load {}", generation);
        return;
    }
    if (outcome.root) {
        root_ = std::move(*outcome.root);
        setLastReadChecksum(std::move(outcome.checksum));
        validation_.assign(std::move(outcome.errors));
        logging::LogManager::info("Loaded config {} ({} validation error(s))", filePath(), validation_.errors().size());
    } else {
        root_ = makeErrorSentinel();
        validation_.clear();
        setLastReadChecksum(std::nullopt);
        if (!outcome.missing) {
            alerts_.showAlert(AlertStyle::Critical, "Failed to load configuration", outcome.error);
        }
    }
    isLoading_ = false;
    emit(StoreEvent::DidLoad);
    if (notifyReloadOnApply_) {
        notifyReloadOnApply_ = false;
        emit(StoreEvent::DidReload);
    }
}

// MARK: saving

ConflictResolution ConfigStore::askConflict() {
    logging::LogManager::warn("{}: {}", kConflictMessage, filePath());
    promptOpen_ = true;
    const ConflictResolution resolution = prompt_.askOverwriteCancelReload();
    promptOpen_ = false;
    logging::LogManager::info("Conflict resolved with '{}'", toString(resolution));
    return resolution;
}

SaveResult ConfigStore::save() {
    if (isLoading_ || isErrorSentinel(root_)) {
        logging::LogManager::warn("Save skipped: no loaded configuration");
        return SaveResult::Skipped;
    }
    scheduler_.cancel();
    const std::string path = filePath();

    // Queued behind any debounced write still in flight, so that write's
    // checksum is already recorded.
    if (runOnIo([this, path]() { return changedOnDisk(path); })) {
        switch (askConflict()) {
        case ConflictResolution::Reload:
            saveAfterPrompt_ = false;
            reloadFromFile();
            return SaveResult::Reloaded;
        case ConflictResolution::Cancel:
            return SaveResult::Cancelled;
        case ConflictResolution::Overwrite:
            break;
        }
    }

    validation_.assign(validation::ConfigValidator::validate(root_));
    const std::string bytes = codec::encodeTree(root_);
    std::string error;
    const bool ok = runOnIo([&]() {
        if (!fileio::writeFileAtomic(path, bytes, &error)) {
            return false;
        }
        setLastReadChecksum(checksum::sha256Hex(bytes));
        ++writeCount_;
        return true;
    });
    if (!ok) {
        onWriteFailed(error);
        return SaveResult::Failed;
    }
    onWritten();
    return SaveResult::Written;
}

void ConfigStore::saveDebounced() {
    if (isLoading_ || isErrorSentinel(root_)) {
        return;
    }
    if (promptOpen_) {
        saveAfterPrompt_ = true;
        return;
    }
    scheduler_.schedule([this]() {
        postToMain([this]() { flushDebounced(); });
    });
}

void ConfigStore::flushDebounced() {
    if (promptOpen_) {
        saveAfterPrompt_ = true;
        return;
    }
    if (isLoading_ || isErrorSentinel(root_)) {
        return;
    }
    // Encode the tree as it is now, not as it was at the first edit.
    std::string bytes = codec::encodeTree(root_);
    const std::string path = filePath();

    io_.post([this, bytes = std::move(bytes), path]() mutable {
        if (changedOnDisk(path)) {
            postToMain([this, path, bytes = std::move(bytes)]() mutable {
                resolveConflictThenWrite(path, std::move(bytes));
            });
            return;
        }
        writeInBackground(path, bytes);
    });
}

void ConfigStore::resolveConflictThenWrite(const std::string& path, std::string bytes) {
    const ConflictResolution resolution = askConflict();
    const bool resave = saveAfterPrompt_;
    saveAfterPrompt_ = false;
    switch (resolution) {
    case ConflictResolution::Reload:
        reloadFromFile();
        return;
    case ConflictResolution::Cancel:
        break;
    case ConflictResolution::Overwrite:
        io_.post([this, path, bytes = std::move(bytes)]() { writeInBackground(path, bytes); });
        break;
    }
    if (resave) {
        saveDebounced();
    }
}

// Runs on the I/O worker.
void ConfigStore::writeInBackground(const std::string& path, const std::string& bytes) {
    std::string error;
    if (!fileio::writeFileAtomic(path, bytes, &error)) {
        postToMain([this, error]() { onWriteFailed(error); });
        return;
    }
    setLastReadChecksum(checksum::sha256Hex(bytes));
    ++writeCount_;
    postToMain([this]() { onWritten(); });
}

void ConfigStore::onWritten() {
    validation_.assign(validation::ConfigValidator::validate(root_));
    logging::LogManager::debug("Saved config {}", filePath());
    emit(StoreEvent::DidSave);
}

void ConfigStore::onWriteFailed(const std::string& error) {
    alerts_.showAlert(AlertStyle::Critical, "Failed to save configuration", error);
}

// MARK: editing

bool ConfigStore::edit(const std::function<void(Group&)>& mutation) {
    if (isErrorSentinel(root_)) {
        logging::LogManager::warn("Ignoring edit: configuration failed to load");
        return false;
    }
    Group updated = root_;
    mutation(updated);
    if (updated == root_) {
        return false;
    }
    root_ = std::move(updated);
    validation_.assign(validation::ConfigValidator::validate(root_));
    if (!isLoading_) {
        saveDebounced();
    }
    return true;
}

bool ConfigStore::replaceRoot(Group root) {
    return edit([&root](Group& current) { current = std::move(root); });
}

// MARK: notifications

int ConfigStore::subscribe(StoreEvent event, std::function<void()> cb) {
    const int id = nextSubscriberId_++;
    subscribers_[id] = {event, std::move(cb)};
    return id;
}

void ConfigStore::unsubscribe(int id) {
    subscribers_.erase(id);
}

void ConfigStore::emit(StoreEvent event) {
    auto copy = subscribers_;
    for (auto& [id, entry] : copy) {
        if (entry.first == event && entry.second) {
            entry.second();
        }
    }
}

void ConfigStore::waitForIdle() {
    for (;;) {
        io_.waitIdle();
        if (main_.drain() == 0) {
            break;
        }
    }
}

} // namespace lmenu
