#include "toolshed/hydrator.hpp"
#include "toolshed/archive.hpp"
#include "toolshed/integrity.hpp"
#include "toolshed/path_utils.hpp"
#include "toolshed/platform.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>
#include <thread>

namespace toolshed {

// ============================================================================
// Per-Key Install Locks
// ============================================================================

namespace {

// Serializes installs of the same (id, version) across every hydrator in the
// process. Different keys proceed in parallel.
class InstallLockRegistry {
public:
    static InstallLockRegistry& instance() {
        static InstallLockRegistry registry;
        return registry;
    }

    void acquire(const std::string& key) {
        std::unique_lock<std::mutex> lock(mutex_);
        released_.wait(lock, [&] { return held_.count(key) == 0; });
        held_.insert(key);
    }

    void release(const std::string& key) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_.erase(key);
        }
        released_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable released_;
    std::set<std::string> held_;
};

class InstallLock {
public:
    explicit InstallLock(std::string key) : key_(std::move(key)) {
        InstallLockRegistry::instance().acquire(key_);
    }
    ~InstallLock() { InstallLockRegistry::instance().release(key_); }

    InstallLock(const InstallLock&) = delete;
    InstallLock& operator=(const InstallLock&) = delete;

private:
    std::string key_;
};

// Removes the staging directory on every exit path
class StagingDirectory {
public:
    explicit StagingDirectory(std::string path) : path_(std::move(path)) {}
    ~StagingDirectory() {
        if (!path_.empty() && path_exists(path_) && !remove_directory(path_)) {
            spdlog::warn("failed to clean staging directory {}", path_);
        }
    }

    StagingDirectory(const StagingDirectory&) = delete;
    StagingDirectory& operator=(const StagingDirectory&) = delete;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace

// ============================================================================
// Event Marshalling
// ============================================================================

struct MirrorHydrator::EventQueue {
    std::mutex mutex;
    std::deque<std::function<void()>> pending;
    std::atomic<bool> cancelled{false};

    void push(std::function<void()> fn) {
        if (cancelled.load()) return;
        std::lock_guard<std::mutex> lock(mutex);
        pending.push_back(std::move(fn));
    }

    std::deque<std::function<void()>> take() {
        std::lock_guard<std::mutex> lock(mutex);
        std::deque<std::function<void()>> out;
        out.swap(pending);
        return out;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex);
        pending.clear();
    }
};

struct MirrorHydrator::AsyncState {
    std::thread worker;
    std::atomic<bool> running{false};
    EventQueue queue;
    HydrationEvents events;

    mutable std::mutex report_mutex;
    HydrationReport report;
};

// ============================================================================
// MirrorHydrator
// ============================================================================

MirrorHydrator::MirrorHydrator(LibraryManager library, std::string manifest_path)
    : library_(std::move(library)),
      manifest_path_(std::move(manifest_path)),
      async_(std::make_unique<AsyncState>()) {}

MirrorHydrator::~MirrorHydrator() {
    cancel();
    wait();
}

HydrationReport MirrorHydrator::hydrate(const std::vector<ToolReference>& refs) {
    return run(refs, nullptr, nullptr);
}

AsyncStartStatus MirrorHydrator::hydrate_async(std::vector<ToolReference> refs, HydrationEvents events) {
    if (async_->running.load()) {
        spdlog::debug("hydration already running; ignoring new request");
        return AsyncStartStatus::AlreadyRunning;
    }
    if (async_->worker.joinable()) {
        async_->worker.join();
    }

    async_->running = true;
    async_->queue.cancelled = false;
    async_->events = std::move(events);

    async_->worker = std::thread([this, refs = std::move(refs)]() {
        HydrationReport report = run(refs, &async_->events, &async_->queue);
        {
            std::lock_guard<std::mutex> lock(async_->report_mutex);
            async_->report = std::move(report);
        }
        async_->running = false;
    });
    return AsyncStartStatus::Started;
}

size_t MirrorHydrator::poll_events() {
    auto batch = async_->queue.take();
    size_t dispatched = 0;
    for (auto& fn : batch) {
        if (async_->queue.cancelled.load()) break;
        fn();
        ++dispatched;
    }
    return dispatched;
}

void MirrorHydrator::cancel() {
    async_->queue.cancelled = true;
    async_->queue.clear();
}

bool MirrorHydrator::is_running() const {
    return async_->running.load();
}

void MirrorHydrator::wait() {
    if (async_->worker.joinable()) {
        async_->worker.join();
    }
}

HydrationReport MirrorHydrator::last_report() const {
    std::lock_guard<std::mutex> lock(async_->report_mutex);
    return async_->report;
}

HydrationReport MirrorHydrator::run(const std::vector<ToolReference>& refs,
                                    const HydrationEvents* events,
                                    EventQueue* queue) {
    HydrationReport report;

    auto record = [&](ToolOutcome outcome) {
        if (outcome.success) {
            report.installed_count++;
        } else {
            report.failed_count++;
            report.failed_tools.push_back(outcome.ref);
        }
        if (events && queue && events->on_install_completed) {
            auto cb = events->on_install_completed;
            queue->push([cb, outcome]() { cb(outcome.ref, outcome.success, outcome.message); });
        }
        report.outcomes.push_back(std::move(outcome));
    };

    std::string batch_error = batch_precondition_failure();
    if (batch_error.empty() && !library_.resolved()) {
        batch_error = "library root is unresolved";
    }

    if (!batch_error.empty()) {
        spdlog::warn("hydration refused: {}", batch_error);
        for (const auto& ref : refs) {
            record(ToolOutcome{ref, false, batch_error});
        }
    } else {
        // One fresh read of the manifest per batch
        MirrorManifestLoadResult manifest = load_mirror_manifest(manifest_path_);
        if (!manifest.ok) {
            spdlog::warn("mirror manifest {} rejected: {}", manifest_path_, manifest.error);
        }

        for (const auto& ref : refs) {
            if (queue && queue->cancelled.load()) {
                spdlog::info("hydration cancelled before {}", ref.to_string());
                break;
            }
            record(install_one(ref, manifest, events, queue));
        }
    }

    if (events && queue && events->on_hydration_completed) {
        auto cb = events->on_hydration_completed;
        bool ok = report.success();
        auto failed = report.failed_tools;
        queue->push([cb, ok, failed]() { cb(ok, failed); });
    }

    spdlog::info("hydration finished: {} installed, {} failed",
                 report.installed_count, report.failed_count);
    return report;
}

ToolOutcome MirrorHydrator::install_one(const ToolReference& ref,
                                        const MirrorManifestLoadResult& manifest,
                                        const HydrationEvents* events,
                                        EventQueue* queue) {
    ToolOutcome outcome;
    outcome.ref = ref;

    auto fail = [&](const std::string& message) {
        spdlog::warn("install {} failed: {}", ref.to_string(), message);
        outcome.success = false;
        outcome.message = message;
        return outcome;
    };

    if (events && queue && events->on_install_started) {
        auto cb = events->on_install_started;
        queue->push([cb, ref]() { cb(ref); });
    }

    std::string destination = library_.tool_path(ref.id, ref.version);
    if (destination.empty()) {
        return fail("invalid tool reference: " + ref.to_string());
    }

    if (library_.tool_exists(ref)) {
        outcome.success = true;
        outcome.message = "already installed";
        return outcome;
    }

    if (!manifest.ok) {
        return fail("mirror manifest invalid: " + manifest.error);
    }

    const MirrorToolEntry* entry = find_mirror_tool(manifest.manifest, ref);
    if (!entry) {
        return fail("tool not found in mirror '" + manifest.manifest.mirror_name + "': " + ref.to_string());
    }

    InstallLock lock(ref.to_string());

    // Another hydrator may have finished this key while we waited
    if (library_.tool_exists(ref)) {
        outcome.success = true;
        outcome.message = "already installed";
        return outcome;
    }

    StagingDirectory staging(join_path(library_.staging_root(), generate_uuid()));
    if (!create_directories(staging.path())) {
        return fail("failed to create staging directory: " + staging.path());
    }

    ProgressSink progress;
    if (events && queue && events->on_install_progress) {
        auto cb = events->on_install_progress;
        uint64_t declared = entry->size_bytes.value_or(0);
        progress = [cb, ref, declared, queue](uint64_t done, uint64_t total) {
            uint64_t effective = total != 0 ? total : declared;
            queue->push([cb, ref, done, effective]() { cb(ref, done, effective); });
        };
    }

    StagedArchive archive = acquire_archive(*entry, manifest.mirror_root,
                                            join_path(staging.path(), "fetch"), progress);
    if (!archive.ok) {
        return fail(archive.error);
    }

    auto verify = verify_file_sha256(archive.path, entry->sha256);
    if (!verify.ok) {
        return fail(verify.error);
    }

    std::string content_dir = join_path(staging.path(), "content");
    auto extracted = extract_archive(archive.path, content_dir);
    if (!extracted.ok) {
        return fail("extraction failed: " + extracted.error);
    }
    if (!strip_single_wrapper_directory(content_dir)) {
        return fail("failed to flatten archive contents in " + content_dir);
    }

    auto replaced = replace_directory(content_dir, destination);
    if (!replaced.ok) {
        return fail(replaced.error);
    }

    if (!library_.tool_exists(ref)) {
        return fail("library entry missing after extraction: " + destination);
    }

    InstallRecord install_record;
    install_record.tool = ref;
    install_record.provenance.source = archive.source;
    install_record.provenance.sha256 = verify.actual_digest;
    install_record.provenance.installed_at = get_current_timestamp();
    install_record.provenance.mirror_name = manifest.manifest.mirror_name;
    auto written = library_.write_install_record(install_record);
    if (written.isErr()) {
        spdlog::warn("installed {} but could not write install record: {}",
                     ref.to_string(), written.error().toString());
    }

    spdlog::info("installed {} from {}", ref.to_string(), archive.source);
    outcome.success = true;
    outcome.message = "installed";
    return outcome;
}

MirrorHydrator::StagedArchive MirrorHydrator::acquire_archive(const MirrorToolEntry& entry,
                                                              const std::string& mirror_root,
                                                              const std::string& work_dir,
                                                              const ProgressSink& progress) {
    (void)work_dir;
    (void)progress;
    return resolve_local_archive(entry, mirror_root);
}

MirrorHydrator::StagedArchive MirrorHydrator::resolve_local_archive(const MirrorToolEntry& entry,
                                                                    const std::string& mirror_root) const {
    StagedArchive staged;
    if (!entry.archive_path) {
        staged.error = "no local archive_path for " + entry.ref().to_string() +
                       " (remote-only entry)";
        return staged;
    }

    auto resolved = resolve_archive_path(mirror_root, *entry.archive_path);
    if (!resolved.ok) {
        staged.error = resolved.error;
        return staged;
    }
    if (!is_regular_file(resolved.full_path)) {
        staged.error = "archive not found: " + resolved.full_path;
        return staged;
    }

    staged.ok = true;
    staged.path = resolved.full_path;
    staged.source = resolved.full_path;
    return staged;
}

} // namespace toolshed
