#pragma once

/**
 * @file hydrator.hpp
 * @brief Installs tools from a mirror into the library
 *
 * Per requested tool:
 *   1. Already in the library -> success, nothing re-verified
 *   2. Reload and validate the mirror manifest; invalid -> every tool fails
 *   3. Tool absent from the manifest -> that tool fails
 *   4. Resolve the archive (contained path for local, fetch for remote)
 *   5. Verify the archive SHA-256 before anything is extracted
 *   6. Extract into a private staging directory, strip a single wrapping
 *      folder, then replace the library entry
 *   7. Re-check that the entry exists
 *
 * A failing tool never stops the rest of the batch, and nothing is retried.
 */

#include "toolshed/fetch.hpp"
#include "toolshed/library.hpp"
#include "toolshed/mirror_manifest.hpp"
#include "toolshed/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace toolshed {

struct ToolOutcome {
    ToolReference ref;
    bool success = false;
    std::string message;
};

struct HydrationReport {
    int installed_count = 0;
    int failed_count = 0;
    std::vector<ToolReference> failed_tools;
    std::vector<ToolOutcome> outcomes;

    bool success() const { return failed_count == 0; }
};

// Callbacks for background hydration. They only ever run inside
// poll_events(), on the thread that calls it.
struct HydrationEvents {
    std::function<void(const ToolReference&)> on_install_started;
    std::function<void(const ToolReference&, uint64_t, uint64_t)> on_install_progress;
    std::function<void(const ToolReference&, bool, const std::string&)> on_install_completed;
    std::function<void(bool, const std::vector<ToolReference>&)> on_hydration_completed;
};

enum class AsyncStartStatus {
    Started,
    AlreadyRunning
};

class MirrorHydrator {
public:
    MirrorHydrator(LibraryManager library, std::string manifest_path);
    virtual ~MirrorHydrator();

    MirrorHydrator(const MirrorHydrator&) = delete;
    MirrorHydrator& operator=(const MirrorHydrator&) = delete;

    // Runs on the calling thread.
    HydrationReport hydrate(const std::vector<ToolReference>& refs);

    // Runs the same work on a worker thread. A second call while one is in
    // flight does nothing and reports AlreadyRunning.
    AsyncStartStatus hydrate_async(std::vector<ToolReference> refs, HydrationEvents events);

    // Deliver queued notifications on the calling thread. Returns how many
    // callbacks were dispatched.
    size_t poll_events();

    // Stop notifying and stop after the tool currently being installed.
    void cancel();

    bool is_running() const;

    // Block until the worker (if any) has finished. Queued events stay queued.
    void wait();

    // Report of the last background run, once it has finished.
    HydrationReport last_report() const;

    const LibraryManager& library() const { return library_; }
    const std::string& manifest_path() const { return manifest_path_; }

protected:
    struct StagedArchive {
        bool ok = false;
        std::string path;      // file to hash and extract
        std::string source;    // path or URL recorded in the install record
        std::string error;
    };

    using ProgressSink = std::function<void(uint64_t, uint64_t)>;

    // Locate (and for remote mirrors, download into work_dir) the archive.
    virtual StagedArchive acquire_archive(const MirrorToolEntry& entry,
                                          const std::string& mirror_root,
                                          const std::string& work_dir,
                                          const ProgressSink& progress);

    // Non-empty message fails the whole batch before any tool is looked at.
    virtual std::string batch_precondition_failure() const { return ""; }

    StagedArchive resolve_local_archive(const MirrorToolEntry& entry,
                                        const std::string& mirror_root) const;

private:
    struct EventQueue;
    struct AsyncState;

    HydrationReport run(const std::vector<ToolReference>& refs,
                        const HydrationEvents* events,
                        EventQueue* queue);

    ToolOutcome install_one(const ToolReference& ref,
                            const MirrorManifestLoadResult& manifest,
                            const HydrationEvents* events,
                            EventQueue* queue);

    LibraryManager library_;
    std::string manifest_path_;
    std::unique_ptr<AsyncState> async_;
};

class RemoteMirrorHydrator : public MirrorHydrator {
public:
    RemoteMirrorHydrator(LibraryManager library,
                         std::string manifest_path,
                         FetchFunction fetch = fetch_to_file);
    ~RemoteMirrorHydrator() override;

protected:
    StagedArchive acquire_archive(const MirrorToolEntry& entry,
                                  const std::string& mirror_root,
                                  const std::string& work_dir,
                                  const ProgressSink& progress) override;

    std::string batch_precondition_failure() const override;

private:
    FetchFunction fetch_;
};

} // namespace toolshed
