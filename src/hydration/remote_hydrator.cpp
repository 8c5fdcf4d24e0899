#include "toolshed/hydrator.hpp"
#include "toolshed/offline.hpp"
#include "toolshed/platform.hpp"

#include <spdlog/spdlog.h>

namespace toolshed {

namespace {

// Last path segment of a URL, ignoring query and fragment
std::string url_file_name(const std::string& url) {
    std::string path = url.substr(0, url.find_first_of("?#"));
    auto scheme = path.find("://");
    if (scheme != std::string::npos) {
        auto slash = path.find('/', scheme + 3);
        path = slash == std::string::npos ? "" : path.substr(slash);
    }
    auto pos = path.find_last_of('/');
    std::string name = pos == std::string::npos ? path : path.substr(pos + 1);
    if (name.empty() || name == "." || name == "..") {
        return "archive";
    }
    return name;
}

} // namespace

RemoteMirrorHydrator::RemoteMirrorHydrator(LibraryManager library,
                                           std::string manifest_path,
                                           FetchFunction fetch)
    : MirrorHydrator(std::move(library), std::move(manifest_path)),
      fetch_(std::move(fetch)) {}

// The worker calls acquire_archive(); it has to stop before this object's
// part of the vtable goes away.
RemoteMirrorHydrator::~RemoteMirrorHydrator() {
    cancel();
    wait();
}

std::string RemoteMirrorHydrator::batch_precondition_failure() const {
    OfflineState state = OfflineEnforcer::instance().state();
    if (state.active) {
        return std::string("remote hydration unavailable while offline (") +
               offline_reason_to_string(state.reason) + ")";
    }
    return "";
}

MirrorHydrator::StagedArchive RemoteMirrorHydrator::acquire_archive(const MirrorToolEntry& entry,
                                                                    const std::string& mirror_root,
                                                                    const std::string& work_dir,
                                                                    const ProgressSink& progress) {
    if (!entry.is_remote()) {
        return resolve_local_archive(entry, mirror_root);
    }

    StagedArchive staged;
    const std::string& url = *entry.archive_url;

    auto guard = OfflineEnforcer::instance().guard_network_call("fetch " + entry.ref().to_string() + " from " + url);
    if (!guard.allowed) {
        staged.error = guard.error_code + ": " + guard.message;
        return staged;
    }

    if (!create_directories(work_dir)) {
        staged.error = "failed to create download directory: " + work_dir;
        return staged;
    }

    std::string dest = join_path(work_dir, url_file_name(url));
    spdlog::info("downloading {} -> {}", url, dest);

    FetchResult fetched = fetch_(url, dest, progress);
    if (!fetched.ok) {
        staged.error = "download failed for " + url + ": " + fetched.error;
        return staged;
    }

    staged.ok = true;
    staged.path = dest;
    staged.source = url;
    return staged;
}

} // namespace toolshed
