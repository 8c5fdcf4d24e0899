#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace toolshed {

// ============================================================================
// Remote Fetching
// ============================================================================

// bytes_done, bytes_total (0 when the server does not announce a length)
using FetchProgress = std::function<void(uint64_t, uint64_t)>;

struct FetchResult {
    bool ok = false;
    std::string error;
    long http_status = 0;
    uint64_t bytes_written = 0;
};

// Download url into dest_path. Follows redirects and verifies TLS peers.
// file:// URLs are served by libcurl as well, which is how mirrors on
// mounted media are read through the remote path.
FetchResult fetch_to_file(const std::string& url,
                          const std::string& dest_path,
                          const FetchProgress& progress = nullptr);

// Signature of fetch_to_file, so hydrators can be given another transport.
using FetchFunction = std::function<FetchResult(const std::string&,
                                                const std::string&,
                                                const FetchProgress&)>;

} // namespace toolshed
