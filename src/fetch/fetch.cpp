#include "toolshed/fetch.hpp"
#include "toolshed/platform.hpp"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

#include <curl/curl.h>

namespace toolshed {

// ============================================================================
// libcurl Transport
// ============================================================================

namespace {

constexpr long MAX_REDIRECTS = 10;
constexpr const char* USER_AGENT = "toolshed/1.0";

using CurlPtr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

// Receives body bytes and progress ticks for one transfer
struct Transfer {
    std::ofstream out;
    uint64_t written = 0;
    curl_off_t last_reported = -1;
    const FetchProgress* progress = nullptr;
};

size_t on_body(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* transfer = static_cast<Transfer*>(userdata);
    size_t bytes = size * nmemb;
    if (!transfer->out.write(data, static_cast<std::streamsize>(bytes))) {
        return 0;  // CURLE_WRITE_ERROR
    }
    transfer->written += bytes;
    return bytes;
}

int on_progress(void* userdata, curl_off_t dl_total, curl_off_t dl_now, curl_off_t, curl_off_t) {
    auto* transfer = static_cast<Transfer*>(userdata);
    // libcurl ticks about once a second even when nothing arrived
    if (dl_now == transfer->last_reported) {
        return 0;
    }
    transfer->last_reported = dl_now;
    if (*transfer->progress) {
        (*transfer->progress)(static_cast<uint64_t>(dl_now), static_cast<uint64_t>(dl_total));
    }
    return 0;
}

void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            spdlog::error("curl_global_init failed; downloads will fail");
        }
    });
}

void discard_partial(const std::string& path) {
    if (path_exists(path) && !remove_file(path)) {
        spdlog::warn("could not remove partial download {}", path);
    }
}

} // namespace

FetchResult fetch_to_file(const std::string& url,
                          const std::string& dest_path,
                          const FetchProgress& progress) {
    FetchResult result;
    ensure_curl_initialized();

    CurlPtr curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        result.error = "curl_easy_init failed";
        return result;
    }

    // Body goes to "<dest>.part" and is renamed only after a clean transfer
    std::string part_path = dest_path + ".part";
    Transfer transfer;
    transfer.progress = &progress;
    transfer.out.open(part_path, std::ios::binary | std::ios::trunc);
    if (!transfer.out) {
        result.error = "cannot create " + part_path;
        return result;
    }

    char curl_error[CURL_ERROR_SIZE] = {0};
    CURL* h = curl.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, curl_error);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, on_body);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &transfer);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, on_progress);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &transfer);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, MAX_REDIRECTS);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(h, CURLOPT_USERAGENT, USER_AGENT);

    spdlog::debug("GET {}", url);
    CURLcode code = curl_easy_perform(h);

    transfer.out.close();
    if (code == CURLE_OK && !transfer.out) {
        result.error = "failed to finish writing " + part_path;
        discard_partial(part_path);
        return result;
    }

    if (code != CURLE_OK) {
        result.error = curl_error[0] ? curl_error : curl_easy_strerror(code);
        discard_partial(part_path);
        return result;
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &result.http_status);
    // 0 for file:// and other non-HTTP schemes
    bool http_failed = result.http_status != 0 &&
                       (result.http_status < 200 || result.http_status >= 300);
    if (http_failed) {
        result.error = "HTTP " + std::to_string(result.http_status);
        discard_partial(part_path);
        return result;
    }

    if (std::rename(part_path.c_str(), dest_path.c_str()) != 0) {
        result.error = "cannot move " + part_path + " to " + dest_path;
        discard_partial(part_path);
        return result;
    }

    result.bytes_written = transfer.written;
    result.ok = true;
    spdlog::debug("fetched {} bytes from {}", result.bytes_written, url);
    return result;
}

} // namespace toolshed
