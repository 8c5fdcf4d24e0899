#include "toolshed/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <random>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#if defined(__APPLE__)
#include <crt_externs.h>
#define environ (*_NSGetEnviron())
#else
extern "C" char** environ;
#endif
#endif

namespace toolshed {

namespace fs = std::filesystem;

Platform get_current_platform() {
#if defined(__APPLE__)
    return Platform::macOS;
#elif defined(_WIN32)
    return Platform::Windows;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

namespace {

// "<dir>/.<name>.<uuid>.tmp": hidden from library listings, same filesystem
// as the target so the final rename stays atomic.
std::string sibling_temp_path(const std::string& path) {
    fs::path p(path);
    std::string name = "." + p.filename().string() + "." + generate_uuid() + ".tmp";
    return to_portable_path((p.parent_path() / name).string());
}

std::string format_time(std::time_t t, const char* format, bool local) {
    std::tm tm_buf;
#ifdef _WIN32
    if (local) localtime_s(&tm_buf, &t); else gmtime_s(&tm_buf, &t);
#else
    if (local) localtime_r(&t, &tm_buf); else gmtime_r(&t, &tm_buf);
#endif
    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), format, &tm_buf);
    return std::string(buf, n);
}

#ifndef _WIN32

class ScopedFd {
public:
    explicit ScopedFd(int fd) : fd_(fd) {}
    ~ScopedFd() { reset(); }

    ScopedFd(const ScopedFd&) = delete;
    ScopedFd& operator=(const ScopedFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

    // Close now; false when close() itself reports an error
    bool reset() {
        if (fd_ < 0) return true;
        int rc = close(fd_);
        fd_ = -1;
        return rc == 0;
    }

private:
    int fd_;
};

bool sync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

void sync_directory(const std::string& dir_path) {
    if (dir_path.empty()) return;
    ScopedFd dir(open(dir_path.c_str(), O_RDONLY));
    if (dir.valid()) {
        sync_fd(dir.get());
    }
}

// write() until everything is out, retrying interrupted calls
bool write_all(int fd, const char* data, size_t size) {
    while (size > 0) {
        ssize_t n = write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

#endif

} // namespace

// ============================================================================
// Atomic Replacement
// ============================================================================

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    AtomicWriteResult result;
    std::string temp_path = sibling_temp_path(path);

#ifdef _WIN32
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            result.error = "cannot create " + temp_path;
            return result;
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out.flush()) {
            out.close();
            DeleteFileA(temp_path.c_str());
            result.error = "write failed for " + path;
            return result;
        }
    }

    if (!MoveFileExA(temp_path.c_str(), path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DeleteFileA(temp_path.c_str());
        result.error = "cannot move " + temp_path + " onto " + path;
        return result;
    }
#else
    ScopedFd fd(open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644));
    if (!fd.valid()) {
        result.error = "cannot create " + temp_path + ": " + std::strerror(errno);
        return result;
    }

    auto discard = [&](const std::string& message) {
        fd.reset();
        unlink(temp_path.c_str());
        result.error = message;
        return result;
    };

    if (!write_all(fd.get(), content.data(), content.size())) {
        return discard("write failed for " + path + ": " + std::strerror(errno));
    }
    if (!sync_fd(fd.get())) {
        return discard("fsync failed for " + path + ": " + std::strerror(errno));
    }
    if (!fd.reset()) {
        return discard("close failed for " + path + ": " + std::strerror(errno));
    }

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        int err = errno;
        unlink(temp_path.c_str());
        result.error = "cannot move " + temp_path + " onto " + path + ": " + std::strerror(err);
        return result;
    }
    sync_directory(get_parent_directory(path));
#endif

    result.ok = true;
    return result;
}

AtomicWriteResult replace_directory(const std::string& staged, const std::string& destination) {
    AtomicWriteResult result;
    std::error_code ec;

    fs::create_directories(fs::path(destination).parent_path(), ec);
    if (ec) {
        result.error = "cannot create parent of " + destination + ": " + ec.message();
        return result;
    }

    // Park the previous tree so a failed move can put it back
    std::string parked;
    if (fs::exists(destination, ec)) {
        parked = sibling_temp_path(destination);
        fs::rename(destination, parked, ec);
        if (ec) {
            result.error = "cannot move previous " + destination + " aside: " + ec.message();
            return result;
        }
    }

    fs::rename(staged, destination, ec);
    if (ec) {
        result.error = "cannot move " + staged + " to " + destination + ": " + ec.message();
        if (!parked.empty()) {
            std::error_code restore_ec;
            fs::rename(parked, destination, restore_ec);
            if (restore_ec) {
                result.error += " (previous copy left at " + parked + ")";
            }
        }
        return result;
    }

    if (!parked.empty()) {
        fs::remove_all(parked, ec);
        if (ec) {
            spdlog::warn("replaced {} but could not remove old copy {}: {}", destination, parked, ec.message());
        }
    }

#ifndef _WIN32
    sync_directory(get_parent_directory(destination));
#endif

    result.ok = true;
    return result;
}

// ============================================================================
// Paths and Files
// ============================================================================

std::string to_portable_path(const std::string& path) {
    std::string out(path);
    std::replace(out.begin(), out.end(), '\\', '/');
    return out;
}

std::string get_parent_directory(const std::string& path) {
    return fs::path(path).parent_path().string();
}

std::string get_filename(const std::string& path) {
    return fs::path(path).filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    return to_portable_path((fs::path(base) / rel).string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool is_executable_file(const std::string& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::is_regular_file(status)) return false;
#ifdef _WIN32
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".exe" || ext == ".bat" || ext == ".cmd";
#else
    constexpr auto any_exec = fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec;
    return (status.permissions() & any_exec) != fs::perms::none;
#endif
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> names;
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) return names;

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        names.push_back(it->path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

bool remove_directory(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    return !ec;
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec) && !ec;
}

bool copy_file(const std::string& src, const std::string& dst) {
    std::error_code ec;
    return fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec) && !ec;
}

std::optional<uint64_t> file_size(const std::string& path) {
    std::error_code ec;
    uintmax_t size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return static_cast<uint64_t>(size);
}

uint64_t directory_size(const std::string& path) {
    uint64_t total = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) continue;
        uintmax_t size = it->file_size(entry_ec);
        if (!entry_ec) total += size;
    }
    return total;
}

std::string last_write_timestamp(const std::string& path) {
    std::error_code ec;
    auto written = fs::last_write_time(path, ec);
    if (ec) return "";
    auto as_system = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        written - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return format_time(std::chrono::system_clock::to_time_t(as_system), "%Y-%m-%dT%H:%M:%SZ", false);
}

// ============================================================================
// Environment and Time
// ============================================================================

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* raw = nullptr;
    size_t len = 0;
    if (_dupenv_s(&raw, &len, name.c_str()) != 0 || raw == nullptr) {
        return std::nullopt;
    }
    std::string value(raw);
    free(raw);
    return value;
#else
    const char* raw = std::getenv(name.c_str());
    return raw ? std::optional<std::string>(raw) : std::nullopt;
#endif
}

std::unordered_map<std::string, std::string> get_all_env() {
    std::unordered_map<std::string, std::string> env;

    auto add = [&env](const std::string& entry) {
        auto eq = entry.find('=');
        // Windows keeps per-drive cwd entries like "=C:=C:\"
        if (eq != std::string::npos && eq > 0) {
            env[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    };

#ifdef _WIN32
    char* block = GetEnvironmentStrings();
    if (block) {
        for (const char* p = block; *p; p += std::strlen(p) + 1) {
            add(p);
        }
        FreeEnvironmentStrings(block);
    }
#else
    for (char** ep = environ; *ep; ++ep) {
        add(*ep);
    }
#endif

    return env;
}

std::string get_current_timestamp() {
    return format_time(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()),
                       "%Y-%m-%dT%H:%M:%SZ", false);
}

std::string get_filename_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    char suffix[8];
    std::snprintf(suffix, sizeof(suffix), "_%03d", static_cast<int>(millis));
    return format_time(std::chrono::system_clock::to_time_t(now), "%Y%m%d_%H%M%S", true) + suffix;
}

std::string generate_uuid() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t hi = dis(gen);
    uint64_t lo = dis(gen);

    // RFC 4122 version 4, variant 10
    hi = (hi & ~0xF000ULL) | 0x4000ULL;
    lo = (lo & ~(0xC000ULL << 48)) | (0x8000ULL << 48);

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

} // namespace toolshed
