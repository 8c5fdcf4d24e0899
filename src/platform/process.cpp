#include "toolshed/process.hpp"
#include "toolshed/platform.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>
#endif

namespace toolshed {

namespace {

// Inherited environment with the request's variables layered on top
std::vector<std::string> build_environment(const SpawnRequest& request) {
    auto merged = get_all_env();
    for (const auto& [name, value] : request.extra_environment) {
        merged[name] = value;
    }

    std::vector<std::string> entries;
    entries.reserve(merged.size());
    for (const auto& [name, value] : merged) {
        entries.push_back(name + "=" + value);
    }
    return entries;
}

#ifdef _WIN32

// Quote one argument the way CommandLineToArgvW splits it back apart
std::string quote_windows_argument(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
        return arg;
    }
    std::string quoted = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
            continue;
        }
        if (c == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
        } else {
            quoted.append(backslashes, '\\');
        }
        backslashes = 0;
        quoted += c;
    }
    quoted.append(backslashes * 2, '\\');
    quoted += '"';
    return quoted;
}

std::string build_command_line(const SpawnRequest& request) {
    std::string cmd = quote_windows_argument(request.executable);
    for (const auto& arg : request.arguments) {
        cmd += ' ';
        cmd += quote_windows_argument(arg);
    }
    return cmd;
}

std::string build_environment_block(const std::vector<std::string>& env) {
    std::string block;
    for (const auto& e : env) {
        block += e;
        block += '\0';
    }
    block += '\0';
    return block;
}

SpawnResult spawn_windows(const SpawnRequest& request) {
    SpawnResult result;

    std::string cmd_line = build_command_line(request);
    std::string env_block = build_environment_block(build_environment(request));

    STARTUPINFOA si = {0};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {0};

    BOOL success = CreateProcessA(
        request.executable.c_str(),
        const_cast<char*>(cmd_line.c_str()),
        nullptr,
        nullptr,
        FALSE,
        DETACHED_PROCESS,
        const_cast<char*>(env_block.c_str()),
        request.working_directory.empty() ? nullptr : request.working_directory.c_str(),
        &si,
        &pi);

    if (!success) {
        result.error = "CreateProcess failed: " + std::to_string(GetLastError());
        return result;
    }

    result.ok = true;
    result.pid = static_cast<int64_t>(pi.dwProcessId);
    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);
    return result;
}

#else

// Writes errno to the status pipe and leaves; only async-signal-safe calls
[[noreturn]] void child_fail(int status_fd) {
    int err = errno;
    ssize_t ignored = write(status_fd, &err, sizeof(err));
    (void)ignored;
    _exit(127);
}

SpawnResult spawn_unix(const SpawnRequest& request) {
    SpawnResult result;

    // Everything the child touches is built before fork()
    std::vector<std::string> args{request.executable};
    args.insert(args.end(), request.arguments.begin(), request.arguments.end());
    std::vector<std::string> env = build_environment(request);

    auto to_pointers = [](std::vector<std::string>& strings) {
        std::vector<char*> ptrs;
        ptrs.reserve(strings.size() + 1);
        for (auto& s : strings) ptrs.push_back(s.data());
        ptrs.push_back(nullptr);
        return ptrs;
    };
    std::vector<char*> argv = to_pointers(args);
    std::vector<char*> envp = to_pointers(env);

    // A failed chdir/execve in the child arrives as an errno on this pipe.
    // A successful exec closes the write end (CLOEXEC) and read() sees EOF.
    int status_pipe[2];
    if (pipe(status_pipe) != 0) {
        result.error = "pipe failed: " + std::string(std::strerror(errno));
        return result;
    }
    if (fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC) != 0) {
        result.error = "fcntl failed: " + std::string(std::strerror(errno));
        close(status_pipe[0]);
        close(status_pipe[1]);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.error = "fork failed: " + std::string(std::strerror(errno));
        close(status_pipe[0]);
        close(status_pipe[1]);
        return result;
    }

    if (pid == 0) {
        close(status_pipe[0]);
        // Own session: closing the launching terminal does not take the tool down
        setsid();
        if (!request.working_directory.empty() && chdir(request.working_directory.c_str()) != 0) {
            child_fail(status_pipe[1]);
        }
        execve(argv[0], argv.data(), envp.data());
        child_fail(status_pipe[1]);
    }

    close(status_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        result.error = "failed to start " + request.executable + ": " + std::strerror(child_errno);
        return result;
    }

    result.ok = true;
    result.pid = static_cast<int64_t>(pid);
    return result;
}

#endif

} // namespace

SpawnResult spawn_detached(const SpawnRequest& request) {
#ifdef _WIN32
    auto result = spawn_windows(request);
#else
    auto result = spawn_unix(request);
#endif
    if (result.ok) {
        spdlog::info("started {} (pid {})", request.executable, result.pid);
    } else {
        spdlog::error("{}", result.error);
    }
    return result;
}

} // namespace toolshed
