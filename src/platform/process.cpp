#include "process.hpp"

#ifdef _WIN32
#  include <windows.h>
#  include <cstdlib>
#else
#  include <unistd.h>
#  include <sys/wait.h>
#  include <signal.h>
#  include <cstdlib>

extern char** environ;
#endif

#include <cerrno>
#include <sstream>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
    if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
#endif
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
#ifdef _WIN32
    handle_ = other.handle_;
    thread_ = other.thread_;
    other.handle_ = INVALID_HANDLE_VALUE;
    other.thread_ = INVALID_HANDLE_VALUE;
#else
    pid_ = other.pid_;
    other.pid_ = -1;
#endif
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
#ifdef _WIN32
        if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
        if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
        handle_ = other.handle_;
        thread_ = other.thread_;
        other.handle_ = INVALID_HANDLE_VALUE;
        other.thread_ = INVALID_HANDLE_VALUE;
#else
        pid_ = other.pid_;
        other.pid_ = -1;
#endif
    }
    return *this;
}

bool ProcessHandle::valid() const {
#ifdef _WIN32
    return handle_ != INVALID_HANDLE_VALUE;
#else
    return pid_ > 0;
#endif
}

#ifndef _WIN32
static int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}
#endif

int ProcessHandle::wait() {
#ifdef _WIN32
    if (handle_ == INVALID_HANDLE_VALUE) return -1;
    if (WaitForSingleObject(handle_, INFINITE) != WAIT_OBJECT_0) return -1;
    DWORD code = 1;
    GetExitCodeProcess(handle_, &code);
    return static_cast<int>(code);
#else
    if (pid_ <= 0) return -1;
    int status = 0;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    int code = ret == pid_ ? decode_status(status) : -1;
    pid_ = -1;
    return code;
#endif
}

// ── spawn ────────────────────────────────────────────────────

#ifdef _WIN32

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const EnvMap& extra_env) {
    ProcessHandle handle;

    std::ostringstream cmdline;
    cmdline << "\"" << program << "\"";
    for (const auto& arg : args) {
        cmdline << " \"" << arg << "\"";
    }
    std::string cmd_str = cmdline.str();

    // The child inherits the current block, so set the extras here and
    // restore them once CreateProcess has copied it.
    std::map<std::string, std::string> saved;
    for (const auto& kv : extra_env) {
        const char* old = std::getenv(kv.first.c_str());
        saved[kv.first] = old ? old : "";
        SetEnvironmentVariableA(kv.first.c_str(), kv.second.c_str());
    }

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};
    if (CreateProcessA(nullptr, cmd_str.data(), nullptr, nullptr, TRUE,
                       0, nullptr, nullptr, &si, &pi)) {
        handle.handle_ = pi.hProcess;
        handle.thread_ = pi.hThread;
    }

    for (const auto& kv : saved) {
        SetEnvironmentVariableA(kv.first.c_str(),
                                kv.second.empty() ? nullptr : kv.second.c_str());
    }
    return handle;
}

#else // Unix

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const EnvMap& extra_env) {
    ProcessHandle handle;

    // argv and envp are built before forking: the child only calls
    // execve and _exit
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    std::vector<std::string> env_strings;
    for (char** e = environ; *e; ++e) {
        std::string entry(*e);
        if (extra_env.count(entry.substr(0, entry.find('=')))) continue;
        env_strings.push_back(std::move(entry));
    }
    for (const auto& kv : extra_env) env_strings.push_back(kv.first + "=" + kv.second);
    std::vector<const char*> envp;
    for (const auto& e : env_strings) envp.push_back(e.c_str());
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        execve(program.c_str(), const_cast<char* const*>(argv.data()),
               const_cast<char* const*>(envp.data()));
        _exit(127);  // exec failed
    }

    handle.pid_ = pid;
    return handle;
}

#endif

} // namespace platform
