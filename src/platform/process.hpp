#pragma once

#include <map>
#include <string>
#include <vector>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#endif

namespace platform {

using EnvMap = std::map<std::string, std::string>;

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Wait for the process to exit. Returns its exit code; a child killed
    // by a signal reports 128 + signal number. -1 on error.
    int wait();

private:
#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
    HANDLE thread_ = INVALID_HANDLE_VALUE;
#else
    int pid_ = -1;
#endif
    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args,
                               const EnvMap& extra_env);
};

// Spawn `program` (a path, not looked up on PATH) with inherited stdio.
// extra_env entries are added to (or override) the parent's environment.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args,
                    const EnvMap& extra_env = {});

} // namespace platform
