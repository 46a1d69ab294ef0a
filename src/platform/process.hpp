#pragma once

#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#endif

namespace platform {

// A spawned local child process (used to drive the cross-compiler).
// stdout/stderr are inherited so the tool's own messages reach the user.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process was successfully spawned.
    bool valid() const;

    // Wait for the process to exit. Returns its exit code, or nullopt if
    // timeout_ms elapsed first. timeout_ms = -1 waits indefinitely.
    std::optional<int> wait(int timeout_ms = -1);

    // Terminate the process (SIGTERM then SIGKILL on Unix, TerminateProcess on Windows).
    void terminate();

private:
#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
    HANDLE thread_ = INVALID_HANDLE_VALUE;
#else
    int pid_ = -1;
#endif
    std::optional<int> exit_code_;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args);
};

// Spawn a child process. Check valid() on the result.
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args);

// Exit code reported when exec itself fails in the child.
constexpr int EXEC_FAILED_EXIT_CODE = 127;

} // namespace platform
