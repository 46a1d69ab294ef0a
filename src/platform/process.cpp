#include "process.hpp"
#include "platform.hpp"

#ifndef _WIN32
#  include <unistd.h>
#  include <sys/wait.h>
#  include <signal.h>
#endif

#include <sstream>

namespace platform {

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
    if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
#else
    // Reap a still-running child so it does not linger as a zombie
    if (pid_ > 0 && !exit_code_) {
        terminate();
    }
#endif
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : exit_code_(other.exit_code_) {
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
        exit_code_ = other.exit_code_;
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

std::optional<int> ProcessHandle::wait(int timeout_ms) {
    if (exit_code_) return exit_code_;
#ifdef _WIN32
    if (handle_ == INVALID_HANDLE_VALUE) return std::nullopt;
    DWORD ms = (timeout_ms < 0) ? INFINITE : static_cast<DWORD>(timeout_ms);
    if (WaitForSingleObject(handle_, ms) != WAIT_OBJECT_0) return std::nullopt;
    DWORD code = 1;
    GetExitCodeProcess(handle_, &code);
    exit_code_ = static_cast<int>(code);
    return exit_code_;
#else
    if (pid_ <= 0) return std::nullopt;
    int status = 0;
    if (timeout_ms < 0) {
        if (waitpid(pid_, &status, 0) != pid_) return std::nullopt;
        exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    while (true) {
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return exit_code_;
        }
        if (ret < 0 || elapsed >= timeout_ms) break;
        sleep_ms(50);
        elapsed += 50;
    }
    return std::nullopt;
#endif
}

void ProcessHandle::terminate() {
    if (exit_code_) return;
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) {
        TerminateProcess(handle_, 1);
        WaitForSingleObject(handle_, 2000);
        exit_code_ = -1;
    }
#else
    if (pid_ <= 0) return;
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    for (int i = 0; i < 20; i++) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            exit_code_ = -1;
            return;
        }
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    exit_code_ = -1;
#endif
}

#ifdef _WIN32

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args) {
    ProcessHandle handle;

    std::ostringstream cmdline;
    cmdline << "\"" << program << "\"";
    for (const auto& arg : args) {
        cmdline << " \"" << arg << "\"";
    }
    std::string cmd_str = cmdline.str();

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    if (CreateProcessA(nullptr, cmd_str.data(), nullptr, nullptr, TRUE,
                       0, nullptr, nullptr, &si, &pi)) {
        handle.handle_ = pi.hProcess;
        handle.thread_ = pi.hThread;
    }
    return handle;
}

#else // Unix

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args) {
    ProcessHandle handle;

    // Build argv before fork; only async-signal-safe calls in the child
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) return handle;  // fork failed

    if (pid == 0) {
        close(STDIN_FILENO);
        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        _exit(EXEC_FAILED_EXIT_CODE);
    }

    handle.pid_ = pid;
    return handle;
}

#endif

} // namespace platform
