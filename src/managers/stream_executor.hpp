#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <core/types.hpp>
#include <ssh/transport.hpp>

// One element of a remote process's output sequence.
struct StreamEvent {
    enum class Kind { Line, End, Error };

    Kind kind;
    std::string text;  // the line, or the error message

    static StreamEvent line(std::string l) { return {Kind::Line, std::move(l)}; }
    static StreamEvent end() { return {Kind::End, ""}; }
    static StreamEvent error(std::string e) { return {Kind::Error, std::move(e)}; }
};

// Pull-based producer of a remote process's stderr lines.
//
// next() blocks for at most one poll interval per read, alternating a bounded
// read with an exit-status check. The process is released on every way out:
// End, Error, close(), the cancel flag, or destruction. Once terminated,
// next() keeps returning End.
class OutputStream {
public:
    OutputStream() = default;
    OutputStream(std::unique_ptr<RemoteProcess> process, std::chrono::milliseconds poll);
    ~OutputStream();

    OutputStream(OutputStream&& other) noexcept;
    OutputStream& operator=(OutputStream&& other) noexcept;
    OutputStream(const OutputStream&) = delete;
    OutputStream& operator=(const OutputStream&) = delete;

    StreamEvent next();

    // Stop early and release the process
    void close();

    bool finished() const { return finished_; }

    // Remote exit code, known after a natural End
    std::optional<int> exit_status() const { return exit_status_; }

    // Checked before every read; when set the stream closes and ends
    void set_cancel_flag(const std::atomic<bool>* flag) { cancel_ = flag; }

    // Called once when the process is released, however the stream ends
    void on_finish(std::function<void()> fn) { on_finish_ = std::move(fn); }

    // Consume everything, handing each line to on_line (return false to stop).
    // Yields the exit status, or the stream error.
    Result<int> drain(const std::function<bool(const std::string&)>& on_line);

private:
    std::unique_ptr<RemoteProcess> process_;
    std::chrono::milliseconds poll_{0};
    const std::atomic<bool>* cancel_ = nullptr;
    bool finished_ = true;
    std::optional<int> exit_status_;
    std::function<void()> on_finish_;

    void finish();
    bool cancelled() const { return cancel_ && cancel_->load(); }
};

// Spawns a remote command and hands back its output stream.
class StreamingExecutor {
public:
    explicit StreamingExecutor(std::chrono::milliseconds poll_interval);

    Result<OutputStream> run(TransportHandle& handle, const std::string& command);

    std::chrono::milliseconds poll_interval() const { return poll_; }

private:
    std::chrono::milliseconds poll_;
};
