#include "exec_process.hpp"
#include "eagain.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>
#include <thread>

int channel_exit_code(LIBSSH2_SESSION* session, LIBSSH2_CHANNEL* channel) {
    char* signal = nullptr;
    size_t signal_len = 0;
    libssh2_channel_get_exit_signal(channel, &signal, &signal_len,
                                    nullptr, nullptr, nullptr, nullptr);
    if (signal) {
        std::string name(signal, signal_len);
        libssh2_free(session, signal);
        brickdev_log("exec: killed by SIG" + name);
        return signal_exit_code(name);
    }
    return libssh2_channel_get_exit_status(channel);
}

ExecProcess::ExecProcess(std::shared_ptr<SessionManager> session, LIBSSH2_CHANNEL* channel,
                         std::string command)
    : session_(std::move(session)), io_mutex_(session_->io_mutex()),
      channel_(channel), command_(std::move(command)) {
}

ExecProcess::~ExecProcess() {
    close();
}

bool ExecProcess::pop_line(std::string& line) {
    auto nl = stderr_buf_.find('\n');
    if (nl == std::string::npos) return false;
    line = stderr_buf_.substr(0, nl);
    stderr_buf_.erase(0, nl + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return true;
}

void ExecProcess::flush_stdout(bool final) {
    size_t nl;
    while ((nl = stdout_buf_.find('\n')) != std::string::npos) {
        brickdev_log("exec stdout: " + stdout_buf_.substr(0, nl));
        stdout_buf_.erase(0, nl + 1);
    }
    if (final && !stdout_buf_.empty()) {
        brickdev_log("exec stdout: " + stdout_buf_);
        stdout_buf_.clear();
    }
}

LineRead ExecProcess::read_line(std::chrono::milliseconds timeout) {
    std::string line;
    if (pop_line(line)) return LineRead::got(std::move(line));
    if (!channel_) return LineRead::failed("Process channel already closed");
    if (!session_->is_active()) return LineRead::failed("SSH session closed");

    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[SSH_READ_BUF_SIZE];

    while (true) {
        ssize_t n_err;
        ssize_t n_out;
        bool eof;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n_err = libssh2_channel_read_stderr(channel_, buf, sizeof(buf));
            if (n_err > 0) stderr_buf_.append(buf, static_cast<size_t>(n_err));
            n_out = libssh2_channel_read(channel_, buf, sizeof(buf));
            if (n_out > 0) stdout_buf_.append(buf, static_cast<size_t>(n_out));
            eof = libssh2_channel_eof(channel_) != 0;
        }

        if (n_err < 0 && n_err != LIBSSH2_ERROR_EAGAIN) {
            return LineRead::failed(fmt::format("stderr read failed (libssh2 error {})", n_err));
        }
        if (n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) {
            return LineRead::failed(fmt::format("stdout read failed (libssh2 error {})", n_out));
        }
        flush_stdout(false);

        if (pop_line(line)) return LineRead::got(std::move(line));

        if (n_err > 0 || n_out > 0) continue;

        if (eof) {
            flush_stdout(true);
            // Last line without a trailing newline
            if (!stderr_buf_.empty()) {
                line.swap(stderr_buf_);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                return LineRead::got(std::move(line));
            }
            eof_seen_ = true;
            return LineRead::eof();
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            return LineRead::timeout();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(EAGAIN_SLEEP_MS));
    }
}

std::optional<int> ExecProcess::exit_status() {
    if (exit_code_) return exit_code_;
    // Only after read_line has drained everything up to EOF
    if (!eof_seen_ || !channel_ || !session_->is_active()) return std::nullopt;

    // exit-status or exit-signal may trail EOF; both are in once the remote closes
    if (!close_sent_) {
        int rc = retry_eagain(*io_mutex_, deadline_after_ms(STREAM_POLL_INTERVAL_MS), [&] {
            return libssh2_channel_close(channel_);
        });
        if (rc == LIBSSH2_ERROR_EAGAIN) return std::nullopt;
        close_sent_ = true;
        if (rc != 0) {
            // No reliable status without the remote close
            brickdev_log(fmt::format("exec: channel close for '{}' returned {}", command_, rc));
            exit_code_ = -1;
            return exit_code_;
        }
    }

    std::lock_guard<std::mutex> lock(*io_mutex_);
    exit_code_ = channel_exit_code(session_->get_raw_session(), channel_);
    brickdev_log(fmt::format("exec: '{}' exited with {}", command_, *exit_code_));
    return exit_code_;
}

void ExecProcess::close() {
    if (!channel_) return;

    // libssh2_session_free() already released every channel of a closed session
    if (!session_->is_active()) {
        channel_ = nullptr;
        return;
    }

    if (!close_sent_) {
        // Brief deadline: on a dead session close would otherwise spin forever
        auto deadline = deadline_after_ms(1000);
        int rc = retry_eagain(*io_mutex_, deadline, [&] {
            return libssh2_channel_close(channel_);
        });
        if (rc != 0) {
            brickdev_log(fmt::format("exec: channel close for '{}' returned {}", command_, rc));
        }
        close_sent_ = true;
    }
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_free(channel_);
    }
    channel_ = nullptr;
    brickdev_log(fmt::format("exec: released channel for '{}'", command_));
}
