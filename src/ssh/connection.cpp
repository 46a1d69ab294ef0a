#include "connection.hpp"
#include "eagain.hpp"
#include "exec_process.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <chrono>
#include <thread>

SSHConnection::SSHConnection(std::string address, std::shared_ptr<SessionManager> session)
    : address_(std::move(address)), session_(std::move(session)),
      io_mutex_(session_->io_mutex()) {
}

SSHConnection::~SSHConnection() {
    close();
}

bool SSHConnection::is_open() const {
    return session_ && session_->is_active();
}

LIBSSH2_CHANNEL* SSHConnection::open_exec_channel(const std::string& command,
                                                  std::chrono::steady_clock::time_point deadline,
                                                  std::string& err) {
    if (!is_open()) {
        err = "No active session";
        return nullptr;
    }

    LIBSSH2_SESSION* raw = session_->get_raw_session();
    LIBSSH2_CHANNEL* ch = retry_eagain_ptr<LIBSSH2_CHANNEL>(
        *io_mutex_, raw, deadline, [&] { return libssh2_channel_open_session(raw); });
    if (!ch) {
        err = "Failed to open exec channel";
        return nullptr;
    }

    int rc = retry_eagain(*io_mutex_, deadline, [&] {
        return libssh2_channel_exec(ch, command.c_str());
    });
    if (rc != 0) {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_free(ch);
        err = fmt::format("Failed to exec command on channel (libssh2 error {})", rc);
        return nullptr;
    }
    return ch;
}

SSHResult SSHConnection::run(const std::string& command, int timeout_ms) {
    // One deadline covers channel open, exec and the read loop
    int effective_timeout = (timeout_ms > 0) ? timeout_ms : SSH_CMD_TIMEOUT_SECS * 1000;
    auto deadline = deadline_after_ms(effective_timeout);

    if (is_open()) session_->send_keepalive();

    std::string err;
    LIBSSH2_CHANNEL* ch = open_exec_channel(command, deadline, err);
    if (!ch) {
        return SSHResult{-1, "", err};
    }

    // Read stdout and stderr until the channel reports EOF
    std::string output;
    std::string stderr_data;
    char buf[SSH_READ_BUF_SIZE];
    bool timed_out = true;
    bool read_failed = false;

    while (std::chrono::steady_clock::now() < deadline) {
        ssize_t n_out;
        ssize_t n_err;
        bool eof;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n_out = libssh2_channel_read(ch, buf, sizeof(buf));
            if (n_out > 0) output.append(buf, static_cast<size_t>(n_out));
            n_err = libssh2_channel_read_stderr(ch, buf, sizeof(buf));
            if (n_err > 0) stderr_data.append(buf, static_cast<size_t>(n_err));
            eof = libssh2_channel_eof(ch) != 0;
        }
        if ((n_out < 0 && n_out != LIBSSH2_ERROR_EAGAIN) ||
            (n_err < 0 && n_err != LIBSSH2_ERROR_EAGAIN)) {
            read_failed = true;
            timed_out = false;
            break;
        }
        if (n_out > 0 || n_err > 0) continue;
        if (eof) {
            timed_out = false;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(EAGAIN_SLEEP_MS));
    }

    int exit_status = -1;
    if (!timed_out && !read_failed) {
        int rc = retry_eagain(*io_mutex_, deadline_after_ms(1000), [&] {
            return libssh2_channel_close(ch);
        });
        // Status and signal are only complete once the remote side has closed
        if (rc == 0) {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            exit_status = channel_exit_code(session_->get_raw_session(), ch);
        } else {
            brickdev_log(fmt::format("run: channel close returned {}", rc));
        }
    }

    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_free(ch);
    }

    SSHResult result;
    if (timed_out) {
        result = SSHResult{-1, output, fmt::format("Command timed out after {}ms", effective_timeout)};
    } else if (read_failed) {
        result = SSHResult{-1, output, "SSH channel read error"};
    } else {
        result = SSHResult{exit_status, output, stderr_data};
    }
    brickdev_log_ssh("run", command, result);
    return result;
}

Result<std::unique_ptr<RemoteProcess>> SSHConnection::spawn(const std::string& command) {
    using R = Result<std::unique_ptr<RemoteProcess>>;
    std::string err;
    LIBSSH2_CHANNEL* ch = open_exec_channel(command, deadline_after_secs(CHANNEL_OPEN_TIMEOUT_SECS), err);
    if (!ch) {
        return R::Err(ErrorKind::ProcessSpawn, err + ": " + command);
    }
    brickdev_log("spawn: " + command);
    return R::Ok(std::make_unique<ExecProcess>(session_, ch, command));
}

Result<FileChannel*> SSHConnection::open_file_channel() {
    if (sftp_) return Result<FileChannel*>::Ok(sftp_.get());

    auto opened = SftpChannel::open(session_);
    if (opened.is_err()) {
        return forward_error<FileChannel*>(opened);
    }
    sftp_ = std::move(opened.value);
    return Result<FileChannel*>::Ok(sftp_.get());
}

void SSHConnection::close() {
    // SFTP first, then the session it runs on
    if (sftp_) {
        sftp_->close();
        sftp_.reset();
    }
    if (session_ && session_->is_active()) {
        brickdev_log("connection: closing " + address_);
        session_->close();
    }
}
