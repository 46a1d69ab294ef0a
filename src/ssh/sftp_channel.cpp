#include "sftp_channel.hpp"
#include "eagain.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <algorithm>

SftpChannel::SftpChannel(std::shared_ptr<SessionManager> session, LIBSSH2_SFTP* sftp)
    : session_(std::move(session)), io_mutex_(session_->io_mutex()), sftp_(sftp) {
}

SftpChannel::~SftpChannel() {
    close();
}

Result<std::unique_ptr<SftpChannel>> SftpChannel::open(std::shared_ptr<SessionManager> session) {
    using R = Result<std::unique_ptr<SftpChannel>>;
    if (!session || !session->is_active()) {
        return R::Err(ErrorKind::Connection, "No active session for SFTP");
    }

    LIBSSH2_SESSION* raw = session->get_raw_session();
    auto io = session->io_mutex();
    LIBSSH2_SFTP* sftp = retry_eagain_ptr<LIBSSH2_SFTP>(
        *io, raw, deadline_after_secs(CHANNEL_OPEN_TIMEOUT_SECS),
        [&] { return libssh2_sftp_init(raw); });
    if (!sftp) {
        return R::Err(ErrorKind::Connection, "Failed to start SFTP subsystem");
    }

    return R::Ok(std::make_unique<SftpChannel>(std::move(session), sftp));
}

std::string SftpChannel::last_error(const std::string& what, int rc) {
    if (rc == LIBSSH2_ERROR_EAGAIN) {
        return fmt::format("{}: timed out", what);
    }
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        unsigned long code;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            code = libssh2_sftp_last_error(sftp_);
        }
        return fmt::format("{}: SFTP status {}", what, code);
    }
    return fmt::format("{}: libssh2 error {}", what, rc);
}

std::string SftpChannel::resolve(const std::string& path) {
    if (!path.empty() && path[0] == '/') return path;
    if (cwd_.empty()) {
        auto cwd = getcwd();
        if (cwd.is_ok()) cwd_ = cwd.value;
    }
    return join_remote_path(cwd_, path);
}

Result<bool> SftpChannel::exists(const std::string& path) {
    if (!sftp_) return Result<bool>::Err(ErrorKind::RemoteFilesystem, "SFTP channel closed");

    std::string full = resolve(path);
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    int rc = retry_eagain(*io_mutex_, deadline_after_secs(SFTP_OP_TIMEOUT_SECS), [&] {
        return libssh2_sftp_stat_ex(sftp_, full.c_str(), static_cast<unsigned int>(full.size()),
                                    LIBSSH2_SFTP_STAT, &attrs);
    });
    if (rc == 0) return Result<bool>::Ok(true);

    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        unsigned long code;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            code = libssh2_sftp_last_error(sftp_);
        }
        if (code == LIBSSH2_FX_NO_SUCH_FILE || code == LIBSSH2_FX_NO_SUCH_PATH) {
            return Result<bool>::Ok(false);
        }
    }
    return Result<bool>::Err(ErrorKind::RemoteFilesystem, last_error("stat " + full, rc));
}

Result<void> SftpChannel::mkdir(const std::string& path) {
    if (!sftp_) return Result<void>::Err(ErrorKind::RemoteFilesystem, "SFTP channel closed");

    std::string full = resolve(path);
    int rc = retry_eagain(*io_mutex_, deadline_after_secs(SFTP_OP_TIMEOUT_SECS), [&] {
        return libssh2_sftp_mkdir_ex(sftp_, full.c_str(), static_cast<unsigned int>(full.size()),
                                     LIBSSH2_SFTP_S_IRWXU | LIBSSH2_SFTP_S_IRGRP |
                                     LIBSSH2_SFTP_S_IXGRP | LIBSSH2_SFTP_S_IROTH |
                                     LIBSSH2_SFTP_S_IXOTH);
    });
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::RemoteFilesystem, last_error("mkdir " + full, rc));
    }
    brickdev_log("sftp: mkdir " + full);
    return Result<void>::Ok();
}

Result<void> SftpChannel::write_file(const std::string& path, const std::string& data) {
    if (!sftp_) return Result<void>::Err(ErrorKind::Transfer, "SFTP channel closed");

    std::string full = resolve(path);
    LIBSSH2_SESSION* raw = session_->get_raw_session();
    LIBSSH2_SFTP_HANDLE* fh = retry_eagain_ptr<LIBSSH2_SFTP_HANDLE>(
        *io_mutex_, raw, deadline_after_secs(SFTP_OP_TIMEOUT_SECS), [&] {
            return libssh2_sftp_open_ex(sftp_, full.c_str(), static_cast<unsigned int>(full.size()),
                                        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                        LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR |
                                        LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IROTH,
                                        LIBSSH2_SFTP_OPENFILE);
        });
    if (!fh) {
        return Result<void>::Err(ErrorKind::Transfer, "Cannot open remote file " + full);
    }

    size_t sent = 0;
    std::string error;
    while (sent < data.size()) {
        size_t chunk = std::min(data.size() - sent, static_cast<size_t>(SFTP_WRITE_CHUNK));
        int w = retry_eagain(*io_mutex_, deadline_after_secs(SFTP_OP_TIMEOUT_SECS), [&] {
            return libssh2_sftp_write(fh, data.data() + sent, chunk);
        });
        if (w < 0) {
            error = last_error("write " + full, w);
            break;
        }
        sent += static_cast<size_t>(w);
    }

    int rc = retry_eagain(*io_mutex_, deadline_after_secs(SFTP_OP_TIMEOUT_SECS), [&] {
        return libssh2_sftp_close_handle(fh);
    });
    if (error.empty() && rc != 0) {
        error = last_error("close " + full, rc);
    }
    if (!error.empty()) {
        return Result<void>::Err(ErrorKind::Transfer, error);
    }

    brickdev_log(fmt::format("sftp: wrote {} bytes to {}", data.size(), full));
    return Result<void>::Ok();
}

Result<std::string> SftpChannel::getcwd() {
    if (!cwd_.empty()) return Result<std::string>::Ok(cwd_);
    if (!sftp_) return Result<std::string>::Err(ErrorKind::RemoteFilesystem, "SFTP channel closed");

    char buf[1024];
    int rc = retry_eagain(*io_mutex_, deadline_after_secs(SFTP_OP_TIMEOUT_SECS), [&] {
        return libssh2_sftp_symlink_ex(sftp_, ".", 1, buf, sizeof(buf) - 1,
                                       LIBSSH2_SFTP_REALPATH);
    });
    if (rc < 0) {
        return Result<std::string>::Err(ErrorKind::RemoteFilesystem, last_error("realpath .", rc));
    }
    cwd_.assign(buf, static_cast<size_t>(rc));
    return Result<std::string>::Ok(cwd_);
}

Result<void> SftpChannel::chdir(const std::string& path) {
    if (!sftp_) return Result<void>::Err(ErrorKind::RemoteFilesystem, "SFTP channel closed");

    std::string full = resolve(path);
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    int rc = retry_eagain(*io_mutex_, deadline_after_secs(SFTP_OP_TIMEOUT_SECS), [&] {
        return libssh2_sftp_stat_ex(sftp_, full.c_str(), static_cast<unsigned int>(full.size()),
                                    LIBSSH2_SFTP_STAT, &attrs);
    });
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::RemoteFilesystem, last_error("chdir " + full, rc));
    }
    if (!LIBSSH2_SFTP_S_ISDIR(attrs.permissions)) {
        return Result<void>::Err(ErrorKind::RemoteFilesystem, "Not a directory: " + full);
    }
    cwd_ = full;
    return Result<void>::Ok();
}

void SftpChannel::close() {
    if (!sftp_) return;
    if (!session_->is_active()) {
        sftp_ = nullptr;
        return;
    }
    int rc = retry_eagain(*io_mutex_, deadline_after_ms(1000), [&] {
        return libssh2_sftp_shutdown(sftp_);
    });
    if (rc != 0) {
        brickdev_log(fmt::format("sftp: shutdown returned {}", rc));
    }
    sftp_ = nullptr;
}
