#pragma once

#include <memory>
#include <mutex>
#include <string>
#include "transport.hpp"
#include "session.hpp"

typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

// SFTP subsystem on an established session. SFTP has no server-side working
// directory, so chdir() is tracked here and relative paths are resolved
// against it before every request.
class SftpChannel : public FileChannel {
public:
    SftpChannel(std::shared_ptr<SessionManager> session, LIBSSH2_SFTP* sftp);
    ~SftpChannel() override;

    SftpChannel(const SftpChannel&) = delete;
    SftpChannel& operator=(const SftpChannel&) = delete;

    // Start the SFTP subsystem on the session
    static Result<std::unique_ptr<SftpChannel>> open(std::shared_ptr<SessionManager> session);

    Result<bool> exists(const std::string& path) override;
    Result<void> mkdir(const std::string& path) override;
    Result<void> write_file(const std::string& path, const std::string& data) override;
    Result<std::string> getcwd() override;
    Result<void> chdir(const std::string& path) override;
    void close() override;

private:
    std::shared_ptr<SessionManager> session_;
    std::shared_ptr<std::mutex> io_mutex_;
    LIBSSH2_SFTP* sftp_;
    std::string cwd_;

    std::string resolve(const std::string& path);
    std::string last_error(const std::string& what, int rc);
};
