#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include "transport.hpp"
#include "session.hpp"
#include "sftp_channel.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// TransportHandle over one authenticated libssh2 session. Every command gets
// its own exec channel; the SFTP channel is opened once and kept.
class SSHConnection : public TransportHandle {
public:
    SSHConnection(std::string address, std::shared_ptr<SessionManager> session);
    ~SSHConnection() override;

    SSHConnection(const SSHConnection&) = delete;
    SSHConnection& operator=(const SSHConnection&) = delete;

    const std::string& address() const override { return address_; }
    bool is_open() const override;

    SSHResult run(const std::string& command, int timeout_ms) override;
    Result<std::unique_ptr<RemoteProcess>> spawn(const std::string& command) override;
    Result<FileChannel*> open_file_channel() override;
    FileChannel* file_channel() override { return sftp_.get(); }
    void close() override;

private:
    std::string address_;
    std::shared_ptr<SessionManager> session_;
    std::shared_ptr<std::mutex> io_mutex_;
    std::unique_ptr<SftpChannel> sftp_;

    // Open a session channel and exec command on it; nullptr on failure
    LIBSSH2_CHANNEL* open_exec_channel(const std::string& command,
                                       std::chrono::steady_clock::time_point deadline,
                                       std::string& err);
};
