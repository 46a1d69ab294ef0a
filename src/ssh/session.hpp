#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <platform/socket_util.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

struct SessionTarget {
    std::string host;
    int port = 22;
    std::string user;
    std::string password;
    int timeout = 10;
};

// Owns the TCP socket and the authenticated libssh2 session for one device.
// Channels (exec, SFTP) are opened on top of it by SSHConnection.
class SessionManager {
public:
    explicit SessionManager(const SessionTarget& target);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    SSHResult establish(StatusCallback callback = nullptr);
    void close();
    bool is_active() const;

    // Send an SSH keepalive if one is due
    void send_keepalive();

    LIBSSH2_SESSION* get_raw_session() { return session_; }
    socket_t get_socket() const { return sock_; }
    const std::string& get_target() const { return target_str_; }
    std::shared_ptr<std::mutex> io_mutex() { return io_mutex_; }

private:
    SessionTarget target_;
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    bool active_;
    std::string target_str_;
    std::shared_ptr<std::mutex> io_mutex_;

    SSHResult ssh_userauth(StatusCallback callback);
    void teardown(const char* reason);
};
