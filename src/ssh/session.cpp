#include "session.hpp"
#include "eagain.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <cstring>

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
};

// ev3dev's sshd offers keyboard-interactive with a single password prompt;
// answer every prompt with the password.
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                         const char* /*instruction*/, int /*instruction_len*/,
                         int num_prompts,
                         const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                         LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                         void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
}

static bool init_libssh2() {
    static std::once_flag once;
    static int rc = -1;
    std::call_once(once, [] { rc = libssh2_init(0); });
    return rc == 0;
}

SessionManager::SessionManager(const SessionTarget& target)
    : target_(target), session_(nullptr), sock_(BRICKDEV_INVALID_SOCKET), active_(false),
      io_mutex_(std::make_shared<std::mutex>()) {
}

SessionManager::~SessionManager() {
    close();
}

SSHResult SessionManager::establish(StatusCallback callback) {
    if (callback) {
        callback("Connecting to " + target_.host + "...");
    }

    if (!init_libssh2()) {
        return SSHResult{-1, "", "Failed to initialize libssh2"};
    }

    std::string err;
    sock_ = platform::connect_tcp(target_.host, target_.port, target_.timeout * 1000, err);
    if (sock_ == BRICKDEV_INVALID_SOCKET) {
        return SSHResult{-1, "", err};
    }

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        platform::close_socket(sock_);
        sock_ = BRICKDEV_INVALID_SOCKET;
        return SSHResult{-1, "", "Failed to create SSH session"};
    }

    libssh2_session_set_blocking(session_, 0);

    auto deadline = deadline_after_secs(target_.timeout);

    // SSH handshake (key exchange)
    int ret = retry_eagain(*io_mutex_, deadline, [&] {
        return libssh2_session_handshake(session_, sock_);
    });
    if (ret != 0) {
        teardown("Handshake failed");
        return SSHResult{-1, "", ret == LIBSSH2_ERROR_EAGAIN
                                     ? "SSH handshake timed out: " + target_.host
                                     : "SSH handshake failed"};
    }

    // Keepalive every 30s, sent by send_keepalive() before each command
    libssh2_keepalive_config(session_, 1, 30);

    auto auth_result = ssh_userauth(callback);
    if (auth_result.failed()) {
        teardown("Authentication failed");
        return auth_result;
    }

    active_ = true;
    target_str_ = target_.user + "@" + target_.host;
    brickdev_log(fmt::format("session: established {}:{}", target_str_, target_.port));

    return SSHResult{0, "", ""};
}

SSHResult SessionManager::ssh_userauth(StatusCallback /*callback*/) {
    auto deadline = deadline_after_secs(target_.timeout);

    // Check what auth methods the server supports
    char* auth_list = retry_eagain_ptr<char>(*io_mutex_, session_, deadline, [&] {
        return libssh2_userauth_list(session_, target_.user.c_str(),
                                     static_cast<unsigned int>(target_.user.length()));
    });

    std::string methods = auth_list ? auth_list : "";
    brickdev_log("session: auth methods: " + methods);

    int ret = -1;
    if (methods.empty() || methods.find("password") != std::string::npos) {
        ret = retry_eagain(*io_mutex_, deadline, [&] {
            return libssh2_userauth_password(session_, target_.user.c_str(),
                                             target_.password.c_str());
        });
        if (ret == 0) return SSHResult{0, "", ""};
    }

    if (methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data;
        kbd_data.password = target_.password;
        *libssh2_session_abstract(session_) = &kbd_data;

        ret = retry_eagain(*io_mutex_, deadline, [&] {
            return libssh2_userauth_keyboard_interactive(session_, target_.user.c_str(),
                                                         kbd_callback);
        });
        *libssh2_session_abstract(session_) = nullptr;
        if (ret == 0) return SSHResult{0, "", ""};
    }

    if (ret == LIBSSH2_ERROR_EAGAIN) {
        return SSHResult{-1, "", "Authentication timed out"};
    }
    return SSHResult{-1, "", fmt::format("Authentication failed for {}@{} (check user/password)",
                                         target_.user, target_.host)};
}

void SessionManager::teardown(const char* reason) {
    if (session_) {
        libssh2_session_disconnect(session_, reason);
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != BRICKDEV_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = BRICKDEV_INVALID_SOCKET;
    }
}

void SessionManager::close() {
    // Mark inactive first so concurrent operations bail out early
    active_ = false;

    // Each libssh2 call gets its own brief lock; disconnect does network I/O.
    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
        }
        session_ = nullptr;
    }

    if (sock_ != BRICKDEV_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = BRICKDEV_INVALID_SOCKET;
    }
}

bool SessionManager::is_active() const {
    return active_;
}

void SessionManager::send_keepalive() {
    if (!active_ || !session_) return;
    int seconds_to_next = 0;
    int rc;
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        rc = libssh2_keepalive_send(session_, &seconds_to_next);
    }
    if (rc != 0 && rc != LIBSSH2_ERROR_EAGAIN) {
        brickdev_log(fmt::format("session: keepalive to {} failed ({})", target_str_, rc));
    }
}
