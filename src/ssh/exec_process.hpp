#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "transport.hpp"
#include "session.hpp"

typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Exit code of a closed channel. A process killed by a signal maps to
// 128 + signal number. Caller holds the session's I/O lock.
int channel_exit_code(LIBSSH2_SESSION* session, LIBSSH2_CHANNEL* channel);

// A remote command running on its own exec channel (no PTY, so stderr stays
// separate from stdout). Lines are read from stderr; stdout is drained into
// the debug log so the remote side never blocks on a full window.
class ExecProcess : public RemoteProcess {
public:
    ExecProcess(std::shared_ptr<SessionManager> session, LIBSSH2_CHANNEL* channel,
                std::string command);
    ~ExecProcess() override;

    ExecProcess(const ExecProcess&) = delete;
    ExecProcess& operator=(const ExecProcess&) = delete;

    LineRead read_line(std::chrono::milliseconds timeout) override;
    std::optional<int> exit_status() override;
    void close() override;
    bool is_closed() const override { return channel_ == nullptr; }

private:
    std::shared_ptr<SessionManager> session_;
    std::shared_ptr<std::mutex> io_mutex_;
    LIBSSH2_CHANNEL* channel_;
    std::string command_;
    std::string stderr_buf_;
    std::string stdout_buf_;
    std::optional<int> exit_code_;
    bool eof_seen_ = false;
    bool close_sent_ = false;

    bool pop_line(std::string& line);
    void flush_stdout(bool final);
};
