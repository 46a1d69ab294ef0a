#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <core/types.hpp>

// Abstract remote transport. The session layer (managers/) only talks to
// these interfaces; ssh/ provides the libssh2-backed implementation and the
// tests provide an in-memory one.

// Outcome of one bounded read on a process's diagnostic stream.
struct LineRead {
    enum class Status {
        Line,     // `line` holds one line, newline stripped
        Timeout,  // nothing arrived within the timeout
        Eof,      // stream closed and no buffered data remains
        Error,    // transport-level failure; `error` describes it
    };

    Status status;
    std::string line;
    std::string error;

    static LineRead got(std::string l) { return {Status::Line, std::move(l), ""}; }
    static LineRead timeout() { return {Status::Timeout, "", ""}; }
    static LineRead eof() { return {Status::Eof, "", ""}; }
    static LineRead failed(std::string e) { return {Status::Error, "", std::move(e)}; }
};

// One spawned remote process. Output is read from its stderr, where the
// brick's runtime writes print() and tracebacks.
class RemoteProcess {
public:
    virtual ~RemoteProcess() = default;

    virtual LineRead read_line(std::chrono::milliseconds timeout) = 0;

    // Exit status once the remote side has reported it.
    virtual std::optional<int> exit_status() = 0;

    // Release the channel. Safe to call more than once.
    virtual void close() = 0;
    virtual bool is_closed() const = 0;
};

// File-transfer channel (SFTP on the SSH transport). Relative paths are
// resolved against the channel's current directory.
class FileChannel {
public:
    virtual ~FileChannel() = default;

    virtual Result<bool> exists(const std::string& path) = 0;
    virtual Result<void> mkdir(const std::string& path) = 0;
    virtual Result<void> write_file(const std::string& path, const std::string& data) = 0;
    virtual Result<std::string> getcwd() = 0;
    virtual Result<void> chdir(const std::string& path) = 0;
    virtual void close() = 0;
};

// An established connection to one device.
class TransportHandle {
public:
    virtual ~TransportHandle() = default;

    virtual const std::string& address() const = 0;
    virtual bool is_open() const = 0;

    // Run a command to completion, capturing stdout/stderr and exit status.
    virtual SSHResult run(const std::string& command, int timeout_ms) = 0;

    // Start a command and return immediately with a handle to the process.
    virtual Result<std::unique_ptr<RemoteProcess>> spawn(const std::string& command) = 0;

    // Open the file-transfer channel, or return the one already open.
    virtual Result<FileChannel*> open_file_channel() = 0;

    // nullptr until open_file_channel() has succeeded.
    virtual FileChannel* file_channel() = 0;

    // Close the file-transfer channel, then the connection. Never throws.
    virtual void close() = 0;
};

// Builds handles. Each successful connect() is one full handshake.
class TransportFactory {
public:
    virtual ~TransportFactory() = default;

    virtual Result<std::shared_ptr<TransportHandle>> connect(const std::string& address) = 0;
};
