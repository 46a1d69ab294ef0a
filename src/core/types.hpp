#pragma once

#include <string>
#include <functional>
#include <utility>

// Failure classes surfaced by the session layer and its collaborators
enum class ErrorKind {
    None,
    Connection,        // handshake / auth / network
    StaleHandle,       // liveness probe failed (recovered internally)
    RemoteFilesystem,  // remote exists / mkdir failed
    Transfer,          // local read or remote upload failed
    ProcessSpawn,      // remote command could not be started
    StreamRead,        // diagnostic stream read failed mid-run
    State,             // session used out of order (e.g. after disconnect)
    Config,
    Compile,
    Discovery,
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Re-wrap a failed result of one type as another, keeping kind and message
template <typename To, typename From>
Result<To> forward_error(const Result<From>& r) {
    return Result<To>::Err(r.kind, r.error);
}

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
