#pragma once

#include <atomic>
#include <memory>
#include <set>
#include <string>
#include <core/config.hpp>
#include <core/types.hpp>
#include "session_cache.hpp"
#include "stream_executor.hpp"

enum class SessionState {
    Unconnected,
    Connected,
    Deploying,
    Running,
    Disconnected,
};

const char* session_state_name(SessionState state);

// One caller's lifecycle against one device:
// connect -> (deploy -> run_deployed)* -> disconnect.
//
// The handle itself lives in the injected SessionCache; this object only
// borrows it. Disconnected is terminal.
class DeviceSession {
public:
    DeviceSession(SessionCache& cache, const Config& config);
    ~DeviceSession() = default;

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    Result<void> connect(const std::string& address);

    // Upload a local file, mirroring its relative directory under the device
    // home. Returns the remote path.
    Result<std::string> deploy(const std::string& local_path);

    // Launch a previously deployed script; the caller drains the stream
    Result<OutputStream> run_deployed(const std::string& remote_path);

    Result<void> beep();

    // Best-effort: close errors are logged, never returned
    void disconnect();

    // Running only while a stream from run_deployed is still open
    SessionState state() const;
    const std::string& address() const { return address_; }

    // Path under the device home that local_path is mirrored to
    static std::string remote_relative_path(const std::string& local_path);

private:
    SessionCache& cache_;
    const Config& config_;
    StreamingExecutor executor_;

    std::string address_;
    std::string home_;
    std::shared_ptr<TransportHandle> handle_;
    SessionState state_ = SessionState::Unconnected;
    std::set<std::string> deployed_;
    // Shared with open streams, which may outlive this object
    std::shared_ptr<std::atomic<int>> open_streams_ = std::make_shared<std::atomic<int>>(0);

    Result<void> require_connected(const char* op) const;
};
