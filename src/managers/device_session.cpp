#include "device_session.hpp"
#include "remote_sync.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Unconnected:  return "unconnected";
        case SessionState::Connected:    return "connected";
        case SessionState::Deploying:    return "deploying";
        case SessionState::Running:      return "running";
        case SessionState::Disconnected: return "disconnected";
    }
    return "unknown";
}

DeviceSession::DeviceSession(SessionCache& cache, const Config& config)
    : cache_(cache), config_(config),
      executor_(std::chrono::milliseconds(config.run().poll_interval_ms)) {
}

SessionState DeviceSession::state() const {
    if (state_ == SessionState::Running && open_streams_->load() == 0) {
        return SessionState::Connected;
    }
    return state_;
}

Result<void> DeviceSession::require_connected(const char* op) const {
    switch (state_) {
        case SessionState::Connected:
        case SessionState::Running:
            return Result<void>::Ok();
        case SessionState::Disconnected:
            return Result<void>::Err(ErrorKind::State,
                fmt::format("Cannot {}: session is disconnected", op));
        default:
            return Result<void>::Err(ErrorKind::State,
                fmt::format("Cannot {}: session is {}", op, session_state_name(state_)));
    }
}

Result<void> DeviceSession::connect(const std::string& address) {
    if (state_ != SessionState::Unconnected) {
        return Result<void>::Err(ErrorKind::State,
            fmt::format("Cannot connect: session is {}", session_state_name(state_)));
    }

    auto acquired = cache_.acquire(address);
    if (acquired.is_err()) {
        return forward_error<void>(acquired);
    }

    handle_ = acquired.value;
    address_ = address;
    home_ = config_.device_for(address).home;
    state_ = SessionState::Connected;
    return Result<void>::Ok();
}

std::string DeviceSession::remote_relative_path(const std::string& local_path) {
    fs::path p(local_path);
    fs::path rel;

    if (p.is_absolute()) {
        std::error_code ec;
        fs::path cwd = fs::current_path(ec);
        if (!ec) rel = p.lexically_relative(cwd);
    } else {
        rel = p.lexically_normal();
    }

    // Outside the working directory: keep only the file name
    if (rel.empty() || *rel.begin() == "..") {
        rel = p.filename();
    }
    return to_remote_relative(rel.generic_string());
}

Result<std::string> DeviceSession::deploy(const std::string& local_path) {
    auto ready = require_connected("deploy");
    if (ready.is_err()) return forward_error<std::string>(ready);

    state_ = SessionState::Deploying;
    auto back = [this]() { state_ = SessionState::Connected; };

    // Nothing touches the device until the local file is readable
    std::ifstream in(local_path, std::ios::binary);
    if (!in) {
        back();
        return Result<std::string>::Err(ErrorKind::Transfer, "Cannot read " + local_path);
    }
    std::ostringstream data;
    data << in.rdbuf();

    std::string rel = remote_relative_path(local_path);
    auto synced = RemoteFilesystemSync::ensure_remote_dir(*handle_, rel, home_);
    if (synced.is_err()) {
        back();
        return forward_error<std::string>(synced);
    }

    FileChannel* channel = handle_->file_channel();
    if (!channel) {
        back();
        return Result<std::string>::Err(ErrorKind::Transfer,
            "No file transfer channel open on " + address_);
    }

    std::string remote = join_remote_path(home_, rel);
    auto written = channel->write_file(remote, data.str());
    if (written.is_err()) {
        back();
        return Result<std::string>::Err(ErrorKind::Transfer,
            fmt::format("Upload of {} failed: {}", local_path, written.error));
    }

    deployed_.insert(remote);
    brickdev_log(fmt::format("session: deployed {} -> {}:{}", local_path, address_, remote));
    back();
    return Result<std::string>::Ok(remote);
}

Result<OutputStream> DeviceSession::run_deployed(const std::string& remote_path) {
    auto ready = require_connected("run");
    if (ready.is_err()) return forward_error<OutputStream>(ready);

    if (deployed_.count(remote_path) == 0) {
        return Result<OutputStream>::Err(ErrorKind::State,
            remote_path + " has not been deployed in this session");
    }

    std::string cmd = fill_placeholder(config_.run().command, shell_quote(remote_path));
    auto stream = executor_.run(*handle_, cmd);
    if (stream.is_ok()) {
        auto open_streams = open_streams_;
        open_streams->fetch_add(1);
        stream.value.on_finish([open_streams]() { open_streams->fetch_sub(1); });
        state_ = SessionState::Running;
    }
    return stream;
}

Result<void> DeviceSession::beep() {
    auto ready = require_connected("beep");
    if (ready.is_err()) return ready;

    auto r = handle_->run(BEEP_COMMAND, SSH_CMD_TIMEOUT_SECS * 1000);
    brickdev_log_ssh("beep", BEEP_COMMAND, r);
    if (r.failed()) {
        return Result<void>::Err(ErrorKind::ProcessSpawn,
            fmt::format("beep exited with {}: {}", r.exit_code, r.get_output()));
    }
    return Result<void>::Ok();
}

void DeviceSession::disconnect() {
    if (state_ == SessionState::Unconnected || state_ == SessionState::Disconnected) {
        return;
    }

    // evict() closes the channel and then the connection, logging failures
    cache_.evict(address_);
    handle_.reset();
    deployed_.clear();
    state_ = SessionState::Disconnected;
    brickdev_log("session: disconnected from " + address_);
}
