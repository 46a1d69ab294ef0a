#pragma once

// In-memory transport for exercising the session layer without a device.
// Every interesting remote call is counted in MockStats.

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <core/constants.hpp>
#include <ssh/transport.hpp>

struct MockStats {
    std::atomic<int> handshakes{0};
    std::atomic<int> probes{0};
    std::atomic<int> exists_checks{0};
    std::atomic<int> mkdirs{0};
    std::atomic<int> uploads{0};
    std::atomic<int> spawns{0};
    std::atomic<int> process_releases{0};
    std::atomic<int> channel_closes{0};
    std::atomic<int> handle_closes{0};

    std::mutex mutex;
    std::vector<std::string> ops;        // "mkdir <path>", "write <path>", ...
    std::set<std::string> dirs;          // remote directories that exist
    std::map<std::string, std::string> files;
    std::vector<std::string> commands;   // spawned commands

    void record(const std::string& op) {
        std::lock_guard<std::mutex> lock(mutex);
        ops.push_back(op);
    }
};

// What the next spawned process will emit
struct ProcessScript {
    std::vector<LineRead> reads;
    std::optional<int> exit_code = 0;  // reported once reads run out
};

class MockProcess : public RemoteProcess {
public:
    MockProcess(MockStats& stats, ProcessScript script)
        : stats_(stats), script_(std::move(script)) {}

    ~MockProcess() override { close(); }

    LineRead read_line(std::chrono::milliseconds) override {
        if (next_ < script_.reads.size()) return script_.reads[next_++];
        return LineRead::eof();
    }

    std::optional<int> exit_status() override {
        if (next_ < script_.reads.size()) return std::nullopt;
        return script_.exit_code;
    }

    void close() override {
        if (closed_) return;
        closed_ = true;
        stats_.process_releases++;
    }

    bool is_closed() const override { return closed_; }

private:
    MockStats& stats_;
    ProcessScript script_;
    size_t next_ = 0;
    bool closed_ = false;
};

class MockFileChannel : public FileChannel {
public:
    explicit MockFileChannel(MockStats& stats) : stats_(stats) {}

    Result<bool> exists(const std::string& path) override {
        stats_.exists_checks++;
        if (fail_exists) return Result<bool>::Err(ErrorKind::RemoteFilesystem, "stat failed");
        std::lock_guard<std::mutex> lock(stats_.mutex);
        return Result<bool>::Ok(stats_.dirs.count(path) > 0 || stats_.files.count(path) > 0);
    }

    Result<void> mkdir(const std::string& path) override {
        if (fail_mkdir_at == path) {
            return Result<void>::Err(ErrorKind::RemoteFilesystem, "permission denied: " + path);
        }
        stats_.mkdirs++;
        stats_.record("mkdir " + path);
        std::lock_guard<std::mutex> lock(stats_.mutex);
        stats_.dirs.insert(path);
        return Result<void>::Ok();
    }

    Result<void> write_file(const std::string& path, const std::string& data) override {
        if (fail_write) return Result<void>::Err(ErrorKind::Transfer, "write failed");
        stats_.uploads++;
        stats_.record("write " + path);
        std::lock_guard<std::mutex> lock(stats_.mutex);
        stats_.files[path] = data;
        return Result<void>::Ok();
    }

    Result<std::string> getcwd() override { return Result<std::string>::Ok(cwd); }

    Result<void> chdir(const std::string& path) override {
        if (fail_chdir) return Result<void>::Err(ErrorKind::RemoteFilesystem, "no such directory");
        cwd = path;
        return Result<void>::Ok();
    }

    void close() override {
        if (closed) return;
        closed = true;
        stats_.channel_closes++;
        stats_.record("close channel");
    }

    std::string cwd = "/";
    bool closed = false;
    bool fail_exists = false;
    bool fail_write = false;
    bool fail_chdir = false;
    std::string fail_mkdir_at;

private:
    MockStats& stats_;
};

class MockHandle : public TransportHandle {
public:
    MockHandle(std::string address, MockStats& stats)
        : address_(std::move(address)), stats_(stats), channel_(stats) {}

    const std::string& address() const override { return address_; }
    bool is_open() const override { return open_; }

    SSHResult run(const std::string& command, int timeout_ms) override {
        last_timeout_ms = timeout_ms;
        if (command == PROBE_COMMAND) {
            stats_.probes++;
            if (!alive) return SSHResult{-1, "", "connection reset"};
            return SSHResult{0, channel_.cwd + "\n", ""};
        }
        stats_.record("run " + command);
        return SSHResult{alive ? 0 : -1, "", alive ? "" : "connection reset"};
    }

    Result<std::unique_ptr<RemoteProcess>> spawn(const std::string& command) override {
        using R = Result<std::unique_ptr<RemoteProcess>>;
        if (fail_spawn) return R::Err(ErrorKind::ProcessSpawn, "channel open failed");
        stats_.spawns++;
        {
            std::lock_guard<std::mutex> lock(stats_.mutex);
            stats_.commands.push_back(command);
        }
        stats_.record("spawn " + command);
        return R::Ok(std::make_unique<MockProcess>(stats_, script));
    }

    Result<FileChannel*> open_file_channel() override {
        if (fail_channel) return Result<FileChannel*>::Err(ErrorKind::Connection, "sftp init failed");
        channel_open_ = true;
        return Result<FileChannel*>::Ok(&channel_);
    }

    FileChannel* file_channel() override { return channel_open_ ? &channel_ : nullptr; }

    void close() override {
        if (!open_) return;
        channel_.close();
        open_ = false;
        stats_.handle_closes++;
        stats_.record("close handle");
    }

    MockFileChannel& channel() { return channel_; }

    std::atomic<bool> alive{true};  // false simulates a dropped connection
    bool fail_spawn = false;
    bool fail_channel = false;
    ProcessScript script;
    int last_timeout_ms = 0;

private:
    std::string address_;
    MockStats& stats_;
    MockFileChannel channel_;
    bool open_ = true;
    bool channel_open_ = false;
};

class MockTransportFactory : public TransportFactory {
public:
    Result<std::shared_ptr<TransportHandle>> connect(const std::string& address) override {
        using R = Result<std::shared_ptr<TransportHandle>>;
        if (fail_connect) return R::Err(ErrorKind::Connection, "Authentication failed for robot@" + address);

        stats.handshakes++;
        auto handle = std::make_shared<MockHandle>(address, stats);
        handle->script = script;
        handle->fail_channel = fail_channel;

        std::lock_guard<std::mutex> lock(mutex_);
        handles.push_back(handle);
        return R::Ok(handle);
    }

    std::shared_ptr<MockHandle> last() {
        std::lock_guard<std::mutex> lock(mutex_);
        return handles.empty() ? nullptr : handles.back();
    }

    MockStats stats;
    std::vector<std::shared_ptr<MockHandle>> handles;
    std::atomic<bool> fail_connect{false};
    bool fail_channel = false;
    ProcessScript script;  // copied into each new handle

private:
    std::mutex mutex_;
};
