#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <core/address.hpp>
#include <core/config.hpp>
#include <core/types.hpp>
#include "device_session.hpp"

using LineCallback = std::function<bool(const std::string&)>;

// What the CLI needs from any kind of hub, whatever carries the bytes.
class HubConnection {
public:
    virtual ~HubConnection() = default;

    virtual Result<void> connect(const std::string& address) = 0;

    // Upload and start a script, streaming its output to on_line.
    // Returns the script's exit status.
    virtual Result<int> run(const std::string& script_path, const LineCallback& on_line) = 0;

    virtual void disconnect() = 0;
};

// ev3dev brick reached over SSH
class EV3Connection : public HubConnection {
public:
    EV3Connection(SessionCache& cache, const Config& config,
                  const std::atomic<bool>* cancel = nullptr);

    Result<void> connect(const std::string& address) override;
    Result<int> run(const std::string& script_path, const LineCallback& on_line) override;
    void disconnect() override;

    DeviceSession& session() { return session_; }

private:
    DeviceSession session_;
    const std::atomic<bool>* cancel_;
};

// Pick the backend for an address kind. Only EV3 (IPv4 / hostname) has one.
Result<std::unique_ptr<HubConnection>> make_hub_connection(AddressKind kind,
                                                           SessionCache& cache,
                                                           const Config& config,
                                                           const std::atomic<bool>* cancel = nullptr);
