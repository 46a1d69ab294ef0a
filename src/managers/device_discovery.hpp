#pragma once

#include <chrono>
#include <string>
#include <core/types.hpp>

// Turns a device name into an address the transport can connect to.
class DeviceResolver {
public:
    virtual ~DeviceResolver() = default;

    virtual Result<std::string> resolve(const std::string& name,
                                        std::chrono::milliseconds timeout) = 0;
};

// Name lookup through the system resolver (mDNS names like ev3dev.local
// work where the host has nss-mdns).
class HostnameResolver : public DeviceResolver {
public:
    Result<std::string> resolve(const std::string& name,
                                std::chrono::milliseconds timeout) override;
};
