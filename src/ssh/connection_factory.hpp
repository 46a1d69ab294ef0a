#pragma once

#include <memory>
#include <string>
#include <core/config.hpp>
#include "transport.hpp"

// Builds SSH transport handles for device addresses, using the login
// configured for each address (`device:` defaults merged with `devices:`).
//
// Every connect() is a fresh TCP connection, key exchange and password
// authentication; reuse is the SessionCache's job, not the factory's.
class SSHTransportFactory : public TransportFactory {
public:
    explicit SSHTransportFactory(const Config& config, StatusCallback callback = nullptr);

    Result<std::shared_ptr<TransportHandle>> connect(const std::string& address) override;

private:
    const Config& config_;
    StatusCallback callback_;
};
