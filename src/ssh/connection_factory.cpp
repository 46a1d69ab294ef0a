#include "connection_factory.hpp"
#include "connection.hpp"
#include "session.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

SSHTransportFactory::SSHTransportFactory(const Config& config, StatusCallback callback)
    : config_(config), callback_(std::move(callback)) {
}

Result<std::shared_ptr<TransportHandle>> SSHTransportFactory::connect(const std::string& address) {
    using R = Result<std::shared_ptr<TransportHandle>>;

    DeviceConfig dev = config_.device_for(address);

    SessionTarget target;
    target.host = address;
    target.port = dev.port;
    target.user = dev.user;
    target.password = dev.password;
    target.timeout = dev.timeout;

    auto session = std::make_shared<SessionManager>(target);
    auto result = session->establish(callback_);
    if (result.failed()) {
        brickdev_log(fmt::format("factory: connect {} failed: {}", address, result.stderr_data));
        return R::Err(ErrorKind::Connection, result.stderr_data);
    }

    return R::Ok(std::make_shared<SSHConnection>(address, std::move(session)));
}
