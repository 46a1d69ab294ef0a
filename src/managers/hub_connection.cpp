#include "hub_connection.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

EV3Connection::EV3Connection(SessionCache& cache, const Config& config,
                             const std::atomic<bool>* cancel)
    : session_(cache, config), cancel_(cancel) {
}

Result<void> EV3Connection::connect(const std::string& address) {
    return session_.connect(address);
}

Result<int> EV3Connection::run(const std::string& script_path, const LineCallback& on_line) {
    auto remote = session_.deploy(script_path);
    if (remote.is_err()) return forward_error<int>(remote);

    auto stream = session_.run_deployed(remote.value);
    if (stream.is_err()) return forward_error<int>(stream);

    stream.value.set_cancel_flag(cancel_);
    return stream.value.drain(on_line);
}

void EV3Connection::disconnect() {
    session_.disconnect();
}

Result<std::unique_ptr<HubConnection>> make_hub_connection(AddressKind kind,
                                                           SessionCache& cache,
                                                           const Config& config,
                                                           const std::atomic<bool>* cancel) {
    using R = Result<std::unique_ptr<HubConnection>>;

    switch (kind) {
        case AddressKind::IPv4:
        case AddressKind::Name:
            return R::Ok(std::make_unique<EV3Connection>(cache, config, cancel));
        case AddressKind::Bluetooth:
            break;
    }
    brickdev_log(fmt::format("hub: no backend for {} addresses", address_kind_name(kind)));
    return R::Err(ErrorKind::Connection,
        fmt::format("No backend for {} devices", address_kind_name(kind)));
}
