#include "device_discovery.hpp"
#include <core/address.hpp>
#include <core/log.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <future>
#include <memory>
#include <thread>

Result<std::string> HostnameResolver::resolve(const std::string& name,
                                              std::chrono::milliseconds timeout) {
    if (is_ipv4_address(name)) {
        return Result<std::string>::Ok(name);
    }

    // getaddrinfo has no timeout of its own; a detached lookup that
    // outlives the deadline just finishes into an abandoned future
    auto task = std::make_shared<std::packaged_task<std::string()>>([name]() {
        return platform::resolve_ipv4(name);
    });
    auto lookup = task->get_future();
    std::thread([task]() { (*task)(); }).detach();
    if (lookup.wait_for(timeout) != std::future_status::ready) {
        brickdev_log(fmt::format("discovery: lookup of {} timed out after {}ms", name, timeout.count()));
        return Result<std::string>::Err(ErrorKind::Discovery,
            fmt::format("Device {} not found (lookup timed out)", name));
    }

    std::string ip = lookup.get();
    if (ip.empty()) {
        return Result<std::string>::Err(ErrorKind::Discovery,
            fmt::format("Device {} not found", name));
    }
    brickdev_log(fmt::format("discovery: {} -> {}", name, ip));
    return Result<std::string>::Ok(ip);
}
