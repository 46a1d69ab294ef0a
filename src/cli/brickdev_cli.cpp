#include "brickdev_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

std::atomic<bool> BrickdevCLI::interrupted{false};

void print_status(const std::string& msg) {
    std::cout << theme::log(msg) << std::flush;
}

BrickdevCLI::BrickdevCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
        if (!config->run().log_path.empty()) {
            set_brickdev_log_path(config->run().log_path);
        }
    } else {
        config_error = config_result.error;
    }
}

void BrickdevCLI::add_command(const std::string& name, CommandHandler handler,
                              const std::string& usage, const std::string& help) {
    commands_[name] = {std::move(handler), usage, help};
}

bool BrickdevCLI::has_command(const std::string& command) const {
    return commands_.count(command) > 0;
}

bool BrickdevCLI::require_config() {
    if (!config.has_value()) {
        std::cout << theme::fail("Invalid config: " + config_error);
        std::cout << theme::step("Fix or remove " + get_config_path().string());
        return false;
    }
    return true;
}

SessionCache& BrickdevCLI::cache() {
    if (!cache_) {
        factory_ = std::make_unique<SSHTransportFactory>(config.value(), print_status);
        cache_ = std::make_unique<SessionCache>(*factory_,
                                                config->device_defaults().home,
                                                config->run().probe_timeout_ms,
                                                print_status);
    }
    return *cache_;
}

int BrickdevCLI::execute_command(const std::string& command, const Args& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        print_usage();
        return 1;
    }

    brickdev_log(fmt::format("cli: {} ({} args)", command, args.size()));
    return it->second.handler(*this, args);
}

void BrickdevCLI::print_usage() const {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    for (const auto& [name, cmd] : commands_) {
        std::cout << theme::color::BLUE << "    brickdev " << name << " "
                  << theme::color::RESET << theme::color::BROWN
                  << fmt::format("{:<18}", cmd.usage)
                  << theme::color::RESET << theme::color::DIM
                  << cmd.help << theme::color::RESET << "\n";
    }
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    brickdev --version        Show version\n"
              << "    brickdev --help           Show this help"
              << theme::color::RESET << "\n\n";
}
