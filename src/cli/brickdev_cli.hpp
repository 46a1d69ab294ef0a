#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <managers/session_cache.hpp>
#include <ssh/connection_factory.hpp>

class BrickdevCLI {
public:
    BrickdevCLI();

    using Args = std::vector<std::string>;
    using CommandHandler = std::function<int(BrickdevCLI&, const Args&)>;

    void add_command(const std::string& name, CommandHandler handler,
                     const std::string& usage, const std::string& help);

    // Dispatch one subcommand; returns the process exit code
    int execute_command(const std::string& command, const Args& args);
    bool has_command(const std::string& command) const;

    void print_usage() const;

    bool require_config();

    // Lazily built connection machinery shared by the device commands
    SessionCache& cache();

    std::optional<Config> config;
    std::string config_error;

    // Set from the SIGINT handler
    static std::atomic<bool> interrupted;

private:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, Command> commands_;

    std::unique_ptr<SSHTransportFactory> factory_;
    std::unique_ptr<SessionCache> cache_;
};

// Status messages from the transport and cache layers
void print_status(const std::string& msg);

void register_device_commands(BrickdevCLI& cli);
void register_compile_commands(BrickdevCLI& cli);
