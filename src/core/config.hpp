#pragma once

#include <string>
#include <map>
#include <vector>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

// Login and layout for one device. `devices:` entries override these per address.
struct DeviceConfig {
    std::string user = DEFAULT_DEVICE_USER;
    std::string password = DEFAULT_DEVICE_PASSWORD;
    int port = DEFAULT_SSH_PORT;
    std::string home = DEFAULT_DEVICE_HOME;
    int timeout = CONNECT_TIMEOUT_SECS;
};

struct RunConfig {
    std::string command = DEFAULT_RUN_COMMAND;
    int poll_interval_ms = STREAM_POLL_INTERVAL_MS;
    int probe_timeout_ms = PROBE_TIMEOUT_MS;
    std::string log_path;
};

struct CompileConfig {
    std::string mpy_cross = DEFAULT_MPY_CROSS;
    std::string build_dir = DEFAULT_BUILD_DIR;
    std::vector<std::string> flags{MPY_NO_UNICODE_FLAG};
};

class Config {
public:
    Config() = default;

    // Load ~/.brickdev/config.yaml; a missing file yields the built-in defaults
    static Result<Config> load();

    // Load a specific file (must exist)
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text directly
    static Result<Config> parse(const std::string& yaml_text);

    // Defaults merged with any `devices:` entry for this address
    DeviceConfig device_for(const std::string& address) const;

    // A hostname resolved to address: the name's `devices:` entry applies to
    // the address too, unless the address has an entry of its own
    void alias_device(const std::string& name, const std::string& address);

    const DeviceConfig& device_defaults() const { return device_; }
    const RunConfig& run() const { return run_; }
    const CompileConfig& compile() const { return compile_; }

private:
    DeviceConfig device_;
    std::map<std::string, DeviceConfig> devices_;
    RunConfig run_;
    CompileConfig compile_;

    friend class ConfigParser;
};

bool config_exists();
fs::path get_config_dir();
fs::path get_config_path();

// Write the commented default config if none exists yet
Result<void> create_default_config();
