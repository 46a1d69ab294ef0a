#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

bool config_exists() {
    return fs::exists(get_config_path());
}

fs::path get_config_dir() {
    return platform::home_dir() / ".brickdev";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Config,
            "Failed to create " + config_path.parent_path().string() + ": " + ec.message());
    }

    const char* default_config = R"(# brickdev configuration

# Login used for every device unless overridden below
device:
  user: "robot"
  password: "maker"
  port: 22
  home: "/home/robot"
  timeout: 10                     # seconds for connect + handshake + auth

# Per-device overrides, keyed by address
devices: {}
#  192.168.133.101:
#    password: "secret"

run:
  command: "brickrun -r -- pybricks-micropython {}"
  poll_interval_ms: 100
  probe_timeout_ms: 3000
  # log_path: "/tmp/brickdev_debug.log"

compile:
  mpy_cross: "mpy-cross"
  build_dir: "build"
  flags: ["-mno-unicode"]
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err(ErrorKind::Config,
            "Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

class ConfigParser {
public:
    // Overlay keys present in node onto dev; absent keys keep their value
    static void overlay_device(const YAML::Node& node, DeviceConfig& dev) {
        if (!node || !node.IsMap()) return;
        if (node["user"]) dev.user = node["user"].as<std::string>();
        if (node["password"]) dev.password = node["password"].as<std::string>();
        if (node["port"]) dev.port = node["port"].as<int>();
        if (node["home"]) dev.home = node["home"].as<std::string>();
        if (node["timeout"]) dev.timeout = node["timeout"].as<int>();
    }

    static void parse_run(const YAML::Node& node, RunConfig& run) {
        if (!node || !node.IsMap()) return;
        run.command = node["command"].as<std::string>(run.command);
        run.poll_interval_ms = node["poll_interval_ms"].as<int>(run.poll_interval_ms);
        run.probe_timeout_ms = node["probe_timeout_ms"].as<int>(run.probe_timeout_ms);
        run.log_path = node["log_path"].as<std::string>(run.log_path);
    }

    static void parse_compile(const YAML::Node& node, CompileConfig& compile) {
        if (!node || !node.IsMap()) return;
        compile.mpy_cross = node["mpy_cross"].as<std::string>(compile.mpy_cross);
        compile.build_dir = node["build_dir"].as<std::string>(compile.build_dir);
        if (node["flags"]) {
            if (node["flags"].IsSequence()) {
                compile.flags = node["flags"].as<std::vector<std::string>>();
            } else if (node["flags"].IsScalar()) {
                compile.flags = {node["flags"].as<std::string>()};
            }
        }
    }

    static Result<Config> parse_root(const YAML::Node& root) {
        Config config;
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err(ErrorKind::Config, "Config root must be a mapping");
        }

        overlay_device(root["device"], config.device_);

        if (root["devices"] && root["devices"].IsMap()) {
            for (const auto& kv : root["devices"]) {
                DeviceConfig dev = config.device_;
                overlay_device(kv.second, dev);
                config.devices_[kv.first.as<std::string>()] = dev;
            }
        }

        parse_run(root["run"], config.run_);
        parse_compile(root["compile"], config.compile_);

        if (config.run_.poll_interval_ms <= 0) {
            return Result<Config>::Err(ErrorKind::Config, "run.poll_interval_ms must be positive");
        }
        if (config.run_.probe_timeout_ms <= 0) {
            return Result<Config>::Err(ErrorKind::Config, "run.probe_timeout_ms must be positive");
        }
        if (config.device_.port <= 0 || config.device_.port > 65535) {
            return Result<Config>::Err(ErrorKind::Config, "device.port out of range");
        }

        return Result<Config>::Ok(config);
    }
};

DeviceConfig Config::device_for(const std::string& address) const {
    auto it = devices_.find(address);
    if (it != devices_.end()) return it->second;
    return device_;
}

void Config::alias_device(const std::string& name, const std::string& address) {
    auto it = devices_.find(name);
    if (it == devices_.end() || name == address) return;
    devices_.emplace(address, it->second);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        return ConfigParser::parse_root(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::Config, std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err(ErrorKind::Config, "Config not found at " + path.string());
    }

    try {
        return ConfigParser::parse_root(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::Config,
            "Failed to parse " + path.string() + ": " + e.what());
    }
}

Result<Config> Config::load() {
    if (!config_exists()) {
        return Result<Config>::Ok(Config{});
    }
    return load_file(get_config_path());
}
