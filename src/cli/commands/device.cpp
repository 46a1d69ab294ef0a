#include "../brickdev_cli.hpp"
#include "../theme.hpp"
#include <core/address.hpp>
#include <managers/device_discovery.hpp>
#include <managers/device_session.hpp>
#include <managers/hub_connection.hpp>
#include <managers/mpy_compiler.hpp>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <fmt/format.h>

namespace fs = std::filesystem;

static void on_sigint(int) {
    BrickdevCLI::interrupted.store(true);
}

// Restores default Ctrl-C handling when the stream is done
class InterruptScope {
public:
    InterruptScope() {
        BrickdevCLI::interrupted.store(false);
        previous_ = std::signal(SIGINT, on_sigint);
    }
    ~InterruptScope() { std::signal(SIGINT, previous_ == SIG_ERR ? SIG_DFL : previous_); }

private:
    void (*previous_)(int);
};

// Name -> IPv4 where needed; other kinds pass through unchanged
static Result<std::string> resolve_device(BrickdevCLI& cli, const std::string& device) {
    if (classify_address(device) != AddressKind::Name) {
        return Result<std::string>::Ok(device);
    }
    std::cout << theme::step("Looking up " + device);
    HostnameResolver resolver;
    auto timeout = std::chrono::seconds(cli.config->device_for(device).timeout);
    auto resolved = resolver.resolve(device, std::chrono::duration_cast<std::chrono::milliseconds>(timeout));
    // Login and home configured under the name follow it to the address
    if (resolved.is_ok()) cli.config->alias_device(device, resolved.value);
    return resolved;
}

static int do_run(BrickdevCLI& cli, const BrickdevCLI::Args& args) {
    if (args.size() < 2) {
        std::cout << theme::fail("Usage: brickdev run <device> <script>");
        return 1;
    }
    if (!cli.require_config()) return 1;

    const std::string& device = args[0];
    std::string script = args[1];

    std::error_code ec;
    if (!fs::is_regular_file(script, ec)) {
        // Not a file: run it as an inline one-liner
        MpyCompiler compiler(cli.config->compile());
        auto tmp = compiler.write_temp_script(script);
        if (tmp.is_err()) {
            std::cout << theme::fail(tmp.error);
            return 1;
        }
        script = tmp.value.string();
    }

    auto address = resolve_device(cli, device);
    if (address.is_err()) {
        std::cout << theme::fail(address.error);
        return 1;
    }

    auto hub = make_hub_connection(classify_address(address.value), cli.cache(),
                                   cli.config.value(), &BrickdevCLI::interrupted);
    if (hub.is_err()) {
        std::cout << theme::fail(hub.error);
        return 1;
    }

    auto connected = hub.value->connect(address.value);
    if (connected.is_err()) {
        std::cout << theme::fail(connected.error);
        return 1;
    }

    std::cout << theme::step("Running " + script + " on " + device);
    Result<int> exit_code = Result<int>::Ok(0);
    {
        InterruptScope scope;
        exit_code = hub.value->run(script, [](const std::string& line) {
            std::cout << theme::device_line(line) << std::flush;
            return true;
        });
    }
    hub.value->disconnect();

    if (exit_code.is_err()) {
        std::cout << theme::fail(exit_code.error);
        return 1;
    }
    if (BrickdevCLI::interrupted.load()) {
        std::cout << theme::info("Stopped");
        return 1;
    }
    if (exit_code.value != 0) {
        std::cout << theme::fail(fmt::format("Script exited with code {}", exit_code.value));
        return 1;
    }
    std::cout << theme::ok("Done");
    return 0;
}

static int do_beep(BrickdevCLI& cli, const BrickdevCLI::Args& args) {
    if (args.empty()) {
        std::cout << theme::fail("Usage: brickdev beep <device>");
        return 1;
    }
    if (!cli.require_config()) return 1;

    auto address = resolve_device(cli, args[0]);
    if (address.is_err()) {
        std::cout << theme::fail(address.error);
        return 1;
    }
    if (classify_address(address.value) == AddressKind::Bluetooth) {
        std::cout << theme::fail("No backend for bluetooth devices");
        return 1;
    }

    DeviceSession session(cli.cache(), cli.config.value());
    auto connected = session.connect(address.value);
    if (connected.is_err()) {
        std::cout << theme::fail(connected.error);
        return 1;
    }

    auto beeped = session.beep();
    session.disconnect();
    if (beeped.is_err()) {
        std::cout << theme::fail(beeped.error);
        return 1;
    }
    std::cout << theme::ok("Beeped " + args[0]);
    return 0;
}

void register_device_commands(BrickdevCLI& cli) {
    cli.add_command("run", do_run, "<device> <script>", "Deploy a script (or one-liner) and stream its output");
    cli.add_command("beep", do_beep, "<device>", "Make the brick beep");
}
