#include "../brickdev_cli.hpp"
#include "../theme.hpp"
#include <managers/mpy_compiler.hpp>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

static int do_compile(BrickdevCLI& cli, const BrickdevCLI::Args& args) {
    if (args.empty()) {
        std::cout << theme::fail("Usage: brickdev compile <script>");
        return 1;
    }
    if (!cli.require_config()) return 1;

    MpyCompiler compiler(cli.config->compile(), [](const std::string& msg) {
        std::cout << theme::step(msg);
    });

    std::error_code ec;
    auto bytes = fs::is_regular_file(args[0], ec)
        ? compiler.compile_file(args[0])
        : compiler.compile_string(args[0]);
    if (bytes.is_err()) {
        std::cout << theme::fail(bytes.error);
        return 1;
    }

    std::cout << "\n" << format_c_array(bytes.value);
    return 0;
}

static int do_init(BrickdevCLI&, const BrickdevCLI::Args&) {
    if (config_exists()) {
        std::cout << theme::info("Config already exists: " + get_config_path().string());
        return 0;
    }
    auto r = create_default_config();
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    std::cout << theme::ok("Wrote " + get_config_path().string());
    return 0;
}

void register_compile_commands(BrickdevCLI& cli) {
    cli.add_command("compile", do_compile, "<script>", "Cross-compile to .mpy and print it as a C array");
    cli.add_command("init", do_init, "", "Write the default ~/.brickdev/config.yaml");
}
