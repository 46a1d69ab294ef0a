#include "mpy_compiler.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <iterator>

MpyCompiler::MpyCompiler(const CompileConfig& config, StatusCallback callback)
    : config_(config), build_dir_(config.build_dir), callback_(std::move(callback)) {
}

Result<void> MpyCompiler::ensure_build_dir() {
    std::error_code ec;
    if (fs::exists(build_dir_, ec) && !fs::is_directory(build_dir_, ec)) {
        return Result<void>::Err(ErrorKind::Compile,
            fmt::format("{} exists and is not a directory", build_dir_.string()));
    }
    fs::create_directories(build_dir_, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Compile,
            fmt::format("Cannot create {}: {}", build_dir_.string(), ec.message()));
    }
    return Result<void>::Ok();
}

void MpyCompiler::show_version() {
    auto proc = platform::spawn(config_.mpy_cross, {"--version"});
    if (!proc.valid()) {
        brickdev_log("mpy: could not start " + config_.mpy_cross + " --version");
        return;
    }
    auto code = proc.wait(SSH_CMD_TIMEOUT_SECS * 1000);
    if (!code) {
        proc.terminate();
        brickdev_log("mpy: --version timed out");
    }
}

Result<std::vector<uint8_t>> MpyCompiler::compile_file(const fs::path& script) {
    using R = Result<std::vector<uint8_t>>;

    std::error_code ec;
    if (!fs::is_regular_file(script, ec)) {
        return R::Err(ErrorKind::Compile, "No such script: " + script.string());
    }

    auto dir = ensure_build_dir();
    if (dir.is_err()) return forward_error<std::vector<uint8_t>>(dir);

    show_version();

    fs::path out = build_dir_ / (script.stem().string() + ".mpy");
    std::vector<std::string> args{script.string()};
    args.insert(args.end(), config_.flags.begin(), config_.flags.end());
    args.push_back("-o");
    args.push_back(out.string());

    if (callback_) callback_("Compiling " + script.string());
    auto proc = platform::spawn(config_.mpy_cross, args);
    if (!proc.valid()) {
        return R::Err(ErrorKind::Compile, "Failed to start " + config_.mpy_cross);
    }

    auto code = proc.wait();
    if (!code) {
        return R::Err(ErrorKind::Compile, config_.mpy_cross + " did not exit");
    }
    if (*code == platform::EXEC_FAILED_EXIT_CODE) {
        return R::Err(ErrorKind::Compile, config_.mpy_cross + " not found on PATH");
    }
    if (*code != 0) {
        return R::Err(ErrorKind::Compile,
            fmt::format("{} exited with code {}", config_.mpy_cross, *code));
    }

    std::ifstream in(out, std::ios::binary);
    if (!in) {
        return R::Err(ErrorKind::Compile, "Cannot read " + out.string());
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    brickdev_log(fmt::format("mpy: {} -> {} ({} bytes)", script.string(), out.string(), bytes.size()));
    return R::Ok(std::move(bytes));
}

Result<fs::path> MpyCompiler::write_temp_script(const std::string& code) {
    auto dir = ensure_build_dir();
    if (dir.is_err()) return forward_error<fs::path>(dir);

    fs::path py = build_dir_ / TMP_PY_SCRIPT;
    std::ofstream f(py, std::ios::trunc);
    if (!f) {
        return Result<fs::path>::Err(ErrorKind::Compile, "Cannot write " + py.string());
    }
    f << code << "\n";
    f.close();
    if (!f) {
        return Result<fs::path>::Err(ErrorKind::Compile, "Cannot write " + py.string());
    }
    return Result<fs::path>::Ok(py);
}

Result<std::vector<uint8_t>> MpyCompiler::compile_string(const std::string& code) {
    auto py = write_temp_script(code);
    if (py.is_err()) return forward_error<std::vector<uint8_t>>(py);
    return compile_file(py.value);
}

std::string format_c_array(const std::vector<uint8_t>& data) {
    int version = data.size() > 1 ? data[1] : 0;

    std::string out = fmt::format("// MPY file. Version: {}. Size: {}\n", version, data.size());
    out += "const uint8_t script[] = {\n";
    for (size_t i = 0; i < data.size(); i += MPY_C_ARRAY_WIDTH) {
        out += "    ";
        size_t end = std::min(data.size(), i + MPY_C_ARRAY_WIDTH);
        for (size_t j = i; j < end; j++) {
            out += fmt::format("0x{:02X},", static_cast<unsigned>(data[j]));
            if (j + 1 < end) out += " ";
        }
        out += "\n";
    }
    out += "};\n";
    return out;
}
