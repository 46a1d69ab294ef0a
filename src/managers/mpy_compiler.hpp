#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <filesystem>
#include <core/config.hpp>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Drives the mpy-cross tool: MicroPython source in, .mpy bytecode out.
// Artifacts go to the configured build directory (relative to the cwd).
class MpyCompiler {
public:
    explicit MpyCompiler(const CompileConfig& config, StatusCallback callback = nullptr);

    // Compile a script file to build/<stem>.mpy and return its bytes
    Result<std::vector<uint8_t>> compile_file(const fs::path& script);

    // Save a one-liner as build/_tmp.py, then compile it
    Result<std::vector<uint8_t>> compile_string(const std::string& code);

    // Write a one-liner to build/_tmp.py without compiling it
    Result<fs::path> write_temp_script(const std::string& code);

    Result<void> ensure_build_dir();

    const fs::path& build_dir() const { return build_dir_; }

private:
    CompileConfig config_;
    fs::path build_dir_;
    StatusCallback callback_;

    // Let the tool print its own version banner
    void show_version();
};

// Render bytecode as a C array with a version/size header comment.
std::string format_c_array(const std::vector<uint8_t>& data);
