#pragma once

#include <string>
#include "types.hpp"

// Debug log file: <tmp>/brickdev_debug.log unless redirected by config.
std::string brickdev_log_path();
void set_brickdev_log_path(const std::string& path);

// Append a "[HH:MM:SS.mmm] msg" line to the debug log.
void brickdev_log(const std::string& msg);

// Log a remote command and its (truncated) result.
void brickdev_log_ssh(const std::string& label, const std::string& cmd,
                      const SSHResult& r);
