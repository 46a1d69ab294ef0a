#pragma once

// ── Device defaults (ev3dev image) ──────────────────────────
constexpr const char* DEFAULT_DEVICE_USER     = "robot";
constexpr const char* DEFAULT_DEVICE_PASSWORD = "maker";
constexpr const char* DEFAULT_DEVICE_HOME     = "/home/robot";
constexpr int DEFAULT_SSH_PORT                = 22;

// Remote invocation; {} is replaced with the deployed script's path
constexpr const char* DEFAULT_RUN_COMMAND = "brickrun -r -- pybricks-micropython {}";
constexpr const char* PROBE_COMMAND       = "pwd";
constexpr const char* BEEP_COMMAND        = "beep";

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_SECS     = 10;    // TCP connect + handshake + auth
constexpr int SSH_CMD_TIMEOUT_SECS     = 30;    // Max time for a single remote command
constexpr int PROBE_TIMEOUT_MS         = 3000;  // Liveness probe on a cached session
constexpr int STREAM_POLL_INTERVAL_MS  = 100;   // Bounded read in the output poll loop
constexpr int SFTP_OP_TIMEOUT_SECS     = 15;    // stat / mkdir / open / write
constexpr int CHANNEL_OPEN_TIMEOUT_SECS = 15;
constexpr int EAGAIN_SLEEP_MS          = 10;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE   = 4096;
constexpr int SFTP_WRITE_CHUNK    = 32768;

// ── Cross-compiler ──────────────────────────────────────────
constexpr const char* DEFAULT_MPY_CROSS   = "mpy-cross";
constexpr const char* DEFAULT_BUILD_DIR   = "build";
constexpr const char* MPY_NO_UNICODE_FLAG = "-mno-unicode";
constexpr const char* TMP_PY_SCRIPT       = "_tmp.py";
constexpr int MPY_C_ARRAY_WIDTH           = 8;

constexpr const char* BRICKDEV_VERSION = "0.2.0";
