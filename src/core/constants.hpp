#pragma once

// ── Remote conventions ──────────────────────────────────────
// Uploaded scripts live here, relative to the remote home directory.
constexpr const char* REMOTE_WORK_DIR    = ".fleetsh_scripts";
constexpr const char* REBOOT_COMMAND     = "systemctl reboot || reboot || shutdown -r now";
constexpr const char* SHELL_PROBE_CMD    = "command -v bash >/dev/null 2>&1 && echo bash || echo sh";
constexpr const char* DEFAULT_TERM       = "xterm";

// ── Ports ───────────────────────────────────────────────────
constexpr int DEFAULT_SSH_PORT           = 22;
constexpr int PORT_PROBE_TIMEOUT_MS      = 3000;

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CMD_TIMEOUT_SECS       = 300;   // Max time for a captured command
constexpr int SHELL_PROBE_TIMEOUT_SECS   = 5;
constexpr int REBOOT_ISSUE_TIMEOUT_SECS  = 5;
constexpr int CHANNEL_OPEN_TIMEOUT_SECS  = 30;

// ── Reboot liveness ─────────────────────────────────────────
constexpr int REBOOT_DOWN_TIMEOUT_SECS   = 60;
constexpr int REBOOT_DOWN_POLL_SECS      = 2;
constexpr int REBOOT_UP_POLL_SECS        = 3;
constexpr int REBOOT_DEFAULT_WAIT_SECS   = 180;   // bare --wait

// ── Channel multiplexing ────────────────────────────────────
constexpr int MUX_POLL_INTERVAL_MS       = 100;
constexpr int MUX_TICK_INTERVAL_MS       = 10;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 32768;
constexpr int STDIN_READ_BUF_SIZE        = 1024;
constexpr int SFTP_CHUNK_SIZE            = 32768;

// ── Defaults ────────────────────────────────────────────────
constexpr int DEFAULT_TERM_COLS          = 80;
constexpr int DEFAULT_TERM_ROWS          = 24;
constexpr int DEFAULT_LOG_TAIL_LINES     = 50;
