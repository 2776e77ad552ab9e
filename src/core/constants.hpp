#pragma once

#include <cstdint>

// ── SSH options ─────────────────────────────────────────────
// Master sessions run unattended, so host key prompts are disabled.
constexpr const char* SSH_OPT_NO_HOSTKEY    = "StrictHostKeyChecking=no";
constexpr const char* SSH_OPT_NO_KNOWNHOSTS = "UserKnownHostsFile=/dev/null";
constexpr const char* SSH_OPT_LOGLEVEL      = "LogLevel=ERROR";

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_DEFAULT_TIMEOUT_SECS         = 10;    // -O check / exec ConnectTimeout
constexpr int SSH_DEFAULT_CONNECT_TIMEOUT_SECS = 30;    // master ConnectTimeout
constexpr int SSH_DEFAULT_CONTROL_PERSIST_SECS = 600;   // ControlPersist
constexpr int SSH_CONTROL_CMD_GRACE_SECS       = 5;     // extra wait on top of ConnectTimeout
constexpr int SOCKET_FRESHNESS_SECS            = 3600;  // quick check trusts younger sockets
constexpr int RECONNECT_PAUSE_MS               = 1000;

// ── Establish wait ──────────────────────────────────────────
constexpr int ESTABLISH_MAX_ATTEMPTS       = 30;
constexpr int ESTABLISH_POLL_INTERVAL_MS   = 1000;
constexpr int ESTABLISH_SETTLE_MS          = 1000;  // socket present, let the master settle

// ── Pool ────────────────────────────────────────────────────
constexpr int DEFAULT_MAX_CONNECTIONS      = 10;

// ── Device cache ────────────────────────────────────────────
constexpr const char* CACHE_VERSION        = "1.0";
constexpr int64_t DEFAULT_CACHE_EXPIRY_SECS = 86400;  // 24h
constexpr int DEFAULT_CACHE_MAX_SIZE       = 1000;
constexpr int CACHE_EVICT_SLACK            = 10;      // extra files removed per size pass
constexpr int CACHE_WARM_MAX_FILES         = 20;
constexpr int64_t CACHE_WARM_WINDOW_SECS   = 86400;
constexpr int DEVICE_TYPE_MAX_LEN          = 50;

// Hidden CLI command run by the detached housekeeping process
constexpr const char* HOUSEKEEP_COMMAND    = "__housekeep";

// ── File names ──────────────────────────────────────────────
constexpr const char* SOCKET_PREFIX        = "ssh-";
constexpr const char* REGISTRY_FILE        = "connection_registry";
constexpr const char* REGISTRY_LOCK_FILE   = "connection_registry.lock";
constexpr const char* CACHE_FILE_PREFIX    = "device-";
constexpr const char* CACHE_FILE_SUFFIX    = ".cache";
constexpr const char* LAST_TARGET_FILE     = "last_connected_target";
