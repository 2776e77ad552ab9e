#pragma once

#include <string>
#include <cstdint>
#include <core/types.hpp>
#include "control_socket_store.hpp"
#include "ssh_client.hpp"

struct ConnectionStatus {
    std::string state;              // "connected", "stale" or "disconnected"
    bool socket_exists = false;
    bool healthy = false;
    int64_t connected_since = 0;    // socket mtime, 0 if unknown
    std::string control_socket;
};

// Liveness checks for control sockets. Never mutates state and never throws:
// every check failure, malformed target included, reads as "not alive".
class HealthChecker {
public:
    HealthChecker(const ControlSocketStore& store, SshClient& client, int timeout_secs,
                  int freshness_secs);

    // Socket present and `ssh -O check` answers within the timeout.
    bool full_check(const std::string& target) const;

    // Socket present and younger than the freshness threshold: accepted
    // without a round trip. Older sockets fall back to full_check().
    bool quick_check(const std::string& target) const;

    // Status report; uses quick_check() for the health field.
    ConnectionStatus status(const std::string& target) const;

private:
    const ControlSocketStore& store_;
    SshClient& client_;
    int timeout_secs_;
    int freshness_secs_;
};
