#pragma once

#include <vector>
#include <ssh/control_socket_store.hpp>
#include <ssh/ssh_client.hpp>
#include "connection_registry.hpp"
#include "stale_sweeper.hpp"

// Hard cap on tracked connections. Oldest registrations go first.
class ConnectionPool {
public:
    ConnectionPool(ConnectionRegistry& registry, const ControlSocketStore& store,
                   SshClient& client, StaleConnectionSweeper& sweeper, int control_timeout_secs);

    // Evict the oldest rows until at most `max_connections` remain, shut down
    // their masters and remove their sockets, then sweep. Returns the evicted
    // rows (empty when already within capacity).
    std::vector<RegistryRow> enforce_capacity(int max_connections);

private:
    ConnectionRegistry& registry_;
    const ControlSocketStore& store_;
    SshClient& client_;
    StaleConnectionSweeper& sweeper_;
    int control_timeout_secs_;

    void terminate(const RegistryRow& row);
};
