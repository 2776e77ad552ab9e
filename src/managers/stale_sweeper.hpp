#pragma once

#include <ssh/control_socket_store.hpp>
#include <ssh/health_checker.hpp>
#include "connection_registry.hpp"

struct SweepReport {
    int sockets_removed = 0;
    int rows_removed = 0;

    int total() const { return sockets_removed + rows_removed; }
};

// Removes dead control sockets and registry rows whose socket is gone.
// Safe to run concurrently with other processes touching the same files:
// anything that vanishes mid-sweep is skipped. Never throws.
class StaleConnectionSweeper {
public:
    StaleConnectionSweeper(const ControlSocketStore& store, ConnectionRegistry& registry,
                           const HealthChecker& health);

    SweepReport sweep();

private:
    const ControlSocketStore& store_;
    ConnectionRegistry& registry_;
    const HealthChecker& health_;

    void sweep_sockets(SweepReport& report);
    void sweep_registry(SweepReport& report);
};
