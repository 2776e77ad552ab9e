#include "stale_sweeper.hpp"
#include <core/log.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>

StaleConnectionSweeper::StaleConnectionSweeper(const ControlSocketStore& store,
                                               ConnectionRegistry& registry,
                                               const HealthChecker& health)
    : store_(store), registry_(registry), health_(health) {}

SweepReport StaleConnectionSweeper::sweep() {
    SweepReport report;
    try {
        sweep_sockets(report);
        sweep_registry(report);
    } catch (const std::exception& e) {
        hostmux_log(fmt::format("sweep: aborted: {}", e.what()));
    }

    if (report.total() > 0) {
        hostmux_log(fmt::format("sweep: removed {} socket(s), {} registry row(s)",
                                report.sockets_removed, report.rows_removed));
    }
    return report;
}

void StaleConnectionSweeper::sweep_sockets(SweepReport& report) {
    for (const auto& sock : store_.list()) {
        auto target = registry_.lookup_target(sock.connection_id);

        if (target) {
            if (health_.quick_check(*target)) continue;

            store_.remove_path(sock.path);
            report.sockets_removed++;
            auto r = registry_.unregister(*target);
            if (r.is_err()) {
                hostmux_log(fmt::format("sweep: unregister {} failed: {}", *target, r.error));
            }
            hostmux_log(fmt::format("sweep: stale connection {}", *target));
        } else if (!platform::socket_in_use(sock.path.string())) {
            // Orphan with no registry row and nobody listening
            store_.remove_path(sock.path);
            report.sockets_removed++;
            hostmux_log(fmt::format("sweep: orphan socket {}", sock.path.string()));
        }
    }
}

void StaleConnectionSweeper::sweep_registry(SweepReport& report) {
    auto dropped = registry_.retain_if([&](const RegistryRow& row) {
        return platform::is_socket(store_.path_for_id(row.connection_id).string());
    });
    if (dropped.is_err()) {
        hostmux_log(fmt::format("sweep: registry rewrite failed: {}", dropped.error));
        return;
    }
    report.rows_removed += static_cast<int>(dropped.value);
}
