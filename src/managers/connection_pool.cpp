#include "connection_pool.hpp"
#include <ssh/target.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

ConnectionPool::ConnectionPool(ConnectionRegistry& registry, const ControlSocketStore& store,
                               SshClient& client, StaleConnectionSweeper& sweeper,
                               int control_timeout_secs)
    : registry_(registry), store_(store), client_(client), sweeper_(sweeper),
      control_timeout_secs_(control_timeout_secs) {}

std::vector<RegistryRow> ConnectionPool::enforce_capacity(int max_connections) {
    if (max_connections < 0) max_connections = 0;

    auto rows = registry_.rows();
    if (static_cast<int>(rows.size()) <= max_connections) {
        return {};
    }

    hostmux_log(fmt::format("pool: {} connections exceed limit {}, evicting oldest",
                            rows.size(), max_connections));

    // Oldest first; stable so equal timestamps keep file order
    std::stable_sort(rows.begin(), rows.end(), [](const RegistryRow& a, const RegistryRow& b) {
        return a.registered_at < b.registered_at;
    });

    size_t overage = rows.size() - static_cast<size_t>(max_connections);
    std::vector<RegistryRow> evicted(rows.begin(), rows.begin() + overage);

    std::vector<std::string> ids;
    for (const auto& row : evicted) ids.push_back(row.connection_id);

    auto removed = registry_.remove_ids(ids);
    if (removed.is_err()) {
        hostmux_log(fmt::format("pool: eviction write failed: {}", removed.error));
        return {};
    }

    for (const auto& row : evicted) {
        terminate(row);
        hostmux_log(fmt::format("pool: evicted {}", row.target));
    }

    sweeper_.sweep();
    return evicted;
}

void ConnectionPool::terminate(const RegistryRow& row) {
    fs::path socket = store_.path_for_id(row.connection_id);
    auto parsed = parse_target(row.target);
    if (parsed.is_ok() && store_.exists(row.target)) {
        auto r = client_.exit(socket.string(), parsed.value, control_timeout_secs_);
        if (r.failed()) {
            hostmux_log(fmt::format("pool: -O exit failed for {}, removing socket", row.target));
        }
    }
    store_.remove_path(socket);
}
