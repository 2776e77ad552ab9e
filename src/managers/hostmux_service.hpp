#pragma once

#include <string>
#include <vector>
#include <memory>
#include <core/config.hpp>
#include <core/types.hpp>
#include <ssh/control_socket_store.hpp>
#include <ssh/ssh_client.hpp>
#include <ssh/health_checker.hpp>
#include "connection_registry.hpp"
#include "stale_sweeper.hpp"
#include "connection_pool.hpp"
#include "connection_manager.hpp"
#include "device_cache.hpp"
#include "last_target.hpp"
#include "background_tasks.hpp"

// Plain rows for frontends.

struct ConnectionListing {
    std::string target;
    std::string connection_id;
    std::string state;          // "connected", "stale", "disconnected"
    bool healthy = false;
    std::string device_type;    // "unknown" when not cached or expired
    std::string registered_at;  // formatted, or "unknown"
};

struct ActiveConnection {
    std::string target;         // "unknown:<id>" for sockets with no registry row
    std::string connection_id;
    bool registered = false;
};

// Headless facade over the connection and cache layers. Owns every component;
// any frontend (CLI, tests) drives it.
class HostmuxService {
public:
    explicit HostmuxService(const Config& config);

    // Inject a client (tests use a fake) and establish timings.
    HostmuxService(const Config& config, std::unique_ptr<SshClient> client,
                   EstablishPolicy policy = {});

    ~HostmuxService();

    HostmuxService(const HostmuxService&) = delete;
    HostmuxService& operator=(const HostmuxService&) = delete;

    // Startup housekeeping: create directories, sweep and enforce capacity,
    // prune the device cache. The sweep and the cache expiry/warm pass run on
    // background threads, which the destructor joins.
    void init();

    // Same as init(), except the sweep and cache pass run in a detached
    // `<helper> __housekeep` process. Nothing is left for the destructor to
    // join, so a one-shot caller exits as soon as its own work is done.
    // Returns false when the helper could not be started.
    bool init_detached(const std::string& helper);

    // Sweep, expire and warm synchronously. This is what the detached
    // helper runs.
    void housekeep();

    // Wait for background housekeeping started by init().
    void wait_background();

    // ── Connections ───────────────────────────────────────────

    // Establish or reuse, then remember the target as last connected.
    Result<void> ensure_connection(const std::string& target);
    Result<CloseOutcome> close_connection(const std::string& target);
    Result<void> reconnect(const std::string& target);
    Result<SSHResult> run_command(const std::string& target, const std::string& command,
                                  int timeout_secs = 0);

    // Errors: InvalidTargetFormat.
    Result<ConnectionStatus> status(const std::string& target) const;

    // Registry rows with live status and cached device type.
    std::vector<ConnectionListing> list_connections();

    // Targets with a socket on disk, registered or not.
    std::vector<ActiveConnection> list_active() const;

    SweepReport cleanup();

    void cancel() { manager_->cancel(); }

    // ── Device cache ──────────────────────────────────────────

    Result<std::string> get_device_type(const std::string& target);
    Result<void> set_device_type(const std::string& target, const std::string& device_type,
                                 const std::string& method = "manual");
    Result<void> clear_device_type(const std::string& target);

    std::vector<CacheListing> cache_list() const { return cache_->list_all(); }
    CacheStats cache_stats() const { return cache_->stats(); }
    CacheCleanupReport cache_cleanup() { return cache_->cleanup_expired(); }
    const CacheCounters& cache_counters() const { return cache_->counters(); }

    Result<LastTarget> last_target() const { return last_->get(); }

    const Config& config() const { return config_; }

private:
    Config config_;
    std::unique_ptr<ControlSocketStore> store_;
    std::unique_ptr<SshClient> client_;
    std::unique_ptr<HealthChecker> health_;
    std::unique_ptr<ConnectionRegistry> registry_;
    std::unique_ptr<StaleConnectionSweeper> sweeper_;
    std::unique_ptr<ConnectionPool> pool_;
    std::unique_ptr<ConnectionManager> manager_;
    std::unique_ptr<DeviceTypeCache> cache_;
    std::unique_ptr<LastTargetTracker> last_;
    BackgroundTasks tasks_;

    void prepare();
};
