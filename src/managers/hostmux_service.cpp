#include "hostmux_service.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <ssh/target.hpp>
#include <fmt/format.h>
#include <set>

HostmuxService::HostmuxService(const Config& config)
    : HostmuxService(config,
                     std::make_unique<OpenSshClient>(config.ssh().binary, hostmux_log_path())) {}

HostmuxService::HostmuxService(const Config& config, std::unique_ptr<SshClient> client,
                               EstablishPolicy policy)
    : config_(config), client_(std::move(client)) {
    const auto& ssh = config_.ssh();
    store_ = std::make_unique<ControlSocketStore>(config_.control_dir());
    health_ = std::make_unique<HealthChecker>(*store_, *client_, ssh.timeout,
                                              SOCKET_FRESHNESS_SECS);
    registry_ = std::make_unique<ConnectionRegistry>(config_.control_dir());
    sweeper_ = std::make_unique<StaleConnectionSweeper>(*store_, *registry_, *health_);
    pool_ = std::make_unique<ConnectionPool>(*registry_, *store_, *client_, *sweeper_,
                                             ssh.timeout);
    manager_ = std::make_unique<ConnectionManager>(ssh, *store_, *client_, *health_,
                                                   *registry_, *pool_, policy);
    cache_ = std::make_unique<DeviceTypeCache>(config_.cache());
    last_ = std::make_unique<LastTargetTracker>(config_.cache_dir(), *registry_);
}

HostmuxService::~HostmuxService() {
    manager_->cancel();
    tasks_.wait_all();
}

// Fast startup work every entry point does inline.
void HostmuxService::prepare() {
    if (!store_->ensure_dir()) {
        hostmux_log(fmt::format("init: cannot create {}", store_->dir().string()));
    }
    if (!platform::ensure_private_dir(config_.cache_dir())) {
        hostmux_log(fmt::format("init: cannot create {}", config_.cache_dir().string()));
    }

    auto evicted = pool_->enforce_capacity(config_.ssh().max_connections);
    if (!evicted.empty()) {
        hostmux_log(fmt::format("init: evicted {} connection(s) over capacity", evicted.size()));
    }

    cache_->manage_size();
}

void HostmuxService::init() {
    prepare();

    tasks_.submit("sweep", [this] {
        auto report = sweeper_->sweep();
        hostmux_log(fmt::format("init: swept {} stale entries", report.total()));
    });
    tasks_.submit("cache housekeeping", [this] {
        auto report = cache_->cleanup_expired();
        int warmed = cache_->warm();
        hostmux_log(fmt::format("init: cache cleaned {}/{}, warmed {}", report.cleaned,
                                report.total, warmed));
    });
}

bool HostmuxService::init_detached(const std::string& helper) {
    prepare();

    if (helper.empty()) {
        hostmux_log("init: no housekeeping helper, sweep skipped");
        return false;
    }
    // Never reaped here; the helper is reparented once this process exits
    auto proc = platform::spawn(helper, {HOUSEKEEP_COMMAND}, hostmux_log_path(), true);
    if (!proc.valid()) {
        hostmux_log(fmt::format("init: cannot start housekeeping helper {}", helper));
        return false;
    }
    return true;
}

void HostmuxService::housekeep() {
    auto swept = sweeper_->sweep();
    auto cleaned = cache_->cleanup_expired();
    int warmed = cache_->warm();
    hostmux_log(fmt::format("housekeep: swept {} stale entries, cache cleaned {}/{}, warmed {}",
                            swept.total(), cleaned.cleaned, cleaned.total, warmed));
}

void HostmuxService::wait_background() {
    tasks_.wait_all();
}

// ── Connections ───────────────────────────────────────────────

Result<void> HostmuxService::ensure_connection(const std::string& target) {
    auto r = manager_->establish(target);
    if (r.is_err()) return r;

    auto saved = last_->set(target);
    if (saved.is_err()) {
        hostmux_log(fmt::format("last target not saved: {}", saved.error));
    }
    return r;
}

Result<CloseOutcome> HostmuxService::close_connection(const std::string& target) {
    return manager_->close(target);
}

Result<void> HostmuxService::reconnect(const std::string& target) {
    auto r = manager_->reconnect(target);
    if (r.is_ok()) {
        auto saved = last_->set(target);
        if (saved.is_err()) {
            hostmux_log(fmt::format("last target not saved: {}", saved.error));
        }
    }
    return r;
}

Result<SSHResult> HostmuxService::run_command(const std::string& target,
                                              const std::string& command, int timeout_secs) {
    return manager_->execute(target, command, timeout_secs);
}

Result<ConnectionStatus> HostmuxService::status(const std::string& target) const {
    auto parsed = parse_target(target);
    if (parsed.is_err()) return Result<ConnectionStatus>::Err(parsed.kind, parsed.error);
    return Result<ConnectionStatus>::Ok(health_->status(target));
}

std::vector<ConnectionListing> HostmuxService::list_connections() {
    std::vector<ConnectionListing> out;
    for (const auto& row : registry_->rows()) {
        ConnectionListing l;
        l.target = row.target;
        l.connection_id = row.connection_id;

        if (!store_->exists(row.target)) {
            l.state = "disconnected";
        } else if (health_->full_check(row.target)) {
            l.state = "connected";
            l.healthy = true;
        } else {
            l.state = "stale";
        }

        auto device = cache_->get_valid(row.target);
        l.device_type = device.is_ok() ? device.value : "unknown";
        l.registered_at = format_registered_at(row.registered_at);
        out.push_back(l);
    }
    return out;
}

std::vector<ActiveConnection> HostmuxService::list_active() const {
    std::vector<ActiveConnection> out;
    std::set<std::string> seen;

    for (const auto& row : registry_->rows()) {
        if (!store_->exists(row.target)) continue;
        out.push_back({row.target, row.connection_id, true});
        seen.insert(row.connection_id);
    }
    for (const auto& sock : store_->list()) {
        if (seen.count(sock.connection_id)) continue;
        out.push_back({"unknown:" + sock.connection_id, sock.connection_id, false});
    }
    return out;
}

SweepReport HostmuxService::cleanup() {
    return sweeper_->sweep();
}

// ── Device cache ──────────────────────────────────────────────

Result<std::string> HostmuxService::get_device_type(const std::string& target) {
    return cache_->get_valid(target);
}

Result<void> HostmuxService::set_device_type(const std::string& target,
                                             const std::string& device_type,
                                             const std::string& method) {
    return cache_->save(target, device_type, method);
}

Result<void> HostmuxService::clear_device_type(const std::string& target) {
    return cache_->clear(target);
}
