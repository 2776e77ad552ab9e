#include "connection_manager.hpp"
#include <ssh/target.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <chrono>

using std::chrono::milliseconds;

ConnectionManager::ConnectionManager(const SshSettings& settings,
                                     const ControlSocketStore& store, SshClient& client,
                                     const HealthChecker& health, ConnectionRegistry& registry,
                                     ConnectionPool& pool, EstablishPolicy policy)
    : settings_(settings), store_(store), client_(client), health_(health),
      registry_(registry), pool_(pool), policy_(policy) {}

Result<void> ConnectionManager::establish(const std::string& target) {
    auto parsed = parse_target(target);
    if (parsed.is_err()) return Result<void>::Err(parsed.kind, parsed.error);

    if (!store_.ensure_dir()) {
        return Result<void>::Err(ErrorKind::ConnectionFailed,
                                 "Cannot create control directory " + store_.dir().string());
    }

    if (health_.full_check(target)) {
        hostmux_log(fmt::format("establish: reusing healthy master for {}", target));
        return Result<void>::Ok();
    }

    // Leftover socket from a dead master blocks the new bind
    store_.remove(target);

    std::string socket = store_.path_for(target).string();
    hostmux_log(fmt::format("establish: connecting {} via {}", target, socket));

    auto master = client_.start_master(socket, parsed.value, settings_);
    if (!master) {
        return Result<void>::Err(ErrorKind::ConnectionFailed,
                                 "Failed to start ssh master for " + target);
    }

    wait_.reset();
    for (int attempt = 0; attempt < policy_.max_attempts; attempt++) {
        if (store_.exists(target)) {
            if (policy_.settle_ms > 0 && !wait_.wait_for(milliseconds(policy_.settle_ms))) break;
            if (health_.full_check(target)) {
                return on_established(target, parsed.value, *master);
            }
        } else {
            int code = 0;
            if (master->exited(code) && code != 0) {
                return Result<void>::Err(ErrorKind::ConnectionFailed,
                                         fmt::format("ssh exited with status {} while connecting to {}",
                                                     code, target));
            }
        }

        if (!wait_.wait_for(milliseconds(policy_.interval_ms))) break;
    }

    abandon(target, parsed.value, *master);

    if (wait_.cancelled()) {
        hostmux_log(fmt::format("establish: cancelled for {}", target));
        return Result<void>::Err(ErrorKind::ConnectionTimeout,
                                 "Connection attempt cancelled: " + target);
    }

    hostmux_log(fmt::format("establish: timed out after {} attempts for {}",
                            policy_.max_attempts, target));
    return Result<void>::Err(ErrorKind::ConnectionTimeout,
                             "Timed out establishing connection: " + target);
}

Result<void> ConnectionManager::on_established(const std::string& target,
                                               const SshTarget& parsed,
                                               MasterProcess& master) {
    auto reg = registry_.register_connection(target);
    if (reg.is_err()) {
        hostmux_log(fmt::format("establish: connected {} but registry failed: {}",
                                target, reg.error));
        abandon(target, parsed, master);
        return reg;
    }
    pool_.enforce_capacity(settings_.max_connections);
    hostmux_log(fmt::format("establish: connected {}", target));
    return Result<void>::Ok();
}

void ConnectionManager::abandon(const std::string& target, const SshTarget& parsed,
                                MasterProcess& master) {
    if (store_.exists(target)) {
        auto r = client_.exit(store_.path_for(target).string(), parsed, settings_.timeout);
        if (r.failed()) {
            hostmux_log(fmt::format("establish: -O exit failed for abandoned {}", target));
        }
        store_.remove(target);
    }
    master.terminate();
    hostmux_log(fmt::format("establish: abandoned master for {}", target));
}

Result<CloseOutcome> ConnectionManager::close(const std::string& target) {
    auto parsed = parse_target(target);
    if (parsed.is_err()) return Result<CloseOutcome>::Err(parsed.kind, parsed.error);

    if (!store_.exists(target)) {
        return Result<CloseOutcome>::Err(ErrorKind::ConnectionNotFound,
                                         "No connection for " + target);
    }

    std::string socket = store_.path_for(target).string();
    CloseOutcome outcome = CloseOutcome::Graceful;

    auto r = client_.exit(socket, parsed.value, settings_.timeout);
    if (r.failed()) {
        outcome = CloseOutcome::Forced;
        hostmux_log(fmt::format("close: -O exit failed for {}, forcing", target));
    }
    // ssh removes the socket on a clean exit; make sure either way
    store_.remove(target);

    auto unreg = registry_.unregister(target);
    if (unreg.is_err()) {
        hostmux_log(fmt::format("close: unregister {} failed: {}", target, unreg.error));
    }

    hostmux_log(fmt::format("close: {} ({})", target,
                            outcome == CloseOutcome::Graceful ? "graceful" : "forced"));
    return Result<CloseOutcome>::Ok(outcome);
}

Result<void> ConnectionManager::reconnect(const std::string& target) {
    hostmux_log(fmt::format("reconnect: {}", target));

    auto closed = close(target);
    if (closed.is_err() && closed.kind != ErrorKind::ConnectionNotFound) {
        return Result<void>::Err(closed.kind, closed.error);
    }

    wait_.reset();
    if (policy_.reconnect_pause_ms > 0 &&
        !wait_.wait_for(milliseconds(policy_.reconnect_pause_ms))) {
        return Result<void>::Err(ErrorKind::ConnectionTimeout,
                                 "Reconnect cancelled: " + target);
    }

    return establish(target);
}

Result<SSHResult> ConnectionManager::execute(const std::string& target,
                                             const std::string& command, int timeout_secs) {
    auto parsed = parse_target(target);
    if (parsed.is_err()) return Result<SSHResult>::Err(parsed.kind, parsed.error);

    if (!store_.exists(target)) {
        return Result<SSHResult>::Err(ErrorKind::ConnectionNotFound,
                                      "No connection for " + target);
    }
    if (!health_.full_check(target)) {
        return Result<SSHResult>::Err(ErrorKind::ConnectionUnhealthy,
                                      "Connection is not healthy: " + target);
    }

    auto r = client_.exec(store_.path_for(target).string(), parsed.value, command,
                          settings_.timeout, timeout_secs);
    return Result<SSHResult>::Ok(r);
}
