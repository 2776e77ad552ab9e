#pragma once

#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <core/cancellable_wait.hpp>
#include <ssh/control_socket_store.hpp>
#include <ssh/ssh_client.hpp>
#include <ssh/health_checker.hpp>
#include "connection_registry.hpp"
#include "connection_pool.hpp"

enum class CloseOutcome {
    Graceful,   // master acknowledged -O exit
    Forced,     // -O exit failed, socket file removed by hand
};

// Bounds for the establish wait loop.
struct EstablishPolicy {
    int max_attempts = ESTABLISH_MAX_ATTEMPTS;
    int interval_ms = ESTABLISH_POLL_INTERVAL_MS;
    int settle_ms = ESTABLISH_SETTLE_MS;
    int reconnect_pause_ms = RECONNECT_PAUSE_MS;
};

// Establish / reuse / close / reconnect / execute over ControlMaster sessions.
class ConnectionManager {
public:
    ConnectionManager(const SshSettings& settings, const ControlSocketStore& store,
                      SshClient& client, const HealthChecker& health,
                      ConnectionRegistry& registry, ConnectionPool& pool,
                      EstablishPolicy policy = {});

    // Ensure a healthy master for `target`. Returns at once when one is
    // already alive; otherwise starts a master and waits for it.
    // Errors: InvalidTargetFormat, ConnectionFailed, ConnectionTimeout, RegistryIOError.
    Result<void> establish(const std::string& target);

    // Shut the master down (-O exit, or remove the socket when that fails)
    // and drop the registry row. ConnectionNotFound if no socket exists.
    Result<CloseOutcome> close(const std::string& target);

    // close() (a missing connection is fine), short pause, establish().
    Result<void> reconnect(const std::string& target);

    // Run `command` over a healthy master. Output and exit code come back
    // untouched; no retries. timeout_secs <= 0 waits indefinitely.
    Result<SSHResult> execute(const std::string& target, const std::string& command,
                              int timeout_secs = 0);

    // Abort an establish() wait running on another thread.
    void cancel() { wait_.cancel(); }

private:
    SshSettings settings_;
    const ControlSocketStore& store_;
    SshClient& client_;
    const HealthChecker& health_;
    ConnectionRegistry& registry_;
    ConnectionPool& pool_;
    EstablishPolicy policy_;
    CancellableWait wait_;

    Result<void> on_established(const std::string& target, const SshTarget& parsed,
                                MasterProcess& master);

    // Tear down a master that establish() is giving up on, so no socket is
    // left without a registry row.
    void abandon(const std::string& target, const SshTarget& parsed, MasterProcess& master);
};
