#include "health_checker.hpp"
#include "target.hpp"
#include <platform/socket_util.hpp>
#include <core/utils.hpp>

HealthChecker::HealthChecker(const ControlSocketStore& store, SshClient& client,
                             int timeout_secs, int freshness_secs)
    : store_(store), client_(client), timeout_secs_(timeout_secs),
      freshness_secs_(freshness_secs) {}

bool HealthChecker::full_check(const std::string& target) const {
    if (!store_.exists(target)) return false;

    auto parsed = parse_target(target);
    if (parsed.is_err()) return false;

    auto r = client_.check(store_.path_for(target).string(), parsed.value, timeout_secs_);
    return r.exit_code == 0;
}

bool HealthChecker::quick_check(const std::string& target) const {
    if (!store_.exists(target)) return false;

    long long age = platform::file_age_secs(store_.path_for(target).string());
    if (age >= 0 && age <= freshness_secs_) return true;

    return full_check(target);
}

ConnectionStatus HealthChecker::status(const std::string& target) const {
    ConnectionStatus s;
    s.control_socket = store_.path_for(target).string();
    s.state = "disconnected";

    if (store_.exists(target)) {
        s.socket_exists = true;
        long long age = platform::file_age_secs(s.control_socket);
        if (age >= 0) s.connected_since = now_epoch() - age;

        if (quick_check(target)) {
            s.state = "connected";
            s.healthy = true;
        } else {
            s.state = "stale";
        }
    }
    return s;
}
