#include "../hostmux_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/utils.hpp>
#include <core/time_utils.hpp>

static int do_connect(HostmuxCLI& cli, const HostmuxCLI::Args& args) {
    auto target = cli.resolve_target(args);
    if (!target) return 1;

    std::cout << theme::step("Connecting to " + theme::bold(*target) + "...");
    auto r = cli.service().ensure_connection(*target);
    if (r.is_err()) {
        print_error(r.error, r.kind);
        return 1;
    }
    std::cout << theme::ok("Connected to " + *target);
    return 0;
}

static int do_disconnect(HostmuxCLI& cli, const HostmuxCLI::Args& args) {
    auto target = cli.resolve_target(args);
    if (!target) return 1;

    auto r = cli.service().close_connection(*target);
    if (r.is_err()) {
        print_error(r.error, r.kind);
        return 1;
    }
    if (r.value == CloseOutcome::Forced) {
        std::cout << theme::info("Master did not answer; socket removed.");
    }
    std::cout << theme::ok("Disconnected from " + *target);
    return 0;
}

static int do_reconnect(HostmuxCLI& cli, const HostmuxCLI::Args& args) {
    auto target = cli.resolve_target(args);
    if (!target) return 1;

    std::cout << theme::step("Reconnecting to " + theme::bold(*target) + "...");
    auto r = cli.service().reconnect(*target);
    if (r.is_err()) {
        print_error(r.error, r.kind);
        return 1;
    }
    std::cout << theme::ok("Reconnected to " + *target);
    return 0;
}

// exec [--timeout N] <target> <command...>
static int do_exec(HostmuxCLI& cli, const HostmuxCLI::Args& args) {
    HostmuxCLI::Args rest = args;
    int timeout = 0;
    if (rest.size() >= 2 && rest[0] == "--timeout") {
        timeout = safe_stoi(rest[1], -1);
        if (timeout < 0) {
            std::cout << theme::fail("Invalid timeout: " + rest[1]);
            return 1;
        }
        rest.erase(rest.begin(), rest.begin() + 2);
    }
    if (!cli.require_args("exec", rest, 2)) return 1;

    std::string command = rest[1];
    for (size_t i = 2; i < rest.size(); i++) command += " " + rest[i];

    auto r = cli.service().run_command(rest[0], command, timeout);
    if (r.is_err()) {
        print_error(r.error, r.kind);
        return 1;
    }
    std::cout << r.value.stdout_data;
    std::cerr << r.value.stderr_data;
    return r.value.exit_code;
}

static int do_status(HostmuxCLI& cli, const HostmuxCLI::Args& args) {
    auto target = cli.resolve_target(args);
    if (!target) return 1;

    auto r = cli.service().status(*target);
    if (r.is_err()) {
        print_error(r.error, r.kind);
        return 1;
    }

    const auto& st = r.value;
    std::cout << theme::section("Status");
    std::cout << theme::kv("Target", *target);
    std::string state = st.state == "connected" ? theme::green(st.state)
                      : st.state == "stale"     ? theme::yellow(st.state)
                                                : theme::red(st.state);
    std::cout << theme::kv("State", state);
    std::cout << theme::kv("Socket", st.control_socket);
    if (st.connected_since > 0) {
        std::cout << theme::kv("Since", format_epoch(st.connected_since));
        std::cout << theme::kv("Age", format_age(now_epoch() - st.connected_since));
    }
    auto device = cli.service().get_device_type(*target);
    std::cout << theme::kv("Device", device.is_ok() ? device.value : "unknown");
    std::cout << "\n";
    return st.healthy ? 0 : 1;
}

static int do_list(HostmuxCLI& cli, const HostmuxCLI::Args&) {
    auto rows = cli.service().list_connections();
    std::cout << theme::section("Connections");
    if (rows.empty()) {
        std::cout << theme::dim("    No tracked connections.") << "\n\n";
        return 0;
    }

    std::cout << theme::color::DIM
              << fmt::format("    {:<32} {:<13} {:<14} {}", "TARGET", "STATE", "DEVICE",
                             "REGISTERED")
              << theme::color::RESET << "\n";
    for (const auto& row : rows) {
        std::cout << fmt::format("    {:<32} {:<13} {:<14} {}", row.target, row.state,
                                 row.device_type, row.registered_at)
                  << "\n";
    }
    std::cout << "\n";
    return 0;
}

static int do_active(HostmuxCLI& cli, const HostmuxCLI::Args&) {
    auto active = cli.service().list_active();
    if (active.empty()) {
        std::cout << theme::dim("    No active sockets.") << "\n";
        return 0;
    }
    for (const auto& a : active) {
        std::cout << "    " << (a.registered ? a.target : theme::dim(a.target)) << "\n";
    }
    return 0;
}

static int do_cleanup(HostmuxCLI& cli, const HostmuxCLI::Args&) {
    auto report = cli.service().cleanup();
    std::cout << theme::ok(fmt::format("Removed {} stale socket(s), {} registry row(s)",
                                       report.sockets_removed, report.rows_removed));
    return 0;
}

static int do_last(HostmuxCLI& cli, const HostmuxCLI::Args&) {
    auto r = cli.service().last_target();
    if (r.is_err()) {
        print_error(r.error, r.kind);
        return 1;
    }
    std::cout << r.value.target << "\n";
    return 0;
}

void register_connection_commands(HostmuxCLI& cli) {
    cli.add_command("connect", do_connect, "connect [user@host[:port]]",
                    "Open or reuse a master connection");
    cli.add_command("disconnect", do_disconnect, "disconnect [target]",
                    "Close a master connection");
    cli.add_command("reconnect", do_reconnect, "reconnect [target]",
                    "Close, then open a fresh master");
    cli.add_command("exec", do_exec, "exec [--timeout N] <target> <cmd>",
                    "Run a command over an existing master");
    cli.add_command("status", do_status, "status [target]", "Show connection status");
    cli.add_command("list", do_list, "list", "List tracked connections");
    cli.add_command("active", do_active, "active", "List targets with a control socket");
    cli.add_command("cleanup", do_cleanup, "cleanup", "Remove stale sockets and rows");
    cli.add_command("last", do_last, "last", "Print the last connected target");
}
