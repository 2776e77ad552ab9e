#include "../hostmux_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/time_utils.hpp>

static int do_device(HostmuxCLI& cli, const HostmuxCLI::Args& args) {
    if (!cli.require_args("device", args, 2)) return 1;
    const std::string& sub = args[0];
    const std::string& target = args[1];
    auto& svc = cli.service();

    if (sub == "get") {
        auto r = svc.get_device_type(target);
        if (r.is_err()) {
            print_error(r.error, r.kind);
            return 1;
        }
        std::cout << r.value << "\n";
        return 0;
    }
    if (sub == "set") {
        if (!cli.require_args("device", args, 3)) return 1;
        std::string method = args.size() >= 4 ? args[3] : "manual";
        auto r = svc.set_device_type(target, args[2], method);
        if (r.is_err()) {
            print_error(r.error, r.kind);
            return 1;
        }
        std::cout << theme::ok(fmt::format("Cached device type for {}", target));
        return 0;
    }
    if (sub == "clear") {
        auto r = svc.clear_device_type(target);
        if (r.is_err()) {
            print_error(r.error, r.kind);
            return 1;
        }
        std::cout << theme::ok("Cleared cache for " + target);
        return 0;
    }

    std::cout << theme::fail("Unknown device subcommand: " + sub);
    return 1;
}

static int do_cache(HostmuxCLI& cli, const HostmuxCLI::Args& args) {
    if (!cli.require_args("cache", args, 1)) return 1;
    const std::string& sub = args[0];
    auto& svc = cli.service();

    if (sub == "list") {
        auto entries = svc.cache_list();
        std::cout << theme::section("Device cache");
        if (entries.empty()) {
            std::cout << theme::dim("    Cache is empty.") << "\n\n";
            return 0;
        }
        for (const auto& e : entries) {
            std::string age = format_age(e.age_secs);
            std::cout << fmt::format("    {:<32} {:<14} {:<8} {}", e.target, e.device_type,
                                     e.method, age)
                      << (e.expired ? theme::yellow(" expired") : "") << "\n";
        }
        std::cout << "\n";
        return 0;
    }
    if (sub == "stats") {
        auto s = svc.cache_stats();
        std::cout << theme::section("Cache statistics");
        std::cout << theme::kv("Directory", s.cache_dir);
        std::cout << theme::kv("Expiry", format_age(s.expiry_secs));
        std::cout << theme::kv("Entries", std::to_string(s.total));
        std::cout << theme::kv("Valid", std::to_string(s.valid));
        std::cout << theme::kv("Expired", std::to_string(s.expired));
        std::cout << theme::kv("Invalid", std::to_string(s.invalid));
        std::cout << "\n";
        return 0;
    }
    if (sub == "cleanup") {
        auto report = svc.cache_cleanup();
        std::cout << theme::ok(fmt::format("Removed {} of {} entries", report.cleaned,
                                           report.total));
        return 0;
    }

    std::cout << theme::fail("Unknown cache subcommand: " + sub);
    return 1;
}

void register_device_commands(HostmuxCLI& cli) {
    cli.add_command("device", do_device, "device get|set|clear <target> [type] [method]",
                    "Read or edit the cached device type");
    cli.add_command("cache", do_cache, "cache list|stats|cleanup",
                    "Inspect or prune the device cache");
}
