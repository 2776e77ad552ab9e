#include "hostmux_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <iostream>
#include <stdexcept>
#include <fmt/format.h>

HostmuxCLI::HostmuxCLI() {
    register_all_commands();
}

void HostmuxCLI::register_all_commands() {
    register_connection_commands(*this);
    register_device_commands(*this);
    register_setup_commands(*this);

    // Not listed in help; started by service() in the background
    add_command(HOUSEKEEP_COMMAND, [](HostmuxCLI& cli, const Args&) {
        cli.load_service().housekeep();
        return 0;
    }, HOUSEKEEP_COMMAND, "Sweep stale connections and prune the device cache");
}

void HostmuxCLI::add_command(const std::string& name, CommandHandler handler,
                             const std::string& usage, const std::string& help) {
    commands_[name] = {std::move(handler), usage, help};
}

HostmuxService& HostmuxCLI::load_service() {
    if (!service_) {
        auto config = Config::load();
        if (config.is_err()) {
            throw std::runtime_error(config.error);
        }
        service_ = std::make_unique<HostmuxService>(config.value);
    }
    return *service_;
}

HostmuxService& HostmuxCLI::service() {
    bool fresh = !service_;
    auto& svc = load_service();
    if (fresh && !svc.init_detached(platform::self_exe().string())) {
        hostmux_log("cli: continuing without background housekeeping");
    }
    return svc;
}

std::optional<std::string> HostmuxCLI::resolve_target(const Args& args, size_t index) {
    if (args.size() > index) return args[index];

    auto last = service().last_target();
    if (last.is_err()) {
        std::cout << theme::fail("No target given and no previous connection.");
        return std::nullopt;
    }
    std::cout << theme::info("Using last target " + theme::bold(last.value.target));
    return last.value.target;
}

bool HostmuxCLI::require_args(const std::string& command, const Args& args, size_t n) const {
    if (args.size() >= n) return true;
    auto it = commands_.find(command);
    std::cout << theme::fail("Missing arguments.");
    if (it != commands_.end()) {
        std::cout << theme::step("Usage: hostmux " + it->second.usage);
    }
    return false;
}

int HostmuxCLI::execute_command(const std::string& command, const Args& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'hostmux --help' for available commands.");
        return 1;
    }

    try {
        return it->second.handler(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

void HostmuxCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Connections", {"connect", "disconnect", "reconnect", "exec", "status", "list",
                         "active", "cleanup", "last"}},
        {"Device cache", {"device", "cache"}},
        {"Setup", {"init-config"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << theme::section(cat_name);
        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it == commands_.end()) continue;
            std::cout << theme::color::BLUE << fmt::format("    {:<34}", it->second.usage)
                      << theme::color::RESET << theme::color::DIM << it->second.help
                      << theme::color::RESET << "\n";
        }
    }
    std::cout << "\n";
}

void print_error(const std::string& message, ErrorKind kind) {
    std::cout << theme::fail(message);
    std::cout << theme::detail(error_kind_name(kind));
}
