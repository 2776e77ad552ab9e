#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <functional>
#include <managers/hostmux_service.hpp>

class HostmuxCLI;

// Forward declarations for command registration
void register_connection_commands(HostmuxCLI& cli);
void register_device_commands(HostmuxCLI& cli);
void register_setup_commands(HostmuxCLI& cli);

// One-shot command dispatcher: `hostmux <command> [args...]`.
class HostmuxCLI {
public:
    using Args = std::vector<std::string>;
    // Returns the process exit code.
    using CommandHandler = std::function<int(HostmuxCLI&, const Args&)>;

    HostmuxCLI();

    void add_command(const std::string& name, CommandHandler handler,
                     const std::string& usage, const std::string& help);

    bool has_command(const std::string& name) const { return commands_.count(name) > 0; }

    int execute_command(const std::string& command, const Args& args);
    void print_help() const;

    // Service built on first use from the loaded config. Startup housekeeping
    // is handed to a detached copy of this executable.
    HostmuxService& service();

    // args[index], else the last connected target. Prints a failure and
    // returns nullopt when neither exists.
    std::optional<std::string> resolve_target(const Args& args, size_t index = 0);

    // Print the usage line of `command` when args has fewer than `n` entries.
    bool require_args(const std::string& command, const Args& args, size_t n) const;

private:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, Command> commands_;
    std::unique_ptr<HostmuxService> service_;

    void register_all_commands();
    HostmuxService& load_service();
};

// Print a failed Result: message plus error kind.
void print_error(const std::string& message, ErrorKind kind);
