#include "../hostmux_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <core/config.hpp>

static int do_init_config(HostmuxCLI& cli, const HostmuxCLI::Args& args) {
    if (config_exists()) {
        std::cout << theme::info("Config already exists at " + get_config_path().string());
        return 0;
    }
    auto r = create_default_config();
    if (r.is_err()) {
        print_error(r.error, r.kind);
        return 1;
    }
    std::cout << theme::ok("Wrote " + get_config_path().string());
    return 0;
}

void register_setup_commands(HostmuxCLI& cli) {
    cli.add_command("init-config", do_init_config, "init-config",
                    "Write a default config file");
}
