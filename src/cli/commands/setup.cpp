#include "../fleet_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <core/config.hpp>

static int do_init(FleetCLI& cli, std::vector<std::string>& args) {
    const auto& path = cli.config_path();
    if (config_exists(path)) {
        std::cout << theme::info("Config already exists at " + path.string());
        return 0;
    }

    auto created = create_default_config(path);
    if (created.is_err()) {
        std::cout << theme::fail(created.error);
        return 1;
    }

    std::error_code ec;
    auto base = path.parent_path();
    for (const char* dir : {"scripts", "ssh", "hooks", "logs"}) {
        std::filesystem::create_directories(base / dir, ec);
    }

    std::cout << theme::ok("Wrote " + path.string());
    std::cout << theme::step("Add your hosts under 'hosts:' and scripts to " + (base / "scripts").string());
    return 0;
}

void register_setup_commands(FleetCLI& cli) {
    cli.add_command("init", do_init, "init", "Write a starter config and its directories");
}
