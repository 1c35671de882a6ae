#include "config.hpp"
#include "diagnostics.hpp"
#include "link_publisher.hpp"
#include "linux_backend.hpp"
#include "supervisor.hpp"
#include <signal.h>
#include <cstring>
#include <iostream>

static volatile sig_atomic_t running = 1;

void signal_handler(int sig) {
    (void)sig;
    running = 0;
}

int main(int argc, char* argv[]) {
    auto cli = parse_args(argc, argv);
    if (!cli) {
        print_usage(argv[0]);
        return 2;
    }
    if (cli->mode == RunMode::Help) {
        print_usage(argv[0]);
        return 0;
    }

    // Defaults, then the settings file, then the command line
    const bool explicit_config = !cli->config_path.empty();
    const std::string config_path = explicit_config ? cli->config_path : ConfigManager::get_config_path();
    auto file_config = ConfigManager::load(config_path);
    if (file_config) {
        std::cout << "Loaded settings from " << config_path << "\n";
        cli = parse_args(argc, argv, *file_config);
    } else if (explicit_config) {
        std::cerr << "Cannot read settings file " << config_path << "\n";
        return 2;
    }
    if (!cli) {
        return 2;
    }

    const Config config = cli->config;

    if (cli->mode == RunMode::WriteConfig) {
        if (!ConfigManager::save(cli->write_path, config)) {
            std::cerr << "Failed to write settings to " << cli->write_path << "\n";
            return 1;
        }
        std::cout << "Wrote settings to " << cli->write_path << "\n";
        return 0;
    }

    if (cli->mode == RunMode::Diagnostics) {
        return diagnostics_mode(config);
    }

    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    // No SA_RESTART: the wait for evdev input has to return EINTR on shutdown
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // Progress lines go to a journal, not a terminal
    std::cout << std::unitbuf;
    std::cout << "Setting up virtual gamepad " << config.virtual_name << "\n";

    LinuxBackend backend;
    ReconnectionSupervisor supervisor(config, backend, running);
    SupervisorExit exit_kind = supervisor.run();

    if (exit_kind == SupervisorExit::Fatal) {
        return 1;
    }

    std::cout << "Exiting after " << supervisor.stats().sessions << " sessions, "
              << supervisor.stats().events_forwarded << " events forwarded\n";

    if (config.unlink_on_exit) {
        for (const std::string& stable_path : {config.event_path, config.js_path}) {
            if (remove_link(stable_path)) {
                std::cout << "Removed " << stable_path << "\n";
            }
        }
    }

    return 0;
}
