// capbridge: host capability bridge for embedded web content.
// Entry point: builds the platform adapter and permission gate, then serves
// one content surface over the configured transport.
//
// stdout carries the stdio transport; logs go to stderr.

#include <atomic>
#include <csignal>
#include <memory>
#include <iostream>
#include <string>
#include <vector>

#include "bridge/permission_gate.hpp"
#include "host/cdp/cdp_renderer.hpp"
#include "host/host_stdio.hpp"
#include "platform/linux/linux_platform_adapter.hpp"
#include "utils/bridge_config.hpp"
#include "utils/log_sink.hpp"

// Global flag for graceful shutdown.
static std::atomic<bool> shutdown_requested{false};

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = true;
}

int main(int argc, char **argv) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    // Helper tools may exit before reading their stdin.
    std::signal(SIGPIPE, SIG_IGN);

    bridge_config::BridgeConfig config = bridge_config::load_from_environment();
    bridge_config::apply_command_line(config, std::vector<std::string>(argv + 1, argv + argc));

    log_sink::info(std::string("capbridge starting, build ") + __DATE__ + " " + __TIME__ + ", transport " +
                   (config.transport == bridge_config::Transport::Cdp ? "cdp" : "stdio"));

    auto adapter = std::make_shared<platform::LinuxPlatformAdapter>(platform::adapter_options_from_config(config));
    auto gate = std::make_shared<permission_gate::PermissionGate>(adapter);

    int exit_code = 0;
    if (config.transport == bridge_config::Transport::Cdp) {
        exit_code = cdp_renderer::run(config, adapter, gate, shutdown_requested);
    } else {
        exit_code = host_stdio::run(config, adapter, gate, std::cin, std::cout, shutdown_requested);
    }

    log_sink::info("capbridge shut down.");
    return exit_code;
}
