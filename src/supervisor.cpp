#include "supervisor.hpp"
#include "errors.hpp"
#include <chrono>
#include <iostream>
#include <utility>

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Waiting: return "Waiting";
        case SessionState::Connected: return "Connected";
        case SessionState::Forwarding: return "Forwarding";
    }
    return "Unknown";
}

ReconnectionSupervisor::ReconnectionSupervisor(const Config& config, DeviceBackend& backend,
                                               const volatile sig_atomic_t& running)
    : config(config), backend(backend), running(running),
      current_state(SessionState::Waiting), links_attempted(false) {
}

void ReconnectionSupervisor::enter(SessionState next) {
    if (config.verbose && next != current_state) {
        std::cout << "state " << session_state_name(current_state)
                  << " -> " << session_state_name(next) << "\n";
    }
    current_state = next;
}

StableLinkSet ReconnectionSupervisor::link_set() const {
    StableLinkSet links;
    links.event_link = config.event_path;
    links.joystick_link = config.js_path;
    if (virtual_output) {
        VirtualNodePaths paths = virtual_output->node_paths();
        links.event_target = paths.event_node;
        links.joystick_target = paths.joystick_node;
    }
    return links;
}

std::unique_ptr<PhysicalSession> ReconnectionSupervisor::wait_for_device() {
    enter(SessionState::Waiting);
    std::cout << "Waiting for " << config.device_link << "\n";

    const auto interval = std::chrono::milliseconds(config.poll_interval_ms);
    while (running) {
        counters.open_attempts++;
        auto physical = backend.open_physical(config.device_link, config.grab);
        if (physical) {
            return physical;
        }
        backend.sleep_for(interval);
    }
    return nullptr;
}

bool ReconnectionSupervisor::create_virtual_once(PhysicalSession& physical, bool& fatal) {
    fatal = false;

    auto caps = physical.capabilities();
    if (!caps) {
        counters.query_failures++;
        std::cerr << error_kind_name(ErrorKind::DeviceQuery) << ": cannot read capabilities of "
                  << config.device_link << ", treating as disconnect\n";
        return false;
    }

    std::cout << "Captured capabilities of " << physical.name() << ":\n"
              << describe_capabilities(*caps);

    virtual_output = backend.create_virtual(*caps, config.virtual_name);
    if (!virtual_output) {
        std::cerr << error_kind_name(ErrorKind::VirtualDeviceCreation)
                  << ": giving up, no virtual device to publish\n";
        fatal = true;
        return false;
    }
    captured = std::move(caps);

    VirtualNodePaths paths = virtual_output->node_paths();
    std::cout << "Created virtual device " << config.virtual_name << ": "
              << (paths.event_node.empty() ? "<no event node>" : paths.event_node);
    if (!paths.joystick_node.empty()) {
        std::cout << ", " << paths.joystick_node;
    }
    std::cout << "\n";
    return true;
}

void ReconnectionSupervisor::publish_links_if_needed() {
    if (link_report.complete()) {
        return;
    }

    if (links_attempted) {
        std::cout << "Retrying stable link publication\n";
    }
    links_attempted = true;
    counters.link_attempts++;

    LinkReport report = backend.publish_links(link_set());
    link_report.event_published = link_report.event_published || report.event_published;
    link_report.joystick_published = link_report.joystick_published || report.joystick_published;

    if (!link_report.complete()) {
        std::cerr << "WARNING: stable links incomplete, continuing with a degraded set\n";
    }
}

SupervisorExit ReconnectionSupervisor::run() {
    const auto interval = std::chrono::milliseconds(config.poll_interval_ms);

    while (running) {
        auto physical = wait_for_device();
        if (!physical) {
            break;
        }

        enter(SessionState::Connected);
        counters.sessions++;
        std::cout << "Connected to " << physical->name() << "\n";

        if (!virtual_output) {
            bool fatal = false;
            if (!create_virtual_once(*physical, fatal)) {
                if (fatal) {
                    return SupervisorExit::Fatal;
                }
                physical.reset();
                enter(SessionState::Waiting);
                backend.sleep_for(interval);
                continue;
            }
        }

        publish_links_if_needed();

        enter(SessionState::Forwarding);
        std::cout << "Forwarding events...\n";

        ForwardOptions options;
        options.verbose = config.verbose;
        ForwardResult result = forward_events(*physical, *virtual_output, running, options);
        counters.events_forwarded += result.events_forwarded;

        std::string reason = physical->last_error();
        physical.reset();

        if (result.outcome == ForwardOutcome::Shutdown) {
            break;
        }

        counters.disconnects++;
        std::cout << "Disconnected after " << result.events_forwarded << " events";
        if (!reason.empty()) {
            std::cout << " (" << reason << ")";
        }
        std::cout << ", waiting...\n";
    }

    enter(SessionState::Waiting);
    return SupervisorExit::Shutdown;
}
