#pragma once

#include "config.hpp"
#include "device_backend.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <signal.h>

enum class SessionState {
    Waiting,
    Connected,
    Forwarding
};

enum class SupervisorExit {
    Shutdown,  // stop flag cleared
    Fatal      // virtual device could not be created
};

struct SupervisorStats {
    unsigned int sessions = 0;
    unsigned int disconnects = 0;
    unsigned int query_failures = 0;
    unsigned int open_attempts = 0;
    unsigned int link_attempts = 0;
    uint64_t events_forwarded = 0;
};

const char* session_state_name(SessionState state);

// Outer reconnection loop. The virtual device and the stable links are set up
// on the first successful connection and then kept for the life of the
// supervisor; every later connection goes straight to forwarding.
class ReconnectionSupervisor {
public:
    ReconnectionSupervisor(const Config& config, DeviceBackend& backend,
                           const volatile sig_atomic_t& running);

    SupervisorExit run();

    SessionState state() const { return current_state; }
    const SupervisorStats& stats() const { return counters; }
    bool virtual_device_created() const { return virtual_output != nullptr; }
    const LinkReport& links() const { return link_report; }
    const std::optional<CapabilityDescriptor>& descriptor() const { return captured; }
    StableLinkSet link_set() const;

private:
    const Config& config;
    DeviceBackend& backend;
    const volatile sig_atomic_t& running;

    SessionState current_state;
    SupervisorStats counters;
    std::unique_ptr<VirtualOutput> virtual_output;
    std::optional<CapabilityDescriptor> captured;
    LinkReport link_report;
    bool links_attempted;

    void enter(SessionState next);
    std::unique_ptr<PhysicalSession> wait_for_device();
    bool create_virtual_once(PhysicalSession& physical, bool& fatal);
    void publish_links_if_needed();
};
