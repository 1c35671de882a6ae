#pragma once

#include "capabilities.hpp"
#include "event_forwarder.hpp"
#include "link_publisher.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

struct VirtualNodePaths {
    std::string event_node;     // /dev/input/eventN
    std::string joystick_node;  // /dev/input/jsN, empty if joydev did not attach
    std::string syspath;
};

// An open connection to the physical device for one reconnection session.
class PhysicalSession : public EventSource {
public:
    virtual std::optional<CapabilityDescriptor> capabilities() const = 0;
    virtual std::string name() const = 0;
    virtual std::string last_error() const = 0;
};

// The virtual device, alive for the whole process.
class VirtualOutput : public EventSink {
public:
    virtual VirtualNodePaths node_paths() const = 0;
};

// Operating system services the supervisor drives.
class DeviceBackend {
public:
    virtual ~DeviceBackend() = default;

    // Returns nullptr while the device is absent or cannot be opened.
    virtual std::unique_ptr<PhysicalSession> open_physical(const std::string& path, bool grab) = 0;

    // Returns nullptr when the kernel rejects the device.
    virtual std::unique_ptr<VirtualOutput> create_virtual(const CapabilityDescriptor& caps,
                                                          const std::string& name) = 0;

    virtual LinkReport publish_links(const StableLinkSet& links) = 0;

    virtual void sleep_for(std::chrono::milliseconds interval) = 0;
};
