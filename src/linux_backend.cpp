#include "linux_backend.hpp"
#include "physical_device.hpp"
#include "virtual_device.hpp"
#include <iostream>
#include <thread>
#include <unistd.h>

std::unique_ptr<PhysicalSession> LinuxBackend::open_physical(const std::string& path, bool grab) {
    auto device = std::make_unique<PhysicalDevice>(path);

    if (!device->open_and_init(grab)) {
        // A missing path is the normal waiting case and stays quiet. Other
        // failures are reported once until the reason changes.
        const std::string& reason = device->last_error();
        if (access(path.c_str(), F_OK) == 0 && reason != last_open_error) {
            std::cerr << "Could not open real device: " << reason << "\n";
        }
        last_open_error = reason;
        return nullptr;
    }

    last_open_error.clear();
    std::cout << "Opened " << device->resolved_path()
              << (device->is_grabbed() ? " (grabbed)" : "") << "\n";
    return device;
}

std::unique_ptr<VirtualOutput> LinuxBackend::create_virtual(const CapabilityDescriptor& caps,
                                                            const std::string& name) {
    auto device = std::make_unique<VirtualDevice>(name);
    if (!device->initialize(caps)) {
        return nullptr;
    }
    return device;
}

LinkReport LinuxBackend::publish_links(const StableLinkSet& links) {
    return ::publish_links(links);
}

void LinuxBackend::sleep_for(std::chrono::milliseconds interval) {
    std::this_thread::sleep_for(interval);
}
