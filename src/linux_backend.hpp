#pragma once

#include "device_backend.hpp"
#include <string>

// evdev, uinput and the filesystem.
class LinuxBackend : public DeviceBackend {
public:
    std::unique_ptr<PhysicalSession> open_physical(const std::string& path, bool grab) override;
    std::unique_ptr<VirtualOutput> create_virtual(const CapabilityDescriptor& caps,
                                                  const std::string& name) override;
    LinkReport publish_links(const StableLinkSet& links) override;
    void sleep_for(std::chrono::milliseconds interval) override;

private:
    std::string last_open_error;
};
