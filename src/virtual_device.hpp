#ifndef VIRTUAL_DEVICE_HPP
#define VIRTUAL_DEVICE_HPP

#include "device_backend.hpp"
#include <memory>
#include <string>
#include <linux/input.h>

struct libevdev;
struct libevdev_uinput;

using EvdevPtr = std::unique_ptr<struct libevdev, void (*)(struct libevdev*)>;

// Builds an in-memory libevdev description of caps, named `name`. Every
// input_absinfo field is taken from the descriptor unchanged. Returns a null
// pointer when the descriptor cannot be expressed.
EvdevPtr build_template(const CapabilityDescriptor& caps, const std::string& name);

class VirtualDevice : public VirtualOutput {
public:
    explicit VirtualDevice(const std::string& device_name);
    ~VirtualDevice() override;

    VirtualDevice(const VirtualDevice&) = delete;
    VirtualDevice& operator=(const VirtualDevice&) = delete;

    bool initialize(const CapabilityDescriptor& caps);
    void cleanup();

    bool is_ready() const { return uidev != nullptr; }

    bool write_event(const struct input_event& ev) override;
    VirtualNodePaths node_paths() const override { return paths; }

private:
    std::string device_name;
    EvdevPtr dev;
    struct libevdev_uinput* uidev;
    VirtualNodePaths paths;

    void resolve_node_paths();
};

#endif // VIRTUAL_DEVICE_HPP
