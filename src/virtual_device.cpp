#include "virtual_device.hpp"
#include "errors.hpp"
#include <libevdev-1.0/libevdev/libevdev.h>
#include <libevdev-1.0/libevdev/libevdev-uinput.h>
#include <linux/input-event-codes.h>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

static void log_skipped_force_feedback(const CapabilityEntry& entry) {
    std::cerr << "WARNING: not mirroring force feedback:";
    if (const auto* codes = std::get_if<PlainCodes>(&entry)) {
        for (uint16_t code : *codes) {
            const char* code_name = libevdev_event_code_get_name(EV_FF, code);
            std::cerr << " " << (code_name ? code_name : std::to_string(code));
        }
    }
    std::cerr << "\n";
}

EvdevPtr build_template(const CapabilityDescriptor& caps, const std::string& name) {
    EvdevPtr dev(libevdev_new(), libevdev_free);
    if (!dev) {
        return dev;
    }

    libevdev_set_name(dev.get(), name.c_str());
    libevdev_set_id_bustype(dev.get(), caps.identity.bustype);
    libevdev_set_id_vendor(dev.get(), caps.identity.vendor);
    libevdev_set_id_product(dev.get(), caps.identity.product);
    libevdev_set_id_version(dev.get(), caps.identity.version);

    for (uint16_t prop : caps.properties) {
        if (libevdev_enable_property(dev.get(), prop) < 0) {
            std::cerr << "Failed to enable input property " << prop << "\n";
            return EvdevPtr(nullptr, libevdev_free);
        }
    }

    for (const auto& [type, entry] : caps.entries) {
        // Effect uploads to the virtual device are never serviced
        if (type == EV_FF) {
            log_skipped_force_feedback(entry);
            continue;
        }

        if (libevdev_enable_event_type(dev.get(), type) < 0) {
            std::cerr << "Failed to enable event type " << type << "\n";
            return EvdevPtr(nullptr, libevdev_free);
        }

        if (const auto* codes = std::get_if<PlainCodes>(&entry)) {
            for (uint16_t code : *codes) {
                if (libevdev_enable_event_code(dev.get(), type, code, nullptr) < 0) {
                    const char* code_name = libevdev_event_code_get_name(type, code);
                    std::cerr << "Failed to enable " << (code_name ? code_name : "UNKNOWN")
                              << " (type=" << type << ", code=" << code << ")\n";
                    return EvdevPtr(nullptr, libevdev_free);
                }
            }
            continue;
        }

        for (const auto& axis : std::get<CalibratedAxes>(entry)) {
            struct input_absinfo absinfo;
            memset(&absinfo, 0, sizeof(absinfo));
            absinfo.value = axis.value;
            absinfo.minimum = axis.calibration.minimum;
            absinfo.maximum = axis.calibration.maximum;
            absinfo.fuzz = axis.calibration.fuzz;
            absinfo.flat = axis.calibration.flat;
            absinfo.resolution = axis.calibration.resolution;

            if (libevdev_enable_event_code(dev.get(), EV_ABS, axis.code, &absinfo) < 0) {
                const char* axis_name = libevdev_event_code_get_name(EV_ABS, axis.code);
                std::cerr << "Failed to enable axis " << (axis_name ? axis_name : "UNKNOWN")
                          << " (" << axis.code << ")\n";
                return EvdevPtr(nullptr, libevdev_free);
            }
        }
    }

    return dev;
}

VirtualDevice::VirtualDevice(const std::string& device_name)
    : device_name(device_name), dev(nullptr, libevdev_free), uidev(nullptr) {
}

VirtualDevice::~VirtualDevice() {
    cleanup();
}

bool VirtualDevice::initialize(const CapabilityDescriptor& caps) {
    if (uidev) {
        return true;
    }

    std::string problem;
    if (!validate_descriptor(caps, &problem)) {
        std::cerr << error_kind_name(ErrorKind::VirtualDeviceCreation)
                  << ": malformed capabilities: " << problem << "\n";
        return false;
    }

    dev = build_template(caps, device_name);
    if (!dev) {
        std::cerr << error_kind_name(ErrorKind::VirtualDeviceCreation)
                  << ": cannot describe " << device_name << "\n";
        return false;
    }

    int rc = libevdev_uinput_create_from_device(dev.get(), LIBEVDEV_UINPUT_OPEN_MANAGED, &uidev);
    if (rc < 0) {
        std::cerr << error_kind_name(ErrorKind::VirtualDeviceCreation)
                  << ": cannot create " << device_name << ": " << strerror(-rc) << "\n";
        uidev = nullptr;
        dev.reset();
        return false;
    }

    resolve_node_paths();
    return true;
}

void VirtualDevice::cleanup() {
    if (uidev) {
        libevdev_uinput_destroy(uidev);
        uidev = nullptr;
    }
    dev.reset();
    paths = VirtualNodePaths();
}

bool VirtualDevice::write_event(const struct input_event& ev) {
    if (!uidev) {
        return false;
    }
    return libevdev_uinput_write_event(uidev, ev.type, ev.code, ev.value) == 0;
}

void VirtualDevice::resolve_node_paths() {
    const char* devnode = libevdev_uinput_get_devnode(uidev);
    if (devnode) {
        paths.event_node = devnode;
    }

    const char* syspath = libevdev_uinput_get_syspath(uidev);
    if (!syspath) {
        return;
    }
    paths.syspath = syspath;

    // Handlers attached to the input device show up as eventN / jsN children
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(paths.syspath, ec)) {
        std::string child = entry.path().filename().string();
        if (child.rfind("js", 0) == 0) {
            paths.joystick_node = "/dev/input/" + child;
        } else if (child.rfind("event", 0) == 0 && paths.event_node.empty()) {
            paths.event_node = "/dev/input/" + child;
        }
    }
}
