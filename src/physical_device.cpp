#include "physical_device.hpp"
#include "errors.hpp"
#include <libevdev-1.0/libevdev/libevdev.h>
#include <fcntl.h>
#include <unistd.h>
#include <limits.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>

PhysicalDevice::PhysicalDevice(const std::string& by_id)
    : by_id(by_id), device_fd(-1), dev(nullptr), grabbed(false), syncing(false), resyncs(0) {
}

PhysicalDevice::~PhysicalDevice() {
    close_and_free();
}

bool PhysicalDevice::open_and_init(bool grab_enabled) {
    close_and_free();

    char real_path[PATH_MAX];
    if (realpath(by_id.c_str(), real_path) == nullptr) {
        error = std::string("cannot resolve ") + by_id + ": " + strerror(errno);
        return false;
    }
    resolved = real_path;

    device_fd = open(resolved.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (device_fd < 0) {
        error = std::string("cannot open ") + resolved + ": " + strerror(errno);
        resolved.clear();
        return false;
    }

    // libevdev queries the capability bits and absinfo here
    int rc = libevdev_new_from_fd(device_fd, &dev);
    if (rc < 0) {
        error = std::string(error_kind_name(ErrorKind::DeviceQuery)) + ": " + resolved + ": " + strerror(-rc);
        dev = nullptr;
        close(device_fd);
        device_fd = -1;
        resolved.clear();
        return false;
    }

    if (grab_enabled) {
        if (ioctl(device_fd, EVIOCGRAB, 1) == 0) {
            grabbed = true;
        } else {
            // Not fatal, other readers just keep seeing the physical events
            std::cerr << "Failed to grab " << resolved << ": " << strerror(errno) << "\n";
            grabbed = false;
        }
    }

    error.clear();
    syncing = false;
    return true;
}

void PhysicalDevice::close_and_free() {
    if (grabbed && device_fd >= 0) {
        ioctl(device_fd, EVIOCGRAB, 0);
    }
    if (dev) {
        libevdev_free(dev);
        dev = nullptr;
    }
    if (device_fd >= 0) {
        close(device_fd);
        device_fd = -1;
    }
    grabbed = false;
    syncing = false;
    resolved.clear();
}

ReadStep classify_read(int rc) {
    if (rc == LIBEVDEV_READ_STATUS_SUCCESS) {
        return ReadStep::Event;
    }
    if (rc == LIBEVDEV_READ_STATUS_SYNC) {
        return ReadStep::Resync;
    }
    if (rc == -EAGAIN) {
        return ReadStep::Wait;
    }
    if (rc == -EINTR) {
        return ReadStep::Interrupted;
    }
    return ReadStep::Disconnected;
}

ReadStatus PhysicalDevice::wait_readable() {
    struct pollfd pfd;
    pfd.fd = device_fd;
    pfd.events = POLLIN;
    pfd.revents = 0;

    if (poll(&pfd, 1, -1) < 0) {
        if (errno == EINTR) {
            return ReadStatus::Interrupted;
        }
        error = std::string(error_kind_name(ErrorKind::PhysicalIO)) + ": poll: " + strerror(errno);
        return ReadStatus::Disconnected;
    }
    if (pfd.revents & POLLNVAL) {
        error = std::string(error_kind_name(ErrorKind::PhysicalIO)) + ": descriptor closed";
        return ReadStatus::Disconnected;
    }
    // POLLERR/POLLHUP after an unplug surface as -ENODEV on the next read
    return ReadStatus::Event;
}

ReadStatus PhysicalDevice::read_event(struct input_event& ev) {
    if (!dev) {
        return ReadStatus::Disconnected;
    }

    while (true) {
        if (syncing) {
            // Drain the state deltas libevdev computed after SYN_DROPPED
            int rc = libevdev_next_event(dev, LIBEVDEV_READ_FLAG_SYNC, &ev);
            if (rc == LIBEVDEV_READ_STATUS_SYNC) {
                return ReadStatus::Event;
            }
            syncing = false;
            if (rc != -EAGAIN && rc < 0) {
                error = std::string("resync failed: ") + strerror(-rc);
                return ReadStatus::Disconnected;
            }
            continue;
        }

        int rc = libevdev_next_event(dev, LIBEVDEV_READ_FLAG_NORMAL, &ev);
        switch (classify_read(rc)) {
            case ReadStep::Event:
                return ReadStatus::Event;
            case ReadStep::Resync:
                // ev holds the SYN_DROPPED marker itself, which is not passed on
                std::cerr << "Kernel dropped events on " << resolved << ", resyncing\n";
                resyncs++;
                syncing = true;
                break;
            case ReadStep::Wait: {
                ReadStatus waited = wait_readable();
                if (waited != ReadStatus::Event) {
                    return waited;
                }
                break;
            }
            case ReadStep::Interrupted:
                return ReadStatus::Interrupted;
            case ReadStep::Disconnected:
                error = std::string(error_kind_name(ErrorKind::PhysicalIO)) + ": " + strerror(-rc);
                return ReadStatus::Disconnected;
        }
    }
}

std::optional<CapabilityDescriptor> PhysicalDevice::capabilities() const {
    return extract_capabilities(dev);
}

std::string PhysicalDevice::name() const {
    if (!dev) {
        return std::string();
    }
    const char* device_name = libevdev_get_name(dev);
    return device_name ? device_name : "";
}
