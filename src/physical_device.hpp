#ifndef PHYSICAL_DEVICE_HPP
#define PHYSICAL_DEVICE_HPP

#include "device_backend.hpp"
#include <string>
#include <linux/input.h>

struct libevdev;

// What a libevdev_next_event return code means for the read loop
enum class ReadStep {
    Event,         // an event was delivered
    Resync,        // SYN_DROPPED, drain the sync queue
    Wait,          // nothing queued, poll the fd
    Interrupted,   // a signal arrived
    Disconnected   // any other error, the device is gone
};

ReadStep classify_read(int rc);

// One open evdev connection to the physical controller. The fd is
// non-blocking; read_event waits in poll() so libevdev can drain the kernel
// queue during a resync without stalling.
class PhysicalDevice : public PhysicalSession {
public:
    explicit PhysicalDevice(const std::string& by_id);
    ~PhysicalDevice() override;

    PhysicalDevice(const PhysicalDevice&) = delete;
    PhysicalDevice& operator=(const PhysicalDevice&) = delete;

    // Resolves the discovery path, opens it and reads the device description.
    // On failure the reason is left in last_error() and nothing stays open.
    bool open_and_init(bool grab_enabled);
    void close_and_free();

    bool is_open() const { return dev != nullptr; }
    bool is_grabbed() const { return grabbed; }
    const std::string& resolved_path() const { return resolved; }
    int fd() const { return device_fd; }
    const struct libevdev* evdev() const { return dev; }
    unsigned int resync_count() const { return resyncs; }

    ReadStatus read_event(struct input_event& ev) override;
    std::optional<CapabilityDescriptor> capabilities() const override;
    std::string name() const override;
    std::string last_error() const override { return error; }

private:
    std::string by_id;
    std::string resolved;
    std::string error;
    int device_fd;
    struct libevdev* dev;
    bool grabbed;
    bool syncing;
    unsigned int resyncs;

    ReadStatus wait_readable();
};

#endif // PHYSICAL_DEVICE_HPP
