#include "diagnostics.hpp"
#include "capabilities.hpp"
#include "physical_device.hpp"
#include <fcntl.h>
#include <unistd.h>
#include <limits.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <system_error>

static void report_link(const char* label, const std::string& stable_path) {
    namespace fs = std::filesystem;

    std::cout << "  " << label << ":\n";
    std::cout << "    path: " << stable_path << "\n";

    std::error_code ec;
    fs::file_status status = fs::symlink_status(stable_path, ec);
    if (!fs::exists(status)) {
        std::cout << "    status: NOT_PUBLISHED\n";
        return;
    }
    if (!fs::is_symlink(status)) {
        std::cout << "    status: NOT_A_SYMLINK\n";
        return;
    }

    fs::path target = fs::read_symlink(stable_path, ec);
    std::cout << "    target: " << target.string() << "\n";
    std::cout << "    status: " << (fs::exists(stable_path, ec) ? "RESOLVES" : "DANGLING") << "\n";
}

int diagnostics_mode(const Config& config) {
    std::cout << "=== padmirror diagnostics ===\n\n";

    std::cout << "CONFIGURATION:\n";
    std::cout << "  device_link: " << config.device_link << "\n";
    std::cout << "  event_path: " << config.event_path << "\n";
    std::cout << "  js_path: " << config.js_path << "\n";
    std::cout << "  virtual_name: " << config.virtual_name << "\n";
    std::cout << "  poll_interval_ms: " << config.poll_interval_ms << "\n";
    std::cout << "  device_grab: " << (config.grab ? "enabled" : "disabled") << "\n";

    std::cout << "\nDEVICE DETECTION:\n";
    bool detected = false;

    char real_path[PATH_MAX];
    if (realpath(config.device_link.c_str(), real_path) == nullptr) {
        std::cout << "  status: PATH_RESOLUTION_FAILED (" << strerror(errno) << ")\n";
    } else {
        std::cout << "  resolved_path: " << real_path << "\n";

        PhysicalDevice device(config.device_link);
        if (!device.open_and_init(false)) {
            std::cout << "  status: ACCESS_FAILED (" << device.last_error() << ")\n";
        } else {
            std::cout << "  device_name: " << device.name() << "\n";
            auto caps = device.capabilities();
            if (caps) {
                std::cout << "  status: DETECTED_OK\n";
                std::cout << "\nCAPABILITIES:\n" << describe_capabilities(*caps);
                detected = true;
            } else {
                std::cout << "  status: QUERY_FAILED\n";
            }
        }
    }

    std::cout << "\nSTABLE LINKS:\n";
    report_link("event", config.event_path);
    report_link("joystick", config.js_path);

    std::cout << "\nSYSTEM CHECKS:\n";
    int uinput_check = open("/dev/uinput", O_RDWR | O_NONBLOCK | O_CLOEXEC);
    if (uinput_check >= 0) {
        std::cout << "  uinput_access: OK\n";
        close(uinput_check);
    } else {
        std::cout << "  uinput_access: FAILED (" << strerror(errno) << ")\n";
    }

    if (!detected) {
        std::cout << "\nResult: physical device not available, see DEVICE DETECTION\n";
    }
    return 0;
}

