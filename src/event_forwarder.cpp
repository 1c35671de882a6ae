#include "event_forwarder.hpp"
#include <libevdev-1.0/libevdev/libevdev.h>
#include <iostream>

static void log_event(const struct input_event& ev) {
    const char* type_name = libevdev_event_type_get_name(ev.type);
    const char* code_name = libevdev_event_code_get_name(ev.type, ev.code);
    std::cout << "event " << (type_name ? type_name : "UNKNOWN")
              << " " << (code_name ? code_name : "UNKNOWN")
              << " (type=" << ev.type << ", code=" << ev.code
              << ", value=" << ev.value << ")\n";
}

ForwardResult forward_events(EventSource& source, EventSink& sink,
                             const volatile sig_atomic_t& running,
                             const ForwardOptions& options) {
    ForwardResult result{ForwardOutcome::Disconnected, 0, 0};
    struct input_event ev;

    while (running) {
        ReadStatus status = source.read_event(ev);

        if (status == ReadStatus::Disconnected) {
            result.outcome = ForwardOutcome::Disconnected;
            return result;
        }

        if (status == ReadStatus::Interrupted) {
            if (!running) {
                result.outcome = ForwardOutcome::Shutdown;
                return result;
            }
            continue;
        }

        if (options.verbose) {
            log_event(ev);
        }

        if (!sink.write_event(ev)) {
            // Only the first failure of a session is reported
            if (result.write_failures++ == 0) {
                std::cerr << "Failed to write event to virtual device (type=" << ev.type
                          << ", code=" << ev.code << ")\n";
            }
            continue;
        }
        result.events_forwarded++;
    }

    result.outcome = ForwardOutcome::Shutdown;
    return result;
}
