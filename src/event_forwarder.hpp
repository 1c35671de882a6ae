#ifndef EVENT_FORWARDER_HPP
#define EVENT_FORWARDER_HPP

#include <cstdint>
#include <signal.h>
#include <linux/input.h>

enum class ReadStatus {
    Event,         // ev holds the next event
    Disconnected,  // read failed, the physical device is gone
    Interrupted    // a signal arrived while waiting for input
};

class EventSource {
public:
    virtual ~EventSource() = default;

    // Waits until an event is available or the read fails.
    virtual ReadStatus read_event(struct input_event& ev) = 0;
};

class EventSink {
public:
    virtual ~EventSink() = default;
    virtual bool write_event(const struct input_event& ev) = 0;
};

enum class ForwardOutcome {
    Disconnected,
    Shutdown
};

struct ForwardOptions {
    bool verbose = false;
};

struct ForwardResult {
    ForwardOutcome outcome;
    uint64_t events_forwarded;
    uint64_t write_failures;
};

// Pumps events from source to sink in read order, SYN_REPORT markers included,
// until the source reports a read failure or `running` is cleared. The flag
// is checked before every read; an interrupted read with the flag still set
// is retried.
ForwardResult forward_events(EventSource& source, EventSink& sink,
                             const volatile sig_atomic_t& running,
                             const ForwardOptions& options = ForwardOptions());

#endif // EVENT_FORWARDER_HPP
