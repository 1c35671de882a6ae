#pragma once

#include <string>

// Stable paths handed to consumers and the virtual device nodes they resolve to.
struct StableLinkSet {
    std::string event_link;
    std::string joystick_link;
    std::string event_target;
    std::string joystick_target;  // empty when joydev did not attach
};

struct LinkReport {
    bool event_published = false;
    bool joystick_published = false;

    bool complete() const { return event_published && joystick_published; }
};

// Points stable_path at target. A stale link or file at stable_path is
// replaced through rename(2), so readers never observe a missing path.
// Returns true without touching anything when the link is already correct.
bool publish_link(const std::string& stable_path, const std::string& target,
                  std::string* error = nullptr);

// Publishes both links independently; one failing does not stop the other.
LinkReport publish_links(const StableLinkSet& links);

// Removes stable_path if it is a symlink. Anything else is left alone.
bool remove_link(const std::string& stable_path);
