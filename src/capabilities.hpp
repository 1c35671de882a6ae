#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

struct libevdev;

// Calibration of one absolute axis, as reported by EVIOCGABS.
struct AxisCalibration {
    int32_t minimum = 0;
    int32_t maximum = 0;
    int32_t fuzz = 0;
    int32_t flat = 0;
    int32_t resolution = 0;

    bool operator==(const AxisCalibration& other) const {
        return minimum == other.minimum && maximum == other.maximum &&
               fuzz == other.fuzz && flat == other.flat &&
               resolution == other.resolution;
    }
    bool operator!=(const AxisCalibration& other) const { return !(*this == other); }
};

struct CalibratedAxis {
    uint16_t code = 0;
    AxisCalibration calibration;
    int32_t value = 0;  // state at capture time, seeds the virtual axis

    // The captured value is state, not capability
    bool operator==(const CalibratedAxis& other) const {
        return code == other.code && calibration == other.calibration;
    }
    bool operator!=(const CalibratedAxis& other) const { return !(*this == other); }
};

using PlainCodes = std::set<uint16_t>;
using CalibratedAxes = std::vector<CalibratedAxis>;

// One entry per event type: plain codes for everything except EV_ABS,
// which always carries calibration.
using CapabilityEntry = std::variant<PlainCodes, CalibratedAxes>;

struct DeviceIdentity {
    uint16_t bustype = 0;
    uint16_t vendor = 0;
    uint16_t product = 0;
    uint16_t version = 0;

    bool operator==(const DeviceIdentity& other) const {
        return bustype == other.bustype && vendor == other.vendor &&
               product == other.product && version == other.version;
    }
    bool operator!=(const DeviceIdentity& other) const { return !(*this == other); }
};

struct CapabilityDescriptor {
    DeviceIdentity identity;
    std::map<uint16_t, CapabilityEntry> entries;  // event type -> codes
    std::set<uint16_t> properties;                // INPUT_PROP_*

    bool has_type(uint16_t type) const;
    bool has_code(uint16_t type, uint16_t code) const;
    const CalibratedAxis* find_axis(uint16_t code) const;
    size_t code_count(uint16_t type) const;

    bool operator==(const CapabilityDescriptor& other) const {
        return identity == other.identity && entries == other.entries &&
               properties == other.properties;
    }
    bool operator!=(const CapabilityDescriptor& other) const { return !(*this == other); }
};

// Captures everything the device declares. Returns nullopt when an advertised
// axis has no calibration record; the caller treats that as a disconnect.
std::optional<CapabilityDescriptor> extract_capabilities(const struct libevdev* dev);

// Checks the axis invariant: EV_ABS is calibrated, every axis appears once and
// has minimum <= maximum. On failure the reason is stored in `problem`.
bool validate_descriptor(const CapabilityDescriptor& caps, std::string* problem = nullptr);

std::string describe_capabilities(const CapabilityDescriptor& caps);
