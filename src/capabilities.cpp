#include "capabilities.hpp"
#include "errors.hpp"
#include <linux/input.h>
#include <linux/input-event-codes.h>
#include <libevdev-1.0/libevdev/libevdev.h>
#include <cstdio>
#include <iostream>
#include <sstream>

bool CapabilityDescriptor::has_type(uint16_t type) const {
    return entries.find(type) != entries.end();
}

bool CapabilityDescriptor::has_code(uint16_t type, uint16_t code) const {
    auto it = entries.find(type);
    if (it == entries.end()) {
        return false;
    }

    if (const auto* codes = std::get_if<PlainCodes>(&it->second)) {
        return codes->count(code) > 0;
    }

    for (const auto& axis : std::get<CalibratedAxes>(it->second)) {
        if (axis.code == code) {
            return true;
        }
    }
    return false;
}

const CalibratedAxis* CapabilityDescriptor::find_axis(uint16_t code) const {
    auto it = entries.find(EV_ABS);
    if (it == entries.end()) {
        return nullptr;
    }

    const auto* axes = std::get_if<CalibratedAxes>(&it->second);
    if (!axes) {
        return nullptr;
    }

    for (const auto& axis : *axes) {
        if (axis.code == code) {
            return &axis;
        }
    }
    return nullptr;
}

size_t CapabilityDescriptor::code_count(uint16_t type) const {
    auto it = entries.find(type);
    if (it == entries.end()) {
        return 0;
    }
    if (const auto* codes = std::get_if<PlainCodes>(&it->second)) {
        return codes->size();
    }
    return std::get<CalibratedAxes>(it->second).size();
}

std::optional<CapabilityDescriptor> extract_capabilities(const struct libevdev* dev) {
    if (!dev) {
        return std::nullopt;
    }

    CapabilityDescriptor caps;
    caps.identity.bustype = static_cast<uint16_t>(libevdev_get_id_bustype(dev));
    caps.identity.vendor = static_cast<uint16_t>(libevdev_get_id_vendor(dev));
    caps.identity.product = static_cast<uint16_t>(libevdev_get_id_product(dev));
    caps.identity.version = static_cast<uint16_t>(libevdev_get_id_version(dev));

    for (unsigned int prop = 0; prop <= INPUT_PROP_MAX; prop++) {
        if (libevdev_has_property(dev, prop)) {
            caps.properties.insert(static_cast<uint16_t>(prop));
        }
    }

    for (unsigned int type = 0; type <= EV_MAX; type++) {
        // Repeats arrive from the physical device already. EV_REP on the
        // virtual device would make the kernel generate a second set.
        if (type == EV_REP) {
            continue;
        }
        if (!libevdev_has_event_type(dev, type)) {
            continue;
        }

        int max_code = libevdev_event_type_get_max(type);
        if (max_code < 0) {
            continue;
        }

        if (type == EV_ABS) {
            CalibratedAxes axes;
            for (int code = 0; code <= max_code; code++) {
                if (!libevdev_has_event_code(dev, EV_ABS, code)) {
                    continue;
                }

                const struct input_absinfo* absinfo = libevdev_get_abs_info(dev, code);
                if (!absinfo) {
                    const char* axis_name = libevdev_event_code_get_name(EV_ABS, code);
                    std::cerr << error_kind_name(ErrorKind::DeviceQuery)
                              << ": no calibration for axis "
                              << (axis_name ? axis_name : "UNKNOWN") << " (" << code << ")\n";
                    return std::nullopt;
                }

                CalibratedAxis axis;
                axis.code = static_cast<uint16_t>(code);
                axis.calibration.minimum = absinfo->minimum;
                axis.calibration.maximum = absinfo->maximum;
                axis.calibration.fuzz = absinfo->fuzz;
                axis.calibration.flat = absinfo->flat;
                axis.calibration.resolution = absinfo->resolution;
                axis.value = absinfo->value;
                axes.push_back(axis);
            }
            caps.entries[EV_ABS] = axes;
            continue;
        }

        PlainCodes codes;
        for (int code = 0; code <= max_code; code++) {
            if (libevdev_has_event_code(dev, type, code)) {
                codes.insert(static_cast<uint16_t>(code));
            }
        }
        caps.entries[static_cast<uint16_t>(type)] = codes;
    }

    return caps;
}

bool validate_descriptor(const CapabilityDescriptor& caps, std::string* problem) {
    auto fail = [problem](const std::string& reason) {
        if (problem) {
            *problem = reason;
        }
        return false;
    };

    for (const auto& [type, entry] : caps.entries) {
        if (type > EV_MAX) {
            return fail("event type " + std::to_string(type) + " out of range");
        }

        if (type != EV_ABS) {
            if (!std::holds_alternative<PlainCodes>(entry)) {
                return fail("calibrated entry for non-axis type " + std::to_string(type));
            }
            continue;
        }

        const auto* axes = std::get_if<CalibratedAxes>(&entry);
        if (!axes) {
            return fail("EV_ABS declared without calibration");
        }

        std::set<uint16_t> seen;
        for (const auto& axis : *axes) {
            if (axis.code > ABS_MAX) {
                return fail("axis code " + std::to_string(axis.code) + " out of range");
            }
            if (!seen.insert(axis.code).second) {
                return fail("axis " + std::to_string(axis.code) + " has more than one calibration");
            }
            if (axis.calibration.minimum > axis.calibration.maximum) {
                return fail("axis " + std::to_string(axis.code) + " has minimum above maximum");
            }
        }
    }

    return true;
}

std::string describe_capabilities(const CapabilityDescriptor& caps) {
    std::ostringstream out;
    char id_buf[64];
    snprintf(id_buf, sizeof(id_buf), "bus=0x%04x vendor=0x%04x product=0x%04x version=0x%04x",
             caps.identity.bustype, caps.identity.vendor,
             caps.identity.product, caps.identity.version);
    out << "  identity: " << id_buf << "\n";

    if (!caps.properties.empty()) {
        out << "  properties:";
        for (uint16_t prop : caps.properties) {
            const char* prop_name = libevdev_property_get_name(prop);
            out << " " << (prop_name ? prop_name : std::to_string(prop).c_str());
        }
        out << "\n";
    }

    for (const auto& [type, entry] : caps.entries) {
        const char* type_name = libevdev_event_type_get_name(type);
        out << "  " << (type_name ? type_name : "UNKNOWN") << " (" << type << "): ";

        if (const auto* codes = std::get_if<PlainCodes>(&entry)) {
            out << codes->size() << " codes\n";
            continue;
        }

        const auto& axes = std::get<CalibratedAxes>(entry);
        out << axes.size() << " axes\n";
        for (const auto& axis : axes) {
            const char* axis_name = libevdev_event_code_get_name(EV_ABS, axis.code);
            out << "    " << (axis_name ? axis_name : "UNKNOWN")
                << " min=" << axis.calibration.minimum
                << " max=" << axis.calibration.maximum
                << " fuzz=" << axis.calibration.fuzz
                << " flat=" << axis.calibration.flat
                << " res=" << axis.calibration.resolution << "\n";
        }
    }

    return out.str();
}
