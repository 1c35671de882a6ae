#pragma once

// Failure kinds reported by the mirror. Only VirtualDeviceCreation ends the process.
enum class ErrorKind {
    DeviceQuery,
    VirtualDeviceCreation,
    PhysicalIO,
    SymlinkPublish
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DeviceQuery: return "DeviceQueryError";
        case ErrorKind::VirtualDeviceCreation: return "VirtualDeviceCreationError";
        case ErrorKind::PhysicalIO: return "PhysicalIOError";
        case ErrorKind::SymlinkPublish: return "SymlinkPublishError";
    }
    return "UnknownError";
}
