#include "device.hpp"

namespace hearth {
namespace devices {

std::string device_kind_to_string(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::SOCKET:
            return "socket";
        case DeviceKind::THERMOMETER:
            return "thermometer";
        default:
            return "unknown";
    }
}

std::ostream &operator<<(std::ostream &os, const IDevice &device) { return os << device.describe(); }

}  // namespace devices
}  // namespace hearth
