#ifndef HEARTH_DEVICES_DEVICE_HPP
#define HEARTH_DEVICES_DEVICE_HPP

#include <ostream>
#include <string>

namespace hearth {
namespace devices {

// Closed set of device variants. House uses it to route a device to its index.
enum class DeviceKind { SOCKET, THERMOMETER };

std::string device_kind_to_string(DeviceKind kind);

// Device contract
/**
 * A device has an immutable name (its identity inside a room) and a mutable
 * reading that is sampled on construction and replaced on every poll().
 *
 * Handles are shared between the room index and the per-kind device index,
 * so poll() mutates in place and is visible to every holder.
 */
class IDevice {
public:
    virtual ~IDevice() = default;

    virtual const std::string &name() const = 0;
    virtual DeviceKind kind() const = 0;

    // Resample the reading from the device's domain
    virtual void poll() = 0;

    // Multi-line human readable snapshot
    virtual std::string describe() const = 0;
};

std::ostream &operator<<(std::ostream &os, const IDevice &device);

}  // namespace devices
}  // namespace hearth

#endif  // HEARTH_DEVICES_DEVICE_HPP
