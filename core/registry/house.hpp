#ifndef HEARTH_REGISTRY_HOUSE_HPP
#define HEARTH_REGISTRY_HOUSE_HPP

#include <map>
#include <memory>
#include <ostream>
#include <shared_mutex>
#include <string>
#include <vector>

#include "devices/device.hpp"
#include "devices/socket_device.hpp"
#include "devices/thermometer_device.hpp"
#include "registry/device_index.hpp"
#include "registry/house_error.hpp"

namespace hearth {
namespace registry {

using DeviceHandle = std::shared_ptr<devices::IDevice>;

// Room name -> devices in that room, ordered by device name
using RoomSnapshot = std::map<std::string, std::vector<DeviceHandle>>;

// House - registry of devices grouped by room
/**
 * Invariants:
 * - Device names are unique within a room
 * - A room exists only while it holds at least one device; removing the last
 *   device erases the room
 * - The index for a kind holds one handle per placement (an instance added to
 *   two rooms is listed twice). remove_room drops one handle per device in the
 *   room; remove_device_from_room drops every handle of that instance.
 *   Matching is by identity, never by name
 *
 * Thread Safety:
 * - Read methods take a shared_lock, mutators a unique_lock
 * - Queries return copies so callers never hold references into the maps
 */
class House {
public:
    explicit House(std::string name);

    const std::string &name() const { return name_; }

    // Names of rooms holding at least one device, sorted
    std::vector<std::string> rooms() const;

    // Device names in `room`, sorted. Fails with NO_SUCH_ROOM.
    bool devices(const std::string &room, std::vector<std::string> &names, HouseError &error) const;

    // Fails with ALREADY_CONTAINS_DEVICE and leaves the house untouched when
    // `room` already holds a device with the same name, INVALID_ARGUMENT for a null device.
    bool add_device_to_room(const DeviceHandle &device, const std::string &room, HouseError &error);

    // No-op for unknown rooms
    void remove_room(const std::string &room);

    // Drops the room entry named after `device` and every index handle that
    // is `device`. No-op when nothing matches.
    void remove_device_from_room(const std::string &room, const DeviceHandle &device);

    void poll_all();

    std::string describe() const;

    size_t device_count() const;
    RoomSnapshot snapshot() const;

    // Copies of the per-kind indices
    std::vector<std::shared_ptr<devices::SocketDevice>> sockets() const;
    std::vector<std::shared_ptr<devices::ThermometerDevice>> thermometers() const;

private:
    const std::string name_;
    std::map<std::string, std::map<std::string, DeviceHandle>> device_by_room_;

    DeviceIndex<devices::SocketDevice> sockets_;
    DeviceIndex<devices::ThermometerDevice> thermometers_;

    mutable std::shared_mutex mutex_;

    // Index helpers (called under unique_lock)
    void index_device(const DeviceHandle &device);
    size_t unindex_device(const devices::IDevice *device);
    size_t unindex_placement(const devices::IDevice *device);
};

std::ostream &operator<<(std::ostream &os, const House &house);

}  // namespace registry
}  // namespace hearth

#endif  // HEARTH_REGISTRY_HOUSE_HPP
