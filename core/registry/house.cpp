#include "house.hpp"

#include <mutex>
#include <sstream>
#include <utility>

#include "logging/logger.hpp"

namespace hearth {
namespace registry {

House::House(std::string name) : name_(std::move(name)) {}

std::vector<std::string> House::rooms() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<std::string> result;
    result.reserve(device_by_room_.size());
    for (const auto &entry : device_by_room_) {
        result.push_back(entry.first);
    }
    return result;
}

bool House::devices(const std::string &room, std::vector<std::string> &names, HouseError &error) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = device_by_room_.find(room);
    if (it == device_by_room_.end()) {
        error = HouseError::no_such_room(room);
        return false;
    }

    names.clear();
    names.reserve(it->second.size());
    for (const auto &entry : it->second) {
        names.push_back(entry.first);
    }
    return true;
}

bool House::add_device_to_room(const DeviceHandle &device, const std::string &room, HouseError &error) {
    if (!device) {
        error = HouseError::invalid_argument(room);
        LOG_WARN("[House] " << name_ << ": " << error.message());
        return false;
    }

    const std::string &device_name = device->name();

    std::unique_lock<std::shared_mutex> lock(mutex_);

    // Validate before touching anything: a missing room counts as empty
    auto room_it = device_by_room_.find(room);
    if (room_it != device_by_room_.end() && room_it->second.count(device_name) > 0) {
        error = HouseError::already_contains_device(device_name);
        LOG_WARN("[House] " << name_ << ": " << error.message() << " (room '" << room << "')");
        return false;
    }

    device_by_room_[room].emplace(device_name, device);
    index_device(device);

    LOG_INFO("[House] " << name_ << ": added " << devices::device_kind_to_string(device->kind()) << " '"
                        << device_name << "' to room '" << room << "'");
    return true;
}

void House::remove_room(const std::string &room) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = device_by_room_.find(room);
    if (it == device_by_room_.end()) {
        LOG_DEBUG("[House] " << name_ << ": remove_room('" << room << "') ignored, no such room");
        return;
    }

    size_t unindexed = 0;
    // One index entry per placement: an instance also placed elsewhere keeps its other entries
    for (const auto &entry : it->second) {
        unindexed += unindex_placement(entry.second.get());
    }
    size_t device_total = it->second.size();
    device_by_room_.erase(it);

    LOG_INFO("[House] " << name_ << ": removed room '" << room << "' (" << device_total << " devices, " << unindexed
                        << " index entries)");
}

void House::remove_device_from_room(const std::string &room, const DeviceHandle &device) {
    if (!device) {
        return;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto room_it = device_by_room_.find(room);
    if (room_it != device_by_room_.end()) {
        if (room_it->second.erase(device->name()) > 0) {
            LOG_INFO("[House] " << name_ << ": removed '" << device->name() << "' from room '" << room << "'");
        }
        if (room_it->second.empty()) {
            LOG_DEBUG("[House] " << name_ << ": room '" << room << "' is empty, dropping it");
            device_by_room_.erase(room_it);
        }
    }

    unindex_device(device.get());
}

void House::poll_all() {
    // Devices update their own atomics, so a shared lock is enough
    std::shared_lock<std::shared_mutex> lock(mutex_);

    size_t polled = 0;
    for (const auto &room : device_by_room_) {
        for (const auto &entry : room.second) {
            entry.second->poll();
            ++polled;
        }
    }

    LOG_DEBUG("[House] " << name_ << ": polled " << polled << " devices in " << device_by_room_.size() << " rooms");
}

std::string House::describe() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::ostringstream out;
    out << "House «" << name_ << "»:\n";
    for (const auto &room : device_by_room_) {
        out << room.first << "\n";
        for (const auto &entry : room.second) {
            out << entry.second->describe();
        }
    }
    return out.str();
}

size_t House::device_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    size_t total = 0;
    for (const auto &room : device_by_room_) {
        total += room.second.size();
    }
    return total;
}

RoomSnapshot House::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    RoomSnapshot result;
    for (const auto &room : device_by_room_) {
        auto &handles = result[room.first];
        handles.reserve(room.second.size());
        for (const auto &entry : room.second) {
            handles.push_back(entry.second);
        }
    }
    return result;
}

std::vector<std::shared_ptr<devices::SocketDevice>> House::sockets() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sockets_.devices();
}

std::vector<std::shared_ptr<devices::ThermometerDevice>> House::thermometers() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return thermometers_.devices();
}

void House::index_device(const DeviceHandle &device) {
    switch (device->kind()) {
        case devices::DeviceKind::SOCKET:
            if (auto socket = std::dynamic_pointer_cast<devices::SocketDevice>(device)) {
                sockets_.add(std::move(socket));
                return;
            }
            break;
        case devices::DeviceKind::THERMOMETER:
            if (auto thermometer = std::dynamic_pointer_cast<devices::ThermometerDevice>(device)) {
                thermometers_.add(std::move(thermometer));
                return;
            }
            break;
    }

    LOG_WARN("[House] " << name_ << ": '" << device->name() << "' reports kind "
                        << devices::device_kind_to_string(device->kind()) << " but has no matching index");
}

size_t House::unindex_device(const devices::IDevice *device) {
    return sockets_.remove(device) + thermometers_.remove(device);
}

size_t House::unindex_placement(const devices::IDevice *device) {
    if (sockets_.remove_one(device) > 0) {
        return 1;
    }
    return thermometers_.remove_one(device);
}

std::ostream &operator<<(std::ostream &os, const House &house) { return os << house.describe(); }

}  // namespace registry
}  // namespace hearth
