#ifndef HEARTH_REGISTRY_DEVICE_INDEX_HPP
#define HEARTH_REGISTRY_DEVICE_INDEX_HPP

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <memory>
#include <vector>

#include "devices/device.hpp"

namespace hearth {
namespace registry {

// Flat list of every device of one kind, independent of room placement.
// Not thread-safe: House guards it with its own lock.
template <typename T>
class DeviceIndex {
public:
    void add(std::shared_ptr<T> device) { devices_.push_back(std::move(device)); }

    // Drops every handle that points at `device`. Name collisions are ignored.
    size_t remove(const devices::IDevice *device) {
        auto new_end = std::remove_if(devices_.begin(), devices_.end(), [device](const std::shared_ptr<T> &entry) {
            return static_cast<const devices::IDevice *>(entry.get()) == device;
        });
        size_t removed = static_cast<size_t>(std::distance(new_end, devices_.end()));
        devices_.erase(new_end, devices_.end());
        return removed;
    }

    // Drops a single handle that points at `device` (one placement)
    size_t remove_one(const devices::IDevice *device) {
        auto it = std::find_if(devices_.begin(), devices_.end(), [device](const std::shared_ptr<T> &entry) {
            return static_cast<const devices::IDevice *>(entry.get()) == device;
        });
        if (it == devices_.end()) {
            return 0;
        }
        devices_.erase(it);
        return 1;
    }

    size_t count(const devices::IDevice *device) const {
        return static_cast<size_t>(
            std::count_if(devices_.begin(), devices_.end(), [device](const std::shared_ptr<T> &entry) {
                return static_cast<const devices::IDevice *>(entry.get()) == device;
            }));
    }

    bool contains(const devices::IDevice *device) const {
        return std::any_of(devices_.begin(), devices_.end(), [device](const std::shared_ptr<T> &entry) {
            return static_cast<const devices::IDevice *>(entry.get()) == device;
        });
    }

    std::vector<std::shared_ptr<T>> devices() const { return devices_; }
    size_t size() const { return devices_.size(); }
    bool empty() const { return devices_.empty(); }

private:
    std::vector<std::shared_ptr<T>> devices_;
};

}  // namespace registry
}  // namespace hearth

#endif  // HEARTH_REGISTRY_DEVICE_INDEX_HPP
