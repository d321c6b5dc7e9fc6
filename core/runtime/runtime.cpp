#include "runtime.hpp"

#include <utility>

#include "devices/socket_device.hpp"
#include "devices/thermometer_device.hpp"
#include "logging/logger.hpp"

namespace hearth {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

bool Runtime::initialize(std::string &error) {
    if (!validate_config(config_, error)) {
        return false;
    }

    if (!entropy_) {
        entropy_ = std::make_shared<devices::RandomEntropySource>(config_.sampling.seed);
    }

    auto house = std::make_unique<registry::House>(config_.house.name);

    for (const auto &room : config_.rooms) {
        for (const auto &device_config : room.devices) {
            auto device = make_device(device_config);
            if (!device) {
                error = "Unsupported device type '" + device_config.type + "'";
                return false;
            }

            registry::HouseError house_error;
            if (!house->add_device_to_room(device, room.name, house_error)) {
                error = "Room '" + room.name + "': " + house_error.message();
                LOG_ERROR("[Runtime] " << error);
                return false;
            }
        }
    }

    house_ = std::move(house);
    LOG_INFO("[Runtime] House '" << house_->name() << "' ready: " << house_->rooms().size() << " rooms, "
                                 << house_->device_count() << " devices");
    return true;
}

void Runtime::run() {
    if (!house_) {
        LOG_WARN("[Runtime] run() called before initialize(); nothing to poll");
        return;
    }

    for (int cycle = 0; cycle < config_.polling.cycles; ++cycle) {
        house_->poll_all();
        LOG_DEBUG("[Runtime] Poll cycle " << (cycle + 1) << "/" << config_.polling.cycles << " complete");
    }
}

std::shared_ptr<devices::IDevice> Runtime::make_device(const DeviceConfig &device) const {
    if (device.type == "socket") {
        return std::make_shared<devices::SocketDevice>(device.name, entropy_);
    }
    if (device.type == "thermometer") {
        return std::make_shared<devices::ThermometerDevice>(device.name, entropy_);
    }
    return nullptr;
}

}  // namespace runtime
}  // namespace hearth
