#include "json.hpp"

#include "devices/socket_device.hpp"
#include "devices/thermometer_device.hpp"

namespace hearth {
namespace render {

namespace {

nlohmann::json encode_reading(const std::string &signal, double value, const std::string &unit) {
    return {{"signal", signal}, {"value", value}, {"unit", unit}};
}

}  // namespace

nlohmann::json encode_device(const devices::IDevice &device) {
    nlohmann::json j;
    j["name"] = device.name();
    j["type"] = devices::device_kind_to_string(device.kind());

    switch (device.kind()) {
        case devices::DeviceKind::SOCKET:
            if (auto *socket = dynamic_cast<const devices::SocketDevice *>(&device)) {
                j["reading"] = encode_reading("voltage", socket->voltage(), "V");
            }
            break;
        case devices::DeviceKind::THERMOMETER:
            if (auto *thermometer = dynamic_cast<const devices::ThermometerDevice *>(&device)) {
                j["reading"] = encode_reading("temperature", thermometer->temperature(), "C");
            }
            break;
    }

    if (!j.contains("reading")) {
        j["reading"] = nullptr;
    }
    return j;
}

nlohmann::json encode_house(const registry::House &house) {
    nlohmann::json rooms = nlohmann::json::array();
    for (const auto &room : house.snapshot()) {
        nlohmann::json room_devices = nlohmann::json::array();
        for (const auto &device : room.second) {
            room_devices.push_back(encode_device(*device));
        }
        rooms.push_back(nlohmann::json{{"name", room.first}, {"devices", room_devices}});
    }

    return {{"name", house.name()}, {"rooms", rooms}};
}

nlohmann::json encode_error(const registry::HouseError &error) {
    return {{"code", registry::error_code_to_string(error.code)},
            {"subject", error.subject},
            {"message", error.message()}};
}

}  // namespace render
}  // namespace hearth
