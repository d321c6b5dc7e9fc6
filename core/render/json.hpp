#pragma once

#include <nlohmann/json.hpp>

#include "devices/device.hpp"
#include "registry/house.hpp"
#include "registry/house_error.hpp"

namespace hearth {
namespace render {

/**
 * @brief JSON projections of registry entities
 *
 * Device:
 *   {"name": "A", "type": "socket",
 *    "reading": {"signal": "voltage", "value": 231.5, "unit": "V"}}
 * House:
 *   {"name": "H", "rooms": [{"name": "bedroom", "devices": [...]}]}
 *
 * Rooms and devices are emitted in name order.
 */

nlohmann::json encode_device(const devices::IDevice &device);
nlohmann::json encode_house(const registry::House &house);
nlohmann::json encode_error(const registry::HouseError &error);

}  // namespace render
}  // namespace hearth
