#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>

#include "../logging/logger.hpp"

namespace hearth {
namespace runtime {

namespace {

bool is_known_device_type(const std::string &type) { return type == "socket" || type == "thermometer"; }

// Shared by the file and string entry points
bool parse_config(const YAML::Node &yaml, RuntimeConfig &config, std::string &error) {
    if (!yaml || yaml.IsNull()) {
        // Empty document: keep defaults
        return validate_config(config, error);
    }
    if (!yaml.IsMap()) {
        error = "Config root must be a mapping";
        return false;
    }

    // Check for unknown top-level keys
    const std::vector<std::string> valid_keys = {"house", "logging", "sampling", "polling", "rooms"};
    for (const auto &key_node : yaml) {
        std::string key = key_node.first.as<std::string>();
        if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
            LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
        }
    }

    if (yaml["house"]) {
        if (yaml["house"]["name"]) {
            config.house.name = yaml["house"]["name"].as<std::string>();
        }
    }

    if (yaml["logging"]) {
        if (yaml["logging"]["level"]) {
            config.logging.level = yaml["logging"]["level"].as<std::string>();
        }
    }

    if (yaml["sampling"]) {
        if (yaml["sampling"]["seed"]) {
            config.sampling.seed = yaml["sampling"]["seed"].as<uint32_t>();
        }
    }

    if (yaml["polling"]) {
        if (yaml["polling"]["cycles"]) {
            config.polling.cycles = yaml["polling"]["cycles"].as<int>();
        }
    }

    if (yaml["rooms"]) {
        const auto &rooms_node = yaml["rooms"];
        if (!rooms_node.IsSequence()) {
            error = "'rooms' must be a sequence";
            return false;
        }

        config.rooms.clear();
        for (const auto &room_node : rooms_node) {
            RoomConfig room;
            if (room_node["name"]) {
                room.name = room_node["name"].as<std::string>();
            }

            if (room_node["devices"]) {
                if (!room_node["devices"].IsSequence()) {
                    error = "Room '" + room.name + "' devices must be a sequence";
                    return false;
                }
                for (const auto &device_node : room_node["devices"]) {
                    DeviceConfig device;
                    if (device_node["type"]) {
                        device.type = device_node["type"].as<std::string>();
                    }
                    if (device_node["name"]) {
                        device.name = device_node["name"].as<std::string>();
                    }
                    room.devices.push_back(device);
                }
            }

            config.rooms.push_back(room);
        }
    }

    if (!validate_config(config, error)) {
        return false;
    }

    size_t device_total = 0;
    for (const auto &room : config.rooms) {
        device_total += room.devices.size();
    }

    LOG_INFO("[Config] House: " << config.house.name);
    LOG_INFO("[Config] Rooms: " << config.rooms.size() << " (" << device_total << " devices)");
    LOG_INFO("[Config] Polling cycles: " << config.polling.cycles);
    if (config.sampling.seed) {
        LOG_INFO("[Config] Sampling seed: " << *config.sampling.seed);
    }
    LOG_INFO("[Config] Log level: " << config.logging.level);

    return true;
}

}  // namespace

RuntimeConfig default_config() {
    RuntimeConfig config;
    config.house.name = "The Rising Sun";
    config.rooms.push_back({"bedroom", {{"socket", "Hello"}, {"socket", "My other socket"}}});
    return config;
}

bool validate_config(const RuntimeConfig &config, std::string &error) {
    if (config.house.name.empty()) {
        error = "house.name must not be empty";
        return false;
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error" && config.logging.level != "none") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    if (config.polling.cycles < 0) {
        error = "polling.cycles must be >= 0";
        return false;
    }

    for (size_t i = 0; i < config.rooms.size(); ++i) {
        const auto &room = config.rooms[i];
        if (room.name.empty()) {
            error = "rooms[" + std::to_string(i) + "] missing 'name' field";
            return false;
        }

        for (size_t j = 0; j < room.devices.size(); ++j) {
            const auto &device = room.devices[j];
            if (device.name.empty()) {
                error = "Room '" + room.name + "' devices[" + std::to_string(j) + "] missing 'name' field";
                return false;
            }
            if (!is_known_device_type(device.type)) {
                error = "Device '" + device.name + "' in room '" + room.name + "' has invalid type: '" +
                        device.type + "' (expected socket or thermometer)";
                return false;
            }
        }
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);
        return parse_config(yaml, config, error);
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

bool load_config_from_string(const std::string &yaml_text, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::Load(yaml_text);
        return parse_config(yaml, config, error);
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace hearth
