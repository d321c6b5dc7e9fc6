#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace hearth {
namespace runtime {

struct HouseConfig {
    std::string name = "The Rising Sun";
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error, none
};

struct SamplingConfig {
    std::optional<uint32_t> seed;  // Unset: seed from std::random_device
};

struct PollingConfig {
    int cycles = 1;  // poll_all() passes performed by Runtime::run()
};

// One device declared under a room
struct DeviceConfig {
    std::string type;  // socket, thermometer
    std::string name;
};

struct RoomConfig {
    std::string name;
    std::vector<DeviceConfig> devices;
};

struct RuntimeConfig {
    HouseConfig house;
    LoggingConfig logging;
    SamplingConfig sampling;
    PollingConfig polling;
    std::vector<RoomConfig> rooms;
};

// Built-in layout used when no config file is given
RuntimeConfig default_config();

// Loads configuration from a YAML file (runs validate_config on success)
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Same as load_config, from an in-memory YAML document
bool load_config_from_string(const std::string &yaml_text, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace hearth
