// Hearth demo
// Builds a house from config (or the built-in layout), polls it, prints it

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "devices/socket_device.hpp"
#include "logging/logger.hpp"
#include "render/json.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"

int main(int argc, char **argv)
{
    std::string config_path;
    bool json_output = false;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
        }
        else if (arg == "--json")
        {
            json_output = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            std::cerr << "Usage: hearth-demo [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to a YAML house layout (default: built-in demo house)\n";
            std::cerr << "  --json           Print the house as JSON instead of text\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    hearth::runtime::RuntimeConfig config = hearth::runtime::default_config();
    std::string error;

    if (!config_path.empty())
    {
        if (!std::filesystem::exists(config_path))
        {
            std::cerr << "ERROR: Config file not found: " << config_path << "\n";
            return 1;
        }

        LOG_INFO("Loading config: " << config_path);
        config = hearth::runtime::RuntimeConfig{};
        if (!hearth::runtime::load_config(config_path, config, error))
        {
            LOG_ERROR("Failed to load config: " << error);
            return 1;
        }
    }

    hearth::logging::Logger::set_level(hearth::logging::string_to_level(config.logging.level));

    hearth::runtime::Runtime runtime(config);
    if (!runtime.initialize(error))
    {
        LOG_ERROR("Runtime initialization failed: " << error);
        return 1;
    }

    auto &house = runtime.house();

    if (config_path.empty())
    {
        // Built-in walkthrough: a second "Hello" in the bedroom must be refused
        auto duplicate = std::make_shared<hearth::devices::SocketDevice>("Hello");
        hearth::registry::HouseError house_error;
        if (!house.add_device_to_room(duplicate, "bedroom", house_error))
        {
            std::cout << "Rejected: " << house_error.message() << "\n";
        }
    }

    runtime.run();

    if (json_output)
    {
        std::cout << hearth::render::encode_house(house).dump(2) << "\n";
        return 0;
    }

    std::cout << house << "\n";

    std::cout << "Rooms in the house are:";
    for (const auto &room : house.rooms())
    {
        std::cout << " " << room;
    }
    std::cout << "\n";

    for (const auto &room : house.rooms())
    {
        std::vector<std::string> names;
        hearth::registry::HouseError house_error;
        if (!house.devices(room, names, house_error))
        {
            std::cout << house_error.message() << "\n";
            continue;
        }

        std::cout << "Devices in " << room << " are:";
        for (const auto &name : names)
        {
            std::cout << " [" << name << "]";
        }
        std::cout << "\n";
    }

    return 0;
}
