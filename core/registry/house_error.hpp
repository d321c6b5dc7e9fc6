#ifndef HEARTH_REGISTRY_HOUSE_ERROR_HPP
#define HEARTH_REGISTRY_HOUSE_ERROR_HPP

#include <string>

namespace hearth {
namespace registry {

/**
 * @brief Failure kinds reported by House operations
 *
 * Both are precondition violations returned as values:
 * - NO_SUCH_ROOM: a read named a room with no entry (subject = room name)
 * - ALREADY_CONTAINS_DEVICE: the target room already holds a device with
 *   that name (subject = device name)
 * - INVALID_ARGUMENT: add was handed a null device (subject = room name)
 */
enum class ErrorCode { NONE, NO_SUCH_ROOM, ALREADY_CONTAINS_DEVICE, INVALID_ARGUMENT };

inline std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return "NONE";
        case ErrorCode::NO_SUCH_ROOM:
            return "NO_SUCH_ROOM";
        case ErrorCode::ALREADY_CONTAINS_DEVICE:
            return "ALREADY_CONTAINS_DEVICE";
        case ErrorCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        default:
            return "UNKNOWN";
    }
}

struct HouseError {
    ErrorCode code = ErrorCode::NONE;
    std::string subject;

    static HouseError no_such_room(const std::string &room) { return {ErrorCode::NO_SUCH_ROOM, room}; }
    static HouseError already_contains_device(const std::string &device_name) {
        return {ErrorCode::ALREADY_CONTAINS_DEVICE, device_name};
    }
    static HouseError invalid_argument(const std::string &room) { return {ErrorCode::INVALID_ARGUMENT, room}; }

    std::string message() const {
        switch (code) {
            case ErrorCode::NO_SUCH_ROOM:
                return "The room ~=<" + subject + ">=~ does not exist";
            case ErrorCode::ALREADY_CONTAINS_DEVICE:
                return "The room already contains this device: " + subject;
            case ErrorCode::INVALID_ARGUMENT:
                return "Cannot add a null device to room " + subject;
            default:
                return "";
        }
    }
};

}  // namespace registry
}  // namespace hearth

#endif  // HEARTH_REGISTRY_HOUSE_ERROR_HPP
