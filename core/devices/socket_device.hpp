#ifndef HEARTH_DEVICES_SOCKET_DEVICE_HPP
#define HEARTH_DEVICES_SOCKET_DEVICE_HPP

#include <atomic>
#include <memory>
#include <string>

#include "devices/device.hpp"
#include "devices/entropy_source.hpp"

namespace hearth {
namespace devices {

// Powered socket exposing a voltage reading (volts, [0, 380))
class SocketDevice : public IDevice {
public:
    static constexpr double kMinVoltage = 0.0;
    static constexpr double kMaxVoltage = 380.0;

    explicit SocketDevice(std::string name,
                          std::shared_ptr<IEntropySource> entropy = default_entropy_source());

    const std::string &name() const override { return name_; }
    DeviceKind kind() const override { return DeviceKind::SOCKET; }

    void poll() override;
    std::string describe() const override;

    double voltage() const { return voltage_.load(); }

private:
    const std::string name_;
    std::shared_ptr<IEntropySource> entropy_;
    std::atomic<double> voltage_;

    double sample_voltage();
};

}  // namespace devices
}  // namespace hearth

#endif  // HEARTH_DEVICES_SOCKET_DEVICE_HPP
