#ifndef HEARTH_DEVICES_THERMOMETER_DEVICE_HPP
#define HEARTH_DEVICES_THERMOMETER_DEVICE_HPP

#include <atomic>
#include <memory>
#include <string>

#include "devices/device.hpp"
#include "devices/entropy_source.hpp"

namespace hearth {
namespace devices {

// Room thermometer (degrees Celsius, [-20, 50))
class ThermometerDevice : public IDevice {
public:
    static constexpr double kMinTemperature = -20.0;
    static constexpr double kMaxTemperature = 50.0;

    explicit ThermometerDevice(std::string name,
                               std::shared_ptr<IEntropySource> entropy = default_entropy_source());

    const std::string &name() const override { return name_; }
    DeviceKind kind() const override { return DeviceKind::THERMOMETER; }

    void poll() override;
    std::string describe() const override;

    double temperature() const { return temperature_.load(); }

private:
    const std::string name_;
    std::shared_ptr<IEntropySource> entropy_;
    std::atomic<double> temperature_;

    double sample_temperature();
};

}  // namespace devices
}  // namespace hearth

#endif  // HEARTH_DEVICES_THERMOMETER_DEVICE_HPP
