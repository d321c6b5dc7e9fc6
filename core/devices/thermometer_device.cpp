#include "thermometer_device.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace hearth {
namespace devices {

ThermometerDevice::ThermometerDevice(std::string name, std::shared_ptr<IEntropySource> entropy)
    : name_(std::move(name)), entropy_(entropy ? std::move(entropy) : default_entropy_source()), temperature_(0.0) {
    temperature_.store(sample_temperature());
}

void ThermometerDevice::poll() { temperature_.store(sample_temperature()); }

std::string ThermometerDevice::describe() const {
    std::ostringstream out;
    out << "THERMOMETER:\n";
    out << "    name: " << name_ << "\n";
    out << "    temperature: " << std::fixed << std::setprecision(2) << temperature_.load() << "\n";
    return out.str();
}

double ThermometerDevice::sample_temperature() { return entropy_->uniform(kMinTemperature, kMaxTemperature); }

}  // namespace devices
}  // namespace hearth
