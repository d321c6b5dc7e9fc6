#include "socket_device.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace hearth {
namespace devices {

SocketDevice::SocketDevice(std::string name, std::shared_ptr<IEntropySource> entropy)
    : name_(std::move(name)), entropy_(entropy ? std::move(entropy) : default_entropy_source()), voltage_(0.0) {
    voltage_.store(sample_voltage());
}

void SocketDevice::poll() { voltage_.store(sample_voltage()); }

std::string SocketDevice::describe() const {
    std::ostringstream out;
    out << "SOCKET:\n";
    out << "    name: " << name_ << "\n";
    out << "    voltage: " << std::fixed << std::setprecision(2) << voltage_.load() << "\n";
    return out.str();
}

double SocketDevice::sample_voltage() { return entropy_->uniform(kMinVoltage, kMaxVoltage); }

}  // namespace devices
}  // namespace hearth
