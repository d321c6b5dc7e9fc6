#pragma once

#include <memory>
#include <string>
#include <utility>

#include "config.hpp"
#include "devices/entropy_source.hpp"
#include "registry/house.hpp"

namespace hearth {
namespace runtime {

// Owns the house built from a RuntimeConfig and drives its polling
class Runtime {
public:
    explicit Runtime(const RuntimeConfig &config);

    // Optional: inject the source every configured device samples from.
    // Must be called before initialize().
    void set_entropy_source(std::shared_ptr<devices::IEntropySource> entropy) { entropy_ = std::move(entropy); }

    // Build the house and place every configured device
    bool initialize(std::string &error);

    // Perform polling.cycles passes of House::poll_all()
    void run();

    registry::House &house() { return *house_; }
    const registry::House &house() const { return *house_; }
    bool initialized() const { return house_ != nullptr; }

private:
    RuntimeConfig config_;
    std::shared_ptr<devices::IEntropySource> entropy_;
    std::unique_ptr<registry::House> house_;

    std::shared_ptr<devices::IDevice> make_device(const DeviceConfig &device) const;
};

}  // namespace runtime
}  // namespace hearth
