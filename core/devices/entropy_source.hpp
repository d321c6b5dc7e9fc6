#ifndef HEARTH_DEVICES_ENTROPY_SOURCE_HPP
#define HEARTH_DEVICES_ENTROPY_SOURCE_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>

namespace hearth {
namespace devices {

// Interface for the random source devices sample from (enables mocking)
class IEntropySource {
public:
    virtual ~IEntropySource() = default;

    // Uniformly distributed value in [low, high)
    virtual double uniform(double low, double high) = 0;
};

// Mersenne Twister backed source. Thread-safe.
class RandomEntropySource : public IEntropySource {
public:
    // No seed => seeded from std::random_device
    explicit RandomEntropySource(std::optional<uint32_t> seed = std::nullopt);

    double uniform(double low, double high) override;

private:
    std::mutex mutex_;
    std::mt19937 rng_;
};

// Process-wide nondeterministic source used when a device is built without one
std::shared_ptr<IEntropySource> default_entropy_source();

}  // namespace devices
}  // namespace hearth

#endif  // HEARTH_DEVICES_ENTROPY_SOURCE_HPP
