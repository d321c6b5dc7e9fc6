#include "entropy_source.hpp"

#include <cmath>

namespace hearth {
namespace devices {

RandomEntropySource::RandomEntropySource(std::optional<uint32_t> seed)
    : rng_(seed ? *seed : std::random_device{}()) {}

double RandomEntropySource::uniform(double low, double high) {
    if (!(low < high)) {
        return low;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::uniform_real_distribution<double> dist(low, high);
    double value = dist(rng_);

    // Some standard libraries can return `high` through rounding
    if (value >= high) {
        value = std::nextafter(high, low);
    }
    return value;
}

std::shared_ptr<IEntropySource> default_entropy_source() {
    static std::shared_ptr<IEntropySource> source = std::make_shared<RandomEntropySource>();
    return source;
}

}  // namespace devices
}  // namespace hearth
