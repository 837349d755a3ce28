#include "random_source.hpp"

namespace loadplus {

MersenneRandomSource::MersenneRandomSource()
    : generator_(std::random_device{}()) {
}

MersenneRandomSource::MersenneRandomSource(std::uint32_t seed)
    : generator_(seed) {
}

double MersenneRandomSource::uniform(double min, double max) {
    if (max <= min) {
        return min;
    }
    std::uniform_real_distribution<double> dist(min, max);
    std::lock_guard<std::mutex> lock(mutex_);
    return dist(generator_);
}

bool MersenneRandomSource::chance(double probability) {
    if (probability <= 0.0) {
        return false;
    }
    if (probability >= 1.0) {
        return true;
    }
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    std::lock_guard<std::mutex> lock(mutex_);
    return dist(generator_) < probability;
}

} // namespace loadplus
