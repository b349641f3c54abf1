#include <evgen/core/sampler.hpp>
#include <evgen/core/checks.hpp>

namespace evgen::core {

ExponentialSampler::ExponentialSampler(double mean, std::mt19937::result_type seed)
    : mean_(mean)
    , engine_(seed) {
    require_positive_mean(mean, "mean");
    // std::exponential_distribution is parameterised by rate = 1 / mean
    dist_ = std::exponential_distribution<double>(1.0 / mean_);
}

double ExponentialSampler::next() {
    return dist_(engine_);
}

} // namespace evgen::core
