#pragma once

#include <cstdint>
#include <random>

namespace evgen::core {

/// @brief Source of real-valued random variates, one per call.
///
/// Implementations must return non-negative samples. Stochastic generators
/// take their randomness through this interface so that tests can drive
/// them with scripted values.
///
/// @ingroup core_sampling
/// @see ExponentialSampler, generate_renewal_events
class VariateSource {
public:
    virtual ~VariateSource() = default;

    /// @brief Draw the next sample.
    /// @return A fresh sample, independent of previous calls.
    virtual double next() = 0;
};

/// @brief Exponential variates with a given mean.
///
/// Samples have density (1/mean) * exp(-x/mean) for x >= 0. Each sampler
/// owns its own Mersenne Twister engine, so two samplers never share state.
///
/// @ingroup core_sampling
class ExponentialSampler final : public VariateSource {
public:
    /// @brief Construct a sampler with an explicit engine seed.
    /// @param mean  Distribution mean; must be finite and > 0.
    /// @param seed  Seed for the underlying engine.
    /// @throws InvalidParameterError  If @p mean is not finite or not positive.
    ExponentialSampler(double mean, std::mt19937::result_type seed);

    /// @brief Draw one exponential sample.
    double next() override;

    /// @brief Get the distribution mean.
    [[nodiscard]] double mean() const noexcept { return mean_; }

private:
    double mean_;
    std::mt19937 engine_;
    std::exponential_distribution<double> dist_;
};

} // namespace evgen::core
