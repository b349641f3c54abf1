#include <evgen/core/checks.hpp>
#include <evgen/core/error.hpp>

#include <cmath>
#include <string>

namespace evgen::core {

void require_non_negative(Tick value, const char* context) {
    if (value < 0) {
        throw InvalidParameterError(
            std::string(context) + " must be >= 0 (got " + std::to_string(value) + ")");
    }
}

void require_positive_mean(double mean, const char* context) {
    if (!std::isfinite(mean) || mean <= 0.0) {
        throw InvalidParameterError(
            std::string(context) + " must be finite and > 0 (got " + std::to_string(mean) + ")");
    }
}

} // namespace evgen::core
