#include <evgen/core/sampler.hpp>
#include <evgen/core/error.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace evgen::core;

TEST(ExponentialSamplerTest, MeanAccessor) {
    ExponentialSampler sampler(4.0, 1);
    EXPECT_DOUBLE_EQ(sampler.mean(), 4.0);
}

TEST(ExponentialSamplerTest, SamplesAreNonNegative) {
    ExponentialSampler sampler(2.5, 42);
    for (int idx = 0; idx < 10000; ++idx) {
        EXPECT_GE(sampler.next(), 0.0);
    }
}

TEST(ExponentialSamplerTest, SampleMeanMatchesParameter) {
    constexpr int NUM_SAMPLES = 100000;
    ExponentialSampler sampler(4.0, 42);

    double sum = 0.0;
    for (int idx = 0; idx < NUM_SAMPLES; ++idx) {
        sum += sampler.next();
    }

    // Standard error is 4 / sqrt(1e5) ~= 0.013
    EXPECT_NEAR(sum / NUM_SAMPLES, 4.0, 0.1);
}

TEST(ExponentialSamplerTest, SameSeedSameSequence) {
    ExponentialSampler first(3.0, 123);
    ExponentialSampler second(3.0, 123);

    for (int idx = 0; idx < 100; ++idx) {
        EXPECT_DOUBLE_EQ(first.next(), second.next());
    }
}

TEST(ExponentialSamplerTest, DifferentSeedsDiffer) {
    ExponentialSampler first(3.0, 100);
    ExponentialSampler second(3.0, 200);

    bool different = false;
    for (int idx = 0; idx < 10; ++idx) {
        if (first.next() != second.next()) {
            different = true;
        }
    }
    EXPECT_TRUE(different);
}

TEST(ExponentialSamplerTest, SuccessiveSamplesVary) {
    ExponentialSampler sampler(1.0, 7);
    double first = sampler.next();

    bool different = false;
    for (int idx = 0; idx < 10; ++idx) {
        if (sampler.next() != first) {
            different = true;
        }
    }
    EXPECT_TRUE(different);
}

TEST(ExponentialSamplerTest, RejectsInvalidMeans) {
    EXPECT_THROW(ExponentialSampler(0.0, 1), InvalidParameterError);
    EXPECT_THROW(ExponentialSampler(-1.0, 1), InvalidParameterError);
    EXPECT_THROW(ExponentialSampler(std::numeric_limits<double>::infinity(), 1),
                 InvalidParameterError);
    EXPECT_THROW(ExponentialSampler(std::nan(""), 1), InvalidParameterError);
}

TEST(ExponentialSamplerTest, UsableThroughInterface) {
    ExponentialSampler sampler(5.0, 9);
    VariateSource& source = sampler;
    EXPECT_GE(source.next(), 0.0);
}
