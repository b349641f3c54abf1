#include <evgen/io/metrics.hpp>

#include <evgen/core/event_stream.hpp>

#include <gtest/gtest.h>

#include <limits>

using namespace evgen::io;
using namespace evgen::core;

TEST(MetricsTest, EmptyStream) {
    EXPECT_TRUE(summarize({}).empty());
}

TEST(MetricsTest, SingleEvent) {
    auto summaries = summarize({Event("A", 10, 5)});

    ASSERT_EQ(summaries.size(), 1u);
    EXPECT_EQ(summaries[0].name, "A");
    EXPECT_EQ(summaries[0].event_count, 1u);
    EXPECT_EQ(summaries[0].total_duration, 5);
    EXPECT_DOUBLE_EQ(summaries[0].mean_duration, 5.0);
    EXPECT_EQ(summaries[0].first_arrival, 10);
    EXPECT_EQ(summaries[0].last_arrival, 10);
    EXPECT_DOUBLE_EQ(summaries[0].mean_interarrival, 0.0);
}

TEST(MetricsTest, FirstAppearanceOrderAndInterleaving) {
    auto summaries = summarize({
        Event("B", 0, 2), Event("A", 3, 1), Event("B", 10, 4), Event("A", 9, 3), Event("B", 20, 0)});

    ASSERT_EQ(summaries.size(), 2u);
    EXPECT_EQ(summaries[0].name, "B");
    EXPECT_EQ(summaries[0].event_count, 3u);
    EXPECT_EQ(summaries[0].total_duration, 6);
    EXPECT_DOUBLE_EQ(summaries[0].mean_duration, 2.0);
    EXPECT_DOUBLE_EQ(summaries[0].mean_interarrival, 10.0);

    EXPECT_EQ(summaries[1].name, "A");
    EXPECT_EQ(summaries[1].first_arrival, 3);
    EXPECT_EQ(summaries[1].last_arrival, 9);
    EXPECT_DOUBLE_EQ(summaries[1].mean_interarrival, 6.0);
}

TEST(MetricsTest, PeriodicProcessSummary) {
    auto events = generate_all({PeriodicProcess("P", 4, 25, 100, 5)});

    auto summaries = summarize(events);

    ASSERT_EQ(summaries.size(), 1u);
    EXPECT_EQ(summaries[0].event_count, 5u);
    EXPECT_DOUBLE_EQ(summaries[0].mean_duration, 4.0);
    EXPECT_DOUBLE_EQ(summaries[0].mean_interarrival, 25.0);
    EXPECT_EQ(summaries[0].first_arrival, 100);
    EXPECT_EQ(summaries[0].last_arrival, 200);
}

TEST(MetricsTest, TotalDurationSaturatesInsteadOfOverflowing) {
    constexpr Tick MAX_TICK = std::numeric_limits<Tick>::max();
    auto summaries = summarize({Event("S", 0, MAX_TICK), Event("S", 3, MAX_TICK), Event("S", 4, 2)});

    ASSERT_EQ(summaries.size(), 1u);
    EXPECT_EQ(summaries[0].total_duration, MAX_TICK);
    EXPECT_GT(summaries[0].mean_duration, 0.0);
    EXPECT_DOUBLE_EQ(summaries[0].mean_duration,
                     (2.0 * static_cast<double>(MAX_TICK) + 2.0) / 3.0);
}

TEST(MetricsTest, SaturatedStochasticDurationsSummarize) {
    // Huge mean duration: every sample truncates to the maximum tick
    auto events = generate_all({StochasticProcess("S", 1e300, 1.0, 0, 50, 1)});
    ASSERT_GE(events.size(), 2u);

    auto summaries = summarize(events);

    ASSERT_EQ(summaries.size(), 1u);
    EXPECT_EQ(summaries[0].total_duration, std::numeric_limits<Tick>::max());
    EXPECT_GT(summaries[0].mean_duration, 0.0);
}
