#include <evgen/core/singleton_process.hpp>
#include <evgen/core/error.hpp>

#include <gtest/gtest.h>

using namespace evgen::core;

TEST(SingletonProcessTest, Accessors) {
    SingletonProcess proc("A", 5, 10);

    EXPECT_EQ(proc.name(), "A");
    EXPECT_EQ(proc.duration(), 5);
    EXPECT_EQ(proc.arrival(), 10);
}

TEST(SingletonProcessTest, GeneratesExactlyOneEvent) {
    SingletonProcess proc("A", 5, 10);

    auto events = proc.generate_events();

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], Event("A", 10, 5));
}

TEST(SingletonProcessTest, ZeroDurationAndArrival) {
    SingletonProcess proc("zero", 0, 0);

    auto events = proc.generate_events();

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0], Event("zero", 0, 0));
}

TEST(SingletonProcessTest, Idempotent) {
    SingletonProcess proc("A", 5, 10);

    auto first = proc.generate_events();
    auto second = proc.generate_events();

    EXPECT_EQ(first, second);
}

TEST(SingletonProcessTest, RejectsNegativeParameters) {
    EXPECT_THROW(SingletonProcess("A", -1, 10), InvalidParameterError);
    EXPECT_THROW(SingletonProcess("A", 5, -10), InvalidParameterError);
}
