#include <gtest/gtest.h>
#include <sstream>
#include "tiltball/core/profile.hpp"

class ProfilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Profiling::Profiler::reset();
    }

    void TearDown() override {
        Profiling::Profiler::reset();
    }
};

TEST_F(ProfilerTest, CountsScopedCalls) {
    for (int i = 0; i < 3; ++i) {
        PROFILE_SCOPE("outer");
        PROFILE_SCOPE("inner");
    }

    EXPECT_EQ(Profiling::Profiler::callCount("outer"), 3u);
    EXPECT_EQ(Profiling::Profiler::callCount("inner"), 3u);
    EXPECT_EQ(Profiling::Profiler::callCount("never"), 0u);
}

TEST_F(ProfilerTest, PrintsNestedTree) {
    {
        PROFILE_SCOPE("step");
        {
            PROFILE_SCOPE("integrate");
        }
    }

    std::ostringstream out;
    Profiling::Profiler::printStats(out);
    std::string const text = out.str();

    auto const stepAt = text.find("step [1 calls");
    auto const childAt = text.find("integrate [1 calls");
    ASSERT_NE(stepAt, std::string::npos);
    ASSERT_NE(childAt, std::string::npos);
    EXPECT_LT(stepAt, childAt);
}

TEST_F(ProfilerTest, MismatchedEndIsIgnored) {
    Profiling::Profiler::startSection("a");
    Profiling::Profiler::endSection("b");
    EXPECT_EQ(Profiling::Profiler::callCount("a"), 0u);

    Profiling::Profiler::endSection("a");
    EXPECT_EQ(Profiling::Profiler::callCount("a"), 1u);
}
