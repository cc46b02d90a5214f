#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "gunpong/components/match.hpp"
#include "gunpong/core/input.hpp"
#include "gunpong/core/profile.hpp"

TEST(ProfilerTest, ScopeRecordsOneCall) {
    Profiling::Profiler::reset();
    {
        PROFILE_SCOPE("ProfilerTest::scope");
    }
    {
        PROFILE_SCOPE("ProfilerTest::scope");
    }

    auto const stats = Profiling::Profiler::stats("ProfilerTest::scope");
    EXPECT_EQ(stats.call_count, 2u);
    EXPECT_LE(stats.min_time, stats.max_time);
    EXPECT_GE(stats.total_time, stats.max_time);
}

TEST(ProfilerTest, PrintAndReset) {
    Profiling::Profiler::reset();
    Profiling::Profiler::record("ProfilerTest::manual", std::chrono::microseconds(5));

    std::ostringstream out;
    Profiling::Profiler::printStats(out);
    EXPECT_NE(out.str().find("[Profiler] Frame statistics:"), std::string::npos);
    EXPECT_NE(out.str().find("ProfilerTest::manual"), std::string::npos);
    EXPECT_NE(out.str().find("avg 5.00us"), std::string::npos);

    Profiling::Profiler::reset();
    EXPECT_EQ(Profiling::Profiler::stats("ProfilerTest::manual").call_count, 0u);
}

TEST(NamesTest, PhaseAndKeyNames) {
    EXPECT_EQ(Components::phaseName(Components::Phase::LeftWin), "LEFT_WIN");
    EXPECT_EQ(Components::phaseName(Components::Phase::Start), "START");
    EXPECT_EQ(keyName(Key::Up), "Up");
    EXPECT_EQ(keyName(Key::W), "W");
}
