/// @file tests/phase_space/test_phase_space.cpp
/// @brief Unit tests for the phase-space embedding and PhaseTrajectory.

#include <gtest/gtest.h>
#include "zeck/phase_space.hpp"

#include <cmath>
#include <limits>

using namespace zeck;
using namespace zeck::phase_space;

// ─── embed ────────────────────────────────────────────────────────────────────

TEST(PhaseSpace_Embed, OriginAtZero) {
    const PhaseCoords c = embed(0, 0, 0);
    EXPECT_DOUBLE_EQ(c.x(), 0.0);
    EXPECT_DOUBLE_EQ(c.y(), 0.0);
    EXPECT_DOUBLE_EQ(c.z(), 0.0);
}

TEST(PhaseSpace_Embed, LogScaledAxes) {
    const PhaseCoords c = embed(3, 7, 4);
    EXPECT_NEAR(c.x(), std::log(4.0), 1e-12);
    EXPECT_NEAR(c.y(), std::log(8.0), 1e-12);
    EXPECT_NEAR(c.z(), std::log(5.0), 1e-12);
}

TEST(PhaseSpace_Embed, NegativeDivergenceKeepsSign) {
    const PhaseCoords c = embed(3, 6, -3);
    EXPECT_NEAR(c.z(), -std::log(4.0), 1e-12);
}

// ─── from_profile ─────────────────────────────────────────────────────────────

TEST(PhaseSpace_Trajectory, FullRange) {
    auto profile = divergence::cumulative_profile(20);
    ASSERT_TRUE(profile.has_value());
    auto traj = PhaseTrajectory::from_profile(*profile, 0, 20);
    ASSERT_TRUE(traj.has_value());
    ASSERT_EQ(traj->size(), 21u);
    EXPECT_EQ(traj->points().front().n, 0);
    EXPECT_EQ(traj->points().back().n, 20);
    EXPECT_EQ(traj->points().back().V, 38);
    EXPECT_EQ(traj->points().back().U, 35);
    EXPECT_EQ(traj->points().back().S, 3);
    EXPECT_NEAR(traj->points().back().coords.x(), std::log(39.0), 1e-12);
}

TEST(PhaseSpace_Trajectory, SubWindow) {
    auto profile = divergence::cumulative_profile(100);
    ASSERT_TRUE(profile.has_value());
    auto traj = PhaseTrajectory::from_profile(*profile, 10, 20);
    ASSERT_TRUE(traj.has_value());
    EXPECT_EQ(traj->size(), 11u);
    EXPECT_EQ(traj->points().front().n, 10);
}

TEST(PhaseSpace_Trajectory, InvalidWindows_ReturnNullopt) {
    auto profile = divergence::cumulative_profile(20);
    ASSERT_TRUE(profile.has_value());
    EXPECT_FALSE(PhaseTrajectory::from_profile(*profile, 5, 4).has_value());
    EXPECT_FALSE(PhaseTrajectory::from_profile(*profile, -1, 4).has_value());
    EXPECT_FALSE(PhaseTrajectory::from_profile(*profile, 0, 21).has_value());
    EXPECT_FALSE(PhaseTrajectory::from_profile(divergence::CumulativeProfile{}, 0, 0).has_value());
}

TEST(PhaseSpace_Trajectory, MismatchedProfile_ReturnsNullopt) {
    divergence::CumulativeProfile bad;
    bad.range_end = 50;
    bad.V   = {0, 1, 2};
    bad.U   = {0, 1, 2};
    bad.S   = {0, 0, 0};
    bad.d   = {0, 0, 0};
    bad.z   = {0, 1, 1};
    bad.ell = {0, 1, 1};
    EXPECT_FALSE(PhaseTrajectory::from_profile(bad, 0, 50).has_value());
    EXPECT_FALSE(PhaseTrajectory::from_profile(bad, 0, 2).has_value());

    auto profile = divergence::cumulative_profile(20);
    ASSERT_TRUE(profile.has_value());
    profile->S.resize(5);
    EXPECT_FALSE(PhaseTrajectory::from_profile(*profile, 0, 20).has_value());
}

// ─── Metrics ──────────────────────────────────────────────────────────────────

TEST(PhaseSpace_Metrics, SinglePointHasZeroLength) {
    auto profile = divergence::cumulative_profile(5);
    ASSERT_TRUE(profile.has_value());
    auto traj = PhaseTrajectory::from_profile(*profile, 3, 3);
    ASSERT_TRUE(traj.has_value());
    EXPECT_DOUBLE_EQ(traj->path_length(), 0.0);
    EXPECT_TRUE(traj->slow_points().empty());
    EXPECT_DOUBLE_EQ(traj->step_speed(0), 0.0);
}

TEST(PhaseSpace_Metrics, PathLengthIsSumOfSteps) {
    auto profile = divergence::cumulative_profile(200);
    ASSERT_TRUE(profile.has_value());
    auto traj = PhaseTrajectory::from_profile(*profile, 0, 200);
    ASSERT_TRUE(traj.has_value());

    double total = 0.0;
    for (std::size_t i = 1; i < traj->size(); ++i) {
        const double s = traj->step_speed(i);
        EXPECT_GT(s, 0.0) << "i=" << i;
        total += s;
    }
    EXPECT_NEAR(traj->path_length(), total, 1e-9);
    EXPECT_DOUBLE_EQ(traj->step_speed(traj->size()), 0.0);
}

TEST(PhaseSpace_Metrics, FirstStepLength) {
    auto profile = divergence::cumulative_profile(1);
    ASSERT_TRUE(profile.has_value());
    auto traj = PhaseTrajectory::from_profile(*profile, 0, 1);
    ASSERT_TRUE(traj.has_value());
    // (0,0,0) → (ln 2, ln 2, 0)
    EXPECT_NEAR(traj->path_length(), std::sqrt(2.0) * std::log(2.0), 1e-12);
}

TEST(PhaseSpace_Metrics, SlowPointsFollowThreshold) {
    auto profile = divergence::cumulative_profile(50);
    ASSERT_TRUE(profile.has_value());
    auto traj = PhaseTrajectory::from_profile(*profile, 0, 50);
    ASSERT_TRUE(traj.has_value());

    const auto all = traj->slow_points(1e9);
    ASSERT_EQ(all.size(), 50u);
    EXPECT_EQ(all.front(), 1);
    EXPECT_EQ(all.back(), 50);

    EXPECT_TRUE(traj->slow_points(0.0).empty());
    EXPECT_TRUE(traj->slow_points(-1.0).empty());
    EXPECT_TRUE(traj->slow_points(std::numeric_limits<double>::quiet_NaN()).empty());
}
