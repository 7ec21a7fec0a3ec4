/// @file tests/equilibrium/test_watcher.cpp
/// @brief Unit tests for the incremental EquilibriumWatcher.

#include <gtest/gtest.h>
#include "zeck/equilibrium.hpp"

#include <cstdint>
#include <optional>
#include <vector>

using namespace zeck;
using namespace zeck::equilibrium;

// ─── Stepping ─────────────────────────────────────────────────────────────────

TEST(Watcher_Step, FirstIndexIsBoundaryEquilibrium) {
    auto w = EquilibriumWatcher::make(10);
    ASSERT_TRUE(w.has_value());
    auto ev = w->step();
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->n, 0);
    EXPECT_EQ(ev->S, 0);
    ASSERT_TRUE(ev->point.has_value());
    EXPECT_EQ(ev->point->lucas_index, Index{1});
    EXPECT_FALSE(ev->violation.has_value());
    EXPECT_EQ(w->state().n, 1);
}

TEST(Watcher_Step, MatchesBatchProfile) {
    constexpr std::int64_t N = 2000;
    auto profile = divergence::cumulative_profile(N);
    auto w = EquilibriumWatcher::make(N);
    ASSERT_TRUE(profile.has_value());
    ASSERT_TRUE(w.has_value());

    for (std::int64_t n = 0; n <= N; ++n) {
        auto ev = w->step();
        ASSERT_TRUE(ev.has_value()) << "n=" << n;
        const auto i = static_cast<std::size_t>(n);
        ASSERT_EQ(ev->n, n);
        ASSERT_EQ(ev->S, profile->S[i]);
        ASSERT_EQ(ev->d, profile->d[i]);
        ASSERT_EQ(w->state().V, profile->V[i]);
        ASSERT_EQ(w->state().U, profile->U[i]);
    }
}

TEST(Watcher_Step, EventsMatchBatchScan) {
    constexpr std::int64_t N = 1000;
    auto scan = find_equilibria(N);
    auto w = EquilibriumWatcher::make(N);
    ASSERT_TRUE(scan.has_value());
    ASSERT_TRUE(w.has_value());

    std::vector<std::int64_t> points;
    std::vector<std::int64_t> violations;
    while (auto ev = w->step()) {
        if (ev->point) points.push_back(ev->point->n);
        if (ev->violation) violations.push_back(ev->violation->n);
    }

    std::vector<std::int64_t> batch_points;
    for (const auto& p : scan->points) batch_points.push_back(p.n);
    std::vector<std::int64_t> batch_violations;
    for (const auto& v : scan->violations) batch_violations.push_back(v.n);

    EXPECT_EQ(points, batch_points);
    EXPECT_EQ(violations, batch_violations);
}

TEST(Watcher_Step, OffBoundaryZeroIsReported) {
    auto w = EquilibriumWatcher::make(5);
    ASSERT_TRUE(w.has_value());
    std::optional<WatchEvent> last;
    for (int i = 0; i <= 5; ++i) last = w->step();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->n, 5);
    ASSERT_TRUE(last->violation.has_value());
    EXPECT_EQ(last->violation->kind, ViolationKind::ZeroOffBoundary);
    EXPECT_FALSE(last->point.has_value());
}

TEST(Watcher_Step, StopsAfterLimit) {
    auto w = EquilibriumWatcher::make(3);
    ASSERT_TRUE(w.has_value());
    for (int i = 0; i <= 3; ++i) {
        ASSERT_TRUE(w->step().has_value());
    }
    EXPECT_FALSE(w->step().has_value());
    EXPECT_EQ(w->state().n, 4);
}

// ─── Resume ───────────────────────────────────────────────────────────────────

TEST(Watcher_Resume, ContinuesFromSavedState) {
    auto a = EquilibriumWatcher::make(200);
    ASSERT_TRUE(a.has_value());
    for (int i = 0; i < 100; ++i) ASSERT_TRUE(a->step().has_value());

    auto b = EquilibriumWatcher::resume(a->state(), 200);
    ASSERT_TRUE(b.has_value());
    for (int i = 0; i < 50; ++i) {
        auto ea = a->step();
        auto eb = b->step();
        ASSERT_TRUE(ea.has_value());
        ASSERT_TRUE(eb.has_value());
        EXPECT_EQ(ea->n, eb->n);
        EXPECT_EQ(ea->S, eb->S);
    }
}

TEST(Watcher_Resume, CopiesStepIndependently) {
    auto a = EquilibriumWatcher::make(50);
    ASSERT_TRUE(a.has_value());
    for (int i = 0; i < 10; ++i) ASSERT_TRUE(a->step().has_value());
    EquilibriumWatcher b = *a;
    ASSERT_TRUE(b.step().has_value());
    EXPECT_EQ(a->state().n, 10);
    EXPECT_EQ(b.state().n, 11);
}

// ─── Rejected inputs ──────────────────────────────────────────────────────────

TEST(Watcher_InvalidArgument, NegativeLimit_ReturnsNullopt) {
    EXPECT_FALSE(EquilibriumWatcher::make(-1).has_value());
}

TEST(Watcher_InvalidArgument, StateBeyondLimit_ReturnsNullopt) {
    EXPECT_FALSE(EquilibriumWatcher::resume(WatcherState{.n = 20, .V = 0, .U = 0}, 10).has_value());
    EXPECT_FALSE(EquilibriumWatcher::resume(WatcherState{.n = 2, .V = -1, .U = 0}, 10).has_value());
}
