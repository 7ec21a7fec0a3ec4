/// @file src/phase_space/phase_trajectory.cpp
/// @brief PhaseTrajectory: log-scaled (V, U, S) embedding and path metrics.

#include "zeck/phase_space.hpp"

#include <cmath>
#include <new>
#include <utility>

namespace zeck::phase_space {

PhaseCoords embed(std::int64_t V, std::int64_t U, std::int64_t S) noexcept {
    const double s_mag = std::log1p(static_cast<double>(S < 0 ? -S : S));
    const double s_sign = S > 0 ? 1.0 : (S < 0 ? -1.0 : 0.0);
    PhaseCoords c;
    c << std::log1p(static_cast<double>(V)),
         std::log1p(static_cast<double>(U)),
         s_sign * s_mag;
    return c;
}

PhaseTrajectory::PhaseTrajectory(std::vector<PhaseSpacePoint> points) noexcept
    : points_(std::move(points)) {}

// ─── from_profile ─────────────────────────────────────────────────────────────

std::optional<PhaseTrajectory>
PhaseTrajectory::from_profile(const divergence::CumulativeProfile& profile,
                              std::int64_t start, std::int64_t end) noexcept {
    if (profile.size() == 0 || !profile.well_formed()) return std::nullopt;
    if (start < 0 || start > end || end > profile.range_end) return std::nullopt;

    std::vector<PhaseSpacePoint> pts;
    try {
        pts.reserve(static_cast<std::size_t>(end - start + 1));
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
    for (std::int64_t n = start; n <= end; ++n) {
        const auto i = static_cast<std::size_t>(n);
        // A profile with negative counts was not produced by the engine.
        if (profile.V[i] < 0 || profile.U[i] < 0) return std::nullopt;
        pts.push_back(PhaseSpacePoint{
            .n      = n,
            .V      = profile.V[i],
            .U      = profile.U[i],
            .S      = profile.S[i],
            .coords = embed(profile.V[i], profile.U[i], profile.S[i]),
        });
    }
    return PhaseTrajectory{std::move(pts)};
}

// ─── Metrics ──────────────────────────────────────────────────────────────────

double PhaseTrajectory::step_speed(std::size_t i) const noexcept {
    if (i == 0 || i >= points_.size()) return 0.0;
    return (points_[i].coords - points_[i - 1].coords).norm();
}

double PhaseTrajectory::path_length() const noexcept {
    double total = 0.0;
    for (std::size_t i = 1; i < points_.size(); ++i) {
        total += step_speed(i);
    }
    return total;
}

std::vector<std::int64_t> PhaseTrajectory::slow_points(double threshold) const {
    std::vector<std::int64_t> out;
    if (!std::isfinite(threshold) || threshold <= 0.0) return out;
    for (std::size_t i = 1; i < points_.size(); ++i) {
        if (step_speed(i) < threshold) out.push_back(points_[i].n);
    }
    return out;
}

} // namespace zeck::phase_space
