#pragma once

/// @file include/zeck/phase_space.hpp
/// @brief Phase-space embedding of a cumulative profile.
///
/// # Module: Phase Space
///
/// ## Responsibility
/// Map each index n of a profile to a point in ℝ³:
///   x = ln(1 + V(n))
///   y = ln(1 + U(n))
///   z = sign(S(n)) · ln(1 + |S(n)|)
/// and measure the resulting trajectory: total path length and the indices
/// where consecutive points are closer than a threshold (slow points).
///
/// The log scale keeps the V and U axes comparable as both grow like
/// n·log n, and the signed log on z keeps S = 0 at the origin plane.
///
/// ## Guarantees
/// - Coordinates are always finite (V, U ≥ 0 in any valid profile)
/// - An empty profile or an inverted / out-of-range window yields
///   `std::nullopt`
///
/// ## NOT Responsible For
/// - Computing the profile (see zeck/divergence.hpp)

#include "zeck/constants.hpp"
#include "zeck/divergence.hpp"

#include <Eigen/Dense>

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace zeck::phase_space {

/// Dimension of the embedding.
static constexpr int PHASE_DIM = 3;

/// (ln(1+V), ln(1+U), signed ln(1+|S|)).
using PhaseCoords = Eigen::Vector<double, PHASE_DIM>;

/// Embed one (V, U, S) triple.
[[nodiscard]] PhaseCoords embed(std::int64_t V, std::int64_t U, std::int64_t S) noexcept;

struct PhaseSpacePoint {
    std::int64_t n;
    std::int64_t V;
    std::int64_t U;
    std::int64_t S;
    PhaseCoords  coords;
};

// ─── PhaseTrajectory ──────────────────────────────────────────────────────────

/// Consecutive phase-space points for indices start..end of a profile.
class PhaseTrajectory {
public:
    /// `nullopt` when start > end, start < 0, or end > profile.range_end.
    [[nodiscard]] static std::optional<PhaseTrajectory>
    from_profile(const divergence::CumulativeProfile& profile,
                 std::int64_t start, std::int64_t end) noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return points_.size(); }
    [[nodiscard]] std::span<const PhaseSpacePoint> points() const noexcept { return points_; }

    /// Euclidean distance between point i−1 and point i; 0 for i = 0 or
    /// i out of range.
    [[nodiscard]] double step_speed(std::size_t i) const noexcept;

    /// Σ step speeds. 0 for a single point.
    [[nodiscard]] double path_length() const noexcept;

    /// Indices n (of the later point) whose step speed is below `threshold`.
    /// Empty for a non-finite or non-positive threshold.
    [[nodiscard]] std::vector<std::int64_t>
    slow_points(double threshold = constants::DEFAULT_SLOW_THRESHOLD) const;

private:
    explicit PhaseTrajectory(std::vector<PhaseSpacePoint> points) noexcept;

    std::vector<PhaseSpacePoint> points_;
};

} // namespace zeck::phase_space
