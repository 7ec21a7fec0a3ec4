#pragma once

/// @file include/zeck/divergence.hpp
/// @brief Cumulative Divergence Engine: V, U, S, d over a closed range.
///
/// # Module: Cumulative Divergence Engine
///
/// ## Definitions (V(−1) = U(−1) = 0)
///   V(k) = V(k−1) + z(k)      cumulative Zeckendorf term count
///   U(k) = U(k−1) + ℓ(k)      cumulative Lucas term count
///   S(k) = V(k) − U(k)        divergence
///   d(k) = z(k) − ℓ(k)        local difference
///
/// ## Parallel pass
/// With `shards > 1` the range is split into contiguous shards. Each shard
/// computes its z/ℓ counts and shard-local running sums independently
/// (OpenMP, one task per shard); a sequential prefix merge then adds the
/// totals of all earlier shards. No S or d value is written before the
/// merge, and the result is identical to the sequential fold.
///
/// ## Guarantees
/// - One Fibonacci and one Lucas table are built per call and only read
/// - O(N log N) total work, O(N) output memory
/// - Recomputing any prefix independently matches the fold (`profile_at`)
/// - N < 0 or N > MAX_RANGE_END yields `std::nullopt`

#include "zeck/constants.hpp"
#include "zeck/sequences.hpp"
#include "zeck/types.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace zeck::divergence {

// ─── ProfileConfig ────────────────────────────────────────────────────────────

struct ProfileConfig {
    /// Number of contiguous shards (1 = sequential fold). Clamped to
    /// [1, MAX_SHARDS] and to the range length.
    std::size_t shards = constants::DEFAULT_SHARDS;

    /// If true, emit a one-line summary per call to stderr.
    bool verbose = false;
};

// ─── Profile Types ────────────────────────────────────────────────────────────

/// All cumulative quantities at one index.
struct ProfilePoint {
    std::int64_t n;
    std::int64_t V;
    std::int64_t U;
    std::int64_t S;
    std::int64_t d;
    std::int64_t z;    ///< z(n)
    std::int64_t ell;  ///< ℓ(n)
};

/// V, U, S, d (and the per-index counts) for every n in [0, range_end].
struct CumulativeProfile {
    std::int64_t              range_end = 0;
    std::vector<std::int64_t> V;
    std::vector<std::int64_t> U;
    std::vector<std::int64_t> S;
    std::vector<std::int64_t> d;
    std::vector<std::int64_t> z;
    std::vector<std::int64_t> ell;

    /// range_end + 1.
    [[nodiscard]] std::size_t size() const noexcept { return V.size(); }

    /// True when range_end ≥ 0 and all six series hold range_end + 1 entries.
    [[nodiscard]] bool well_formed() const noexcept;

    /// Snapshot of index n, or `nullopt` outside [0, range_end].
    [[nodiscard]] std::optional<ProfilePoint> at(std::int64_t n) const noexcept;

    bool operator==(const CumulativeProfile&) const = default;
};

/// Range statistics over a profile.
struct DivergenceSummary {
    std::int64_t range_end;
    double       mean_V;
    double       mean_U;
    std::int64_t max_V;
    std::int64_t max_U;
    std::int64_t min_S;
    std::int64_t max_S;
    std::size_t  zero_count;      ///< indices with S = 0
    std::size_t  positive_count;  ///< indices with S > 0
};

// ─── Engine ───────────────────────────────────────────────────────────────────

/// Compute the profile over [0, N].
[[nodiscard]] std::optional<CumulativeProfile>
cumulative_profile(std::int64_t N, const ProfileConfig& config = {}) noexcept;

/// Compute the profile over [0, N] against caller-owned tables.
/// `nullopt` if either table has the wrong kind or does not cover N.
[[nodiscard]] std::optional<CumulativeProfile>
cumulative_profile(std::int64_t N,
                   const sequences::SequenceTable& fib,
                   const sequences::SequenceTable& luc,
                   const ProfileConfig& config = {}) noexcept;

/// Recompute V, U, S, d at n from scratch, independent of any fold.
[[nodiscard]] std::optional<ProfilePoint> profile_at(std::int64_t n) noexcept;

/// Range statistics; `nullopt` for an empty profile.
[[nodiscard]] std::optional<DivergenceSummary>
summarize(const CumulativeProfile& profile) noexcept;

} // namespace zeck::divergence
