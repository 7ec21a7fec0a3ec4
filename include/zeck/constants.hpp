#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/zeck/constants.hpp
/// @brief Numeric constants and configuration defaults for zeck.

namespace zeck::constants {

// ─── Golden Ratio ─────────────────────────────────────────────────────────────

/// φ = (1 + √5) / 2. Used only for size estimates, never for values.
static constexpr double PHI = 1.6180339887498948482;

/// ln φ, used to bound the index of the largest term ≤ n.
static constexpr double LOG_PHI = 0.48121182505960344750;

// ─── Sequence Bases ───────────────────────────────────────────────────────────

/// Smallest Fibonacci index admissible in a Zeckendorf representation.
/// F(1) duplicates F(2) = 1 and F(0) = 0 adds nothing.
static constexpr std::size_t ZECKENDORF_MIN_INDEX = 2;

/// Base cases of the two sequences.
static constexpr std::int64_t FIB_0 = 0;
static constexpr std::int64_t FIB_1 = 1;
static constexpr std::int64_t LUCAS_0 = 2;
static constexpr std::int64_t LUCAS_1 = 1;

// ─── Batch Defaults ───────────────────────────────────────────────────────────

/// Default number of shards for the cumulative pass (1 = sequential fold).
static constexpr std::size_t DEFAULT_SHARDS = 1;

/// Upper bound accepted for shard counts; larger requests are clamped.
static constexpr std::size_t MAX_SHARDS = 256;

/// Default number of d(k) values folded into an equilibrium signature.
static constexpr std::size_t DEFAULT_SIGNATURE_WINDOW = 5;

/// Largest range end accepted by the batch functions. Counts in V and U
/// grow like N·log N and stay far below int64 range at this bound.
static constexpr std::int64_t MAX_RANGE_END = 1'000'000'000;

// ─── Phase Space ──────────────────────────────────────────────────────────────

/// Default speed threshold below which a trajectory step counts as slow.
static constexpr double DEFAULT_SLOW_THRESHOLD = 1e-3;

} // namespace zeck::constants
