#pragma once

/// @file include/zeck/equilibrium.hpp
/// @brief Equilibrium Scanner: zeros of S(n) against Lucas boundaries.
///
/// # Module: Equilibrium Scanner
///
/// ## Responsibility
/// Walk a cumulative profile over [0, N] and classify every index:
///   - S(n) = 0 and n+1 = L(m)   → EquilibriumPoint{n, m}
///   - S(n) = 0, n+1 not Lucas   → Violation{ZeroOffBoundary}
///   - S(n) ≠ 0, n+1 = L(m)      → Violation{BoundaryNotZero}
///   - decomposition cross-check disagrees or fails
///                               → Violation{DecompositionInvalid}
///
/// Every Lucas boundary is a zero of S. The converse fails at a sparse set
/// of indices (5, 8, 9, 16, 24, …) where the two cumulative counts meet
/// between boundaries; these are reported, never dropped, and the scan
/// always runs to the end of the range.
///
/// ## Pattern sink
/// An optional `PatternSink` observes each equilibrium and, once the scan
/// is complete, each distinct d(k) signature with the indices that share
/// it. Exceptions thrown by the sink are caught and counted; they never
/// change a computed value.
///
/// ## Guarantees
/// - `points` holds only true Lucas boundaries, in increasing n
/// - `violations` is in increasing n
/// - N < 0 or N > MAX_RANGE_END yields `std::nullopt`
///
/// ## NOT Responsible For
/// - Persisting signatures or equilibria (the sink's concern)

#include "zeck/constants.hpp"
#include "zeck/divergence.hpp"
#include "zeck/sequences.hpp"
#include "zeck/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace zeck::equilibrium {

// ─── Results ──────────────────────────────────────────────────────────────────

/// S(n) = 0 at a Lucas boundary n+1 = L(lucas_index).
struct EquilibriumPoint {
    std::int64_t n;
    Index        lucas_index;
};

enum class ViolationKind {
    ZeroOffBoundary,       ///< S(n) = 0 but n+1 is not a Lucas number
    BoundaryNotZero,       ///< n+1 is a Lucas number but S(n) ≠ 0
    DecompositionInvalid,  ///< Lucas decomposition of n+1 failed or disagreed
};

/// "zero-off-boundary", "boundary-not-zero", "decomposition-invalid".
[[nodiscard]] const char* to_string(ViolationKind kind) noexcept;

struct Violation {
    std::int64_t  n;
    ViolationKind kind;
    std::string   reason;
};

// ─── ScanConfig ───────────────────────────────────────────────────────────────

struct ScanConfig {
    /// Shards for the underlying cumulative pass.
    std::size_t shards = constants::DEFAULT_SHARDS;

    /// Number of d(k) values (ending at the equilibrium) in a signature.
    /// 0 disables signatures.
    std::size_t signature_window = constants::DEFAULT_SIGNATURE_WINDOW;

    /// Also confirm each boundary with a full Lucas decomposition of n+1
    /// (count == 1 exactly at boundaries).
    bool cross_check_decomposition = false;

    /// If true, print a summary and every violation to stderr.
    bool verbose = false;
};

// ─── PatternSink ──────────────────────────────────────────────────────────────

/// Observer for discovered structure. Implementations may throw; the
/// scanner catches `std::exception` and counts the failure.
class PatternSink {
public:
    virtual ~PatternSink() = default;

    virtual void store_equilibrium(const EquilibriumPoint& point) = 0;

    /// `example_ids` are the equilibrium indices sharing `signature`.
    virtual void store_pattern_signature(const std::string& signature,
                                         const std::vector<std::int64_t>& example_ids) = 0;
};

// ─── EquilibriumScan ──────────────────────────────────────────────────────────

struct EquilibriumScan {
    std::int64_t                  range_end = 0;
    std::vector<EquilibriumPoint> points;
    std::vector<Violation>        violations;
    std::size_t                   lucas_boundaries = 0;  ///< n in range with n+1 Lucas
    std::size_t                   sink_failures    = 0;

    /// True when no violation of any kind was recorded.
    [[nodiscard]] bool theorem_consistent() const noexcept { return violations.empty(); }

    /// Multi-line human-readable report of points, violations and counts.
    [[nodiscard]] std::string to_report() const;
};

// ─── Scanner ──────────────────────────────────────────────────────────────────

/// Scan [0, N]. `sink` may be null.
[[nodiscard]] std::optional<EquilibriumScan>
find_equilibria(std::int64_t N,
                const ScanConfig& config = {},
                PatternSink* sink = nullptr) noexcept;

/// Scan an already computed profile against a Lucas table covering
/// profile.range_end + 1. `nullopt` if the table is too short.
[[nodiscard]] std::optional<EquilibriumScan>
scan_profile(const divergence::CumulativeProfile& profile,
             const sequences::SequenceTable& luc,
             const ScanConfig& config = {},
             PatternSink* sink = nullptr) noexcept;

/// d(k) for the `window` indices ending at n, e.g. "+1,-1,0".
/// Shorter near 0; empty when window is 0 or n is outside the profile.
[[nodiscard]] std::string
pattern_signature(const divergence::CumulativeProfile& profile,
                  std::int64_t n, std::size_t window);

// ─── Single-index check ───────────────────────────────────────────────────────

/// Both sides of the boundary statement evaluated at one index.
struct TheoremCheck {
    std::int64_t         n;
    std::int64_t         S;
    std::optional<Index> lucas_index;  ///< m with n+1 = L(m), if any
    bool                 consistent;   ///< (S = 0) == lucas_index.has_value()
    std::string          message;
};

/// Recompute S(n) from scratch and compare with n+1's Lucas membership.
[[nodiscard]] std::optional<TheoremCheck> verify_at(std::int64_t n) noexcept;

// ─── EquilibriumWatcher ───────────────────────────────────────────────────────

/// Running state between steps: the next index and V, U up to n−1.
struct WatcherState {
    std::int64_t n = 0;
    std::int64_t V = 0;
    std::int64_t U = 0;
};

/// Outcome of one watcher step at index n.
struct WatchEvent {
    std::int64_t                    n;
    std::int64_t                    S;
    std::int64_t                    d;
    std::optional<EquilibriumPoint> point;
    std::optional<Violation>        violation;
};

/// Incremental scanner: one index per `step()` without re-running a batch.
///
/// Holds only `WatcherState` and the two tables (shared between copies).
class EquilibriumWatcher {
public:
    /// Watcher able to step through indices 0..limit.
    /// `nullopt` for limit < 0 or limit > MAX_RANGE_END.
    [[nodiscard]] static std::optional<EquilibriumWatcher>
    make(std::int64_t limit) noexcept;

    /// Resume from a saved state; `nullopt` if it lies beyond `limit`.
    [[nodiscard]] static std::optional<EquilibriumWatcher>
    resume(const WatcherState& state, std::int64_t limit) noexcept;

    /// Process index state().n and advance. `nullopt` once past `limit`.
    [[nodiscard]] std::optional<WatchEvent> step() noexcept;

    [[nodiscard]] const WatcherState& state() const noexcept { return state_; }
    [[nodiscard]] std::int64_t limit() const noexcept { return limit_; }

private:
    EquilibriumWatcher(WatcherState state, std::int64_t limit,
                       std::shared_ptr<const sequences::SequenceTable> fib,
                       std::shared_ptr<const sequences::SequenceTable> luc) noexcept;

    WatcherState                                    state_;
    std::int64_t                                    limit_;
    std::shared_ptr<const sequences::SequenceTable> fib_;
    std::shared_ptr<const sequences::SequenceTable> luc_;
};

} // namespace zeck::equilibrium
