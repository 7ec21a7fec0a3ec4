/// @file src/equilibrium/scanner.cpp
/// @brief Equilibrium Scanner: batch classification of S(n) zeros.

#include "zeck/equilibrium.hpp"
#include "zeck/decomposition.hpp"

#include <fmt/format.h>

#include <cstdio>
#include <exception>
#include <map>
#include <new>
#include <utility>

namespace zeck::equilibrium {

namespace {

/// Lucas index m with L(m) = n+1, read from the table.
std::optional<Index> boundary_index(std::int64_t n,
                                    const sequences::SequenceTable& luc) noexcept {
    return luc.index_of(BigInt{static_cast<long>(n + 1)});
}

/// Compare the table lookup with a full Lucas decomposition of n+1.
std::optional<Violation> cross_check(std::int64_t n,
                                     const std::optional<Index>& boundary,
                                     const sequences::SequenceTable& luc) {
    const BigInt next{static_cast<long>(n + 1)};
    auto rep = decomposition::decompose_lucas(next, luc);
    if (!rep) {
        return Violation{n, ViolationKind::DecompositionInvalid,
                         fmt::format("Lucas decomposition of {} failed its checks",
                                     n + 1)};
    }
    const bool single = rep->count() == 1;
    if (single != boundary.has_value()) {
        return Violation{n, ViolationKind::DecompositionInvalid,
                         fmt::format("{} has {} Lucas term(s) but table membership is {}",
                                     n + 1, rep->count(), boundary.has_value())};
    }
    return std::nullopt;
}

} // anonymous namespace

// ─── ViolationKind ────────────────────────────────────────────────────────────

const char* to_string(ViolationKind kind) noexcept {
    switch (kind) {
        case ViolationKind::ZeroOffBoundary:      return "zero-off-boundary";
        case ViolationKind::BoundaryNotZero:      return "boundary-not-zero";
        case ViolationKind::DecompositionInvalid: return "decomposition-invalid";
    }
    return "unknown";
}

// ─── pattern_signature ────────────────────────────────────────────────────────

std::string pattern_signature(const divergence::CumulativeProfile& profile,
                              std::int64_t n, std::size_t window) {
    if (window == 0 || n < 0 || static_cast<std::size_t>(n) >= profile.size()) {
        return {};
    }
    const auto last  = static_cast<std::size_t>(n);
    const auto first = last + 1 >= window ? last + 1 - window : 0;

    std::string sig;
    for (std::size_t k = first; k <= last; ++k) {
        if (k > first) sig += ',';
        const std::int64_t d = profile.d[k];
        sig += d > 0 ? fmt::format("+{}", d) : fmt::format("{}", d);
    }
    return sig;
}

// ─── scan_profile ─────────────────────────────────────────────────────────────

std::optional<EquilibriumScan>
scan_profile(const divergence::CumulativeProfile& profile,
             const sequences::SequenceTable& luc,
             const ScanConfig& config,
             PatternSink* sink) noexcept {
    if (profile.size() == 0 || !profile.well_formed()) return std::nullopt;
    if (luc.kind() != SequenceKind::Lucas ||
        !luc.covers(BigInt{static_cast<long>(profile.range_end + 1)})) {
        return std::nullopt;
    }

    EquilibriumScan scan;
    scan.range_end = profile.range_end;
    std::map<std::string, std::vector<std::int64_t>> signatures;

    try {
        for (std::int64_t n = 0; n <= profile.range_end; ++n) {
            const auto i = static_cast<std::size_t>(n);
            const std::int64_t S = profile.S[i];
            const auto boundary = boundary_index(n, luc);
            if (boundary) ++scan.lucas_boundaries;

            if (config.cross_check_decomposition) {
                if (auto v = cross_check(n, boundary, luc)) {
                    scan.violations.push_back(std::move(*v));
                }
            }

            if (S == 0 && boundary) {
                const EquilibriumPoint point{n, *boundary};
                scan.points.push_back(point);
                if (config.signature_window > 0) {
                    signatures[pattern_signature(profile, n, config.signature_window)]
                        .push_back(n);
                }
                if (sink) {
                    try {
                        sink->store_equilibrium(point);
                    } catch (const std::exception& e) {
                        ++scan.sink_failures;
                        if (config.verbose) {
                            fmt::print(stderr, "[scan] sink rejected n={}: {}\n", n, e.what());
                        }
                    } catch (...) {
                        ++scan.sink_failures;
                        if (config.verbose) {
                            fmt::print(stderr, "[scan] sink rejected n={}: unknown exception\n", n);
                        }
                    }
                }
            } else if (S == 0) {
                scan.violations.push_back(Violation{
                    n, ViolationKind::ZeroOffBoundary,
                    fmt::format("S({}) = 0 but {} is not a Lucas number", n, n + 1)});
            } else if (boundary) {
                scan.violations.push_back(Violation{
                    n, ViolationKind::BoundaryNotZero,
                    fmt::format("{} = L({}) but S({}) = {}", n + 1, *boundary, n, S)});
            }
        }

        if (sink) {
            for (const auto& [signature, ids] : signatures) {
                try {
                    sink->store_pattern_signature(signature, ids);
                } catch (const std::exception& e) {
                    ++scan.sink_failures;
                    if (config.verbose) {
                        fmt::print(stderr, "[scan] sink rejected signature {}: {}\n",
                                   signature, e.what());
                    }
                } catch (...) {
                    ++scan.sink_failures;
                    if (config.verbose) {
                        fmt::print(stderr, "[scan] sink rejected signature {}: unknown exception\n",
                                   signature);
                    }
                }
            }
        }
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }

    if (config.verbose) {
        for (const auto& v : scan.violations) {
            fmt::print(stderr, "[scan] n={} {}: {}\n", v.n, to_string(v.kind), v.reason);
        }
        fmt::print(stderr, "[scan] N={} points={} violations={} boundaries={}\n",
                   scan.range_end, scan.points.size(), scan.violations.size(),
                   scan.lucas_boundaries);
    }
    return scan;
}

// ─── find_equilibria ──────────────────────────────────────────────────────────

std::optional<EquilibriumScan>
find_equilibria(std::int64_t N, const ScanConfig& config, PatternSink* sink) noexcept {
    if (N < 0 || N > constants::MAX_RANGE_END) return std::nullopt;

    // The Lucas table must reach N+1 for the boundary lookups.
    auto fib = sequences::SequenceTable::up_to_value(SequenceKind::Fibonacci,
                                                     BigInt{static_cast<long>(N)});
    auto luc = sequences::SequenceTable::up_to_value(SequenceKind::Lucas,
                                                     BigInt{static_cast<long>(N + 1)});
    if (!fib || !luc) return std::nullopt;

    const divergence::ProfileConfig profile_config{
        .shards  = config.shards,
        .verbose = config.verbose,
    };
    auto profile = divergence::cumulative_profile(N, *fib, *luc, profile_config);
    if (!profile) return std::nullopt;
    return scan_profile(*profile, *luc, config, sink);
}

// ─── EquilibriumScan::to_report ───────────────────────────────────────────────

std::string EquilibriumScan::to_report() const {
    std::string out = fmt::format(
        "Equilibrium scan over [0, {}]\n"
        "  Lucas boundaries : {}\n"
        "  Equilibria       : {}\n"
        "  Violations       : {}\n"
        "  Sink failures    : {}\n"
        "  Consistent       : {}\n",
        range_end, lucas_boundaries, points.size(), violations.size(),
        sink_failures, theorem_consistent() ? "yes" : "no");

    if (!points.empty()) {
        out += "Equilibria (n, n+1 = L(m)):\n";
        for (const auto& p : points) {
            out += fmt::format("  n={:<10} L({})\n", p.n, p.lucas_index);
        }
    }
    if (!violations.empty()) {
        out += "Violations:\n";
        for (const auto& v : violations) {
            out += fmt::format("  n={:<10} [{}] {}\n", v.n, to_string(v.kind), v.reason);
        }
    }
    return out;
}

// ─── verify_at ────────────────────────────────────────────────────────────────

std::optional<TheoremCheck> verify_at(std::int64_t n) noexcept {
    if (n < 0 || n > constants::MAX_RANGE_END) return std::nullopt;
    auto point = divergence::profile_at(n);
    if (!point) return std::nullopt;

    const auto m = sequences::lucas_index_of(BigInt{static_cast<long>(n + 1)});
    const bool zero = point->S == 0;

    TheoremCheck check{
        .n           = n,
        .S           = point->S,
        .lucas_index = m,
        .consistent  = zero == m.has_value(),
        .message     = {},
    };
    if (zero && m) {
        check.message = fmt::format("S({}) = 0 and {} = L({})", n, n + 1, *m);
    } else if (zero) {
        check.message = fmt::format("S({}) = 0 but {} is not a Lucas number", n, n + 1);
    } else if (m) {
        check.message = fmt::format("{} = L({}) but S({}) = {}", n + 1, *m, n, point->S);
    } else {
        check.message = fmt::format("S({}) = {} and {} is not a Lucas number",
                                    n, point->S, n + 1);
    }
    return check;
}

} // namespace zeck::equilibrium
